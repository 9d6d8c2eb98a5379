#include "retirement_service.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/retirement/archive_report.hpp"
#include "internal/util/time.hpp"

namespace workstream::retirement {

namespace fs = std::filesystem;

using db::model::StreamRecord;

namespace {

constexpr int kMergeLookupDepth = 20;

std::string Trimmed(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) text.pop_back();
  return text;
}

} // namespace

RetirementOptions RetirementOptions::FromConfig(const workstream::runtime::config::RuntimeConfig& config) {
  RetirementOptions options;
  options.project_root  = config.project().root();
  options.worktree_root = config.project().worktree_root();
  options.history_dir   = config.retirement().history_dir();
  options.plan_dir      = config.retirement().plan_dir();
  options.remote        = config.retirement().remote();
  options.base_branch   = config.project().base_branch();
  return options;
}

workstream::v1::RetirementReport RetirementResult::ToProto() const {
  workstream::v1::RetirementReport report;
  report.set_success(success);
  report.set_stream_id(stream_id);
  report.set_worktree_deleted(worktree_deleted);
  report.set_archive_written(archive_written);
  report.set_plan_files_cleaned_up(plan_files_cleaned_up);
  report.set_summary_job_queued(summary_job_queued);
  report.set_archive_path(archive_path);
  for (const auto& error : errors) report.add_errors(error);
  return report;
}

RetirementService::RetirementService(std::shared_ptr<util::CommandRunner> runner,
                                     RetirementOptions                    options,
                                     std::shared_ptr<jobs::SummaryJobQueue> queue)
    : runner_(std::move(runner)), options_(std::move(options)), queue_(std::move(queue)), git_(runner_, options_.project_root) {
}

RetirementResult RetirementService::Retire(const StreamRecord& stream, const std::string& summary, const RetireFlags& flags) {
  RetirementResult result;
  result.stream_id = stream.id;

  WORKSTREAM_LOG_INFO("retiring stream", {observability::StringField("stream_id", stream.id)});

  // archive report
  if (flags.write_archive) {
    std::string written;
    try {
      result.archive_path    = WriteArchive(stream, summary, written);
      result.archive_written = true;
    } catch (const std::exception& e) {
      result.archive_path = written;
      result.errors.push_back(std::string("Archive write failed: ") + e.what());
      WORKSTREAM_LOG_ERROR("archive write failed", {observability::StringField("stream_id", stream.id), observability::StringField("error", e.what())});
    }
  }

  // summary job
  if (flags.queue_summary && queue_ && result.archive_written) {
    try {
      QueueSummary(stream, summary, result.archive_path);
      result.summary_job_queued = true;
    } catch (const std::exception& e) {
      result.errors.push_back(std::string("Failed to queue summary job: ") + e.what());
      WORKSTREAM_LOG_ERROR("summary job enqueue failed", {observability::StringField("stream_id", stream.id), observability::StringField("error", e.what())});
    }
  }

  // worktree
  const auto      worktree_path = (fs::path(options_.worktree_root) / stream.id).string();
  std::error_code ec;
  if (!fs::exists(worktree_path, ec)) {
    result.worktree_deleted = true;
    WORKSTREAM_LOG_INFO("worktree already removed", {observability::StringField("path", worktree_path)});
  } else if (flags.delete_worktree) {
    try {
      RemoveWorktree(stream, worktree_path);
      result.worktree_deleted = true;
    } catch (const std::exception& e) {
      result.errors.push_back(std::string("Worktree deletion failed: ") + e.what());
      WORKSTREAM_LOG_ERROR("worktree deletion failed", {observability::StringField("stream_id", stream.id), observability::StringField("error", e.what())});
    }
  }

  // planning files
  if (flags.cleanup_plan_files) {
    try {
      CleanupPlanFiles(stream);
      result.plan_files_cleaned_up = true;
    } catch (const std::exception& e) {
      result.errors.push_back(std::string("Plan files cleanup failed: ") + e.what());
      WORKSTREAM_LOG_ERROR("plan files cleanup failed", {observability::StringField("stream_id", stream.id), observability::StringField("error", e.what())});
    }
  }

  result.success = result.errors.empty();
  WORKSTREAM_LOG_INFO("stream retired", {observability::StringField("stream_id", stream.id),
                                         observability::BoolField("success", result.success),
                                         observability::IntField("errors", static_cast<int64_t>(result.errors.size()))});
  return result;
}

std::string RetirementService::WriteArchive(const StreamRecord& stream, const std::string& summary, std::string& written_path) {
  const auto now         = util::Now();
  const auto history_dir = fs::path(options_.project_root) / options_.history_dir;
  const auto path        = history_dir / ArchiveFileName(stream.id, now);

  fs::create_directories(history_dir);

  const auto merge_commit = FindMergeCommit(git_.RecentLog(kMergeLookupDepth), stream.id);
  {
    std::ofstream out(path, std::ios::trunc);
    if (!out) throw std::runtime_error("cannot open " + path.string());
    out << RenderArchiveReport(stream, summary, merge_commit, now);
    out.flush();
    if (!out) throw std::runtime_error("cannot write " + path.string());
  }
  written_path = path.string();
  WORKSTREAM_LOG_INFO("archive written", {observability::StringField("path", written_path)});

  GitOrThrow({"add", path.string()});
  GitOrThrow({"commit", "-m", "docs: Archive retired stream " + stream.id, "--no-verify"});
  GitOrThrow({"push", options_.remote, options_.base_branch});
  return written_path;
}

void RetirementService::QueueSummary(const StreamRecord& stream, const std::string& summary, const std::string& archive_path) {
  db::model::SummaryJobRecord job;
  job.stream_id           = stream.id;
  job.stream_title        = stream.title;
  job.stream_branch       = stream.branch;
  job.stream_category     = std::string(workstream::model::ToString(stream.category));
  job.worktree_path       = stream.worktree_path;
  job.stream_created_at   = stream.created_at;
  job.stream_completed_at = stream.completed_at.value_or("");
  job.user_summary        = summary;
  job.archive_path        = archive_path;

  const auto id = queue_->Enqueue(std::move(job));
  WORKSTREAM_LOG_INFO("queued summary job", {observability::IntField("job_id", id), observability::StringField("stream_id", stream.id)});
}

void RetirementService::RemoveWorktree(const StreamRecord& stream, const std::string& worktree_path) {
  auto removed = runner_->Run({"git", "worktree", "remove", worktree_path, "--force"}, options_.project_root);
  if (!removed.Ok()) {
    WORKSTREAM_LOG_WARN("git worktree remove failed, removing directory", {observability::StringField("path", worktree_path),
                                                                          observability::StringField("stderr", Trimmed(removed.err))});
    std::error_code ec;
    fs::remove_all(worktree_path, ec);
    if (ec) throw std::runtime_error("cannot remove " + worktree_path + ": " + ec.message());
    GitOrThrow({"worktree", "prune"});
  }

  if (!stream.branch.empty()) {
    auto branch = runner_->Run({"git", "branch", "-d", stream.branch}, options_.project_root);
    if (branch.Ok()) {
      WORKSTREAM_LOG_INFO("local branch deleted", {observability::StringField("branch", stream.branch)});
    } else {
      WORKSTREAM_LOG_INFO("local branch kept", {observability::StringField("branch", stream.branch),
                                               observability::StringField("stderr", Trimmed(branch.err))});
    }
  }
}

void RetirementService::CleanupPlanFiles(const StreamRecord& stream) {
  const auto plan_root = fs::path(options_.project_root) / options_.plan_dir;
  const auto plan_dir  = plan_root / stream.id;
  const auto plan_file = plan_root / (stream.id + ".md");

  bool            cleaned = false;
  std::error_code ec;
  if (fs::exists(plan_dir, ec)) {
    GitOrThrow({"rm", "-rf", plan_dir.string()});
    cleaned = true;
  }
  if (fs::exists(plan_file, ec)) {
    GitOrThrow({"rm", plan_file.string()});
    cleaned = true;
  }

  if (!cleaned) {
    WORKSTREAM_LOG_DEBUG("no planning files to clean up", {observability::StringField("stream_id", stream.id)});
    return;
  }

  GitOrThrow({"commit", "-m", "chore: Clean up " + stream.id + " planning files", "--no-verify"});
  GitOrThrow({"push", options_.remote, options_.base_branch});
}

void RetirementService::GitOrThrow(const std::vector<std::string>& args) {
  std::vector<std::string> argv{"git"};
  argv.insert(argv.end(), args.begin(), args.end());

  auto result = runner_->Run(argv, options_.project_root);
  if (!result.Ok()) {
    auto detail = Trimmed(result.err.empty() ? result.out : result.err);
    throw std::runtime_error(util::JoinCommand(argv) + " failed (exit " + std::to_string(result.exit_code) + ")" +
                             (detail.empty() ? "" : ": " + detail));
  }
}

} // namespace workstream::retirement
