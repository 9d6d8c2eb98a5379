#include "stream_routes.hpp"

#include <google/protobuf/util/json_util.h>

#include <boost/algorithm/string.hpp>

#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <vector>

#include "internal/http/http_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace workstream::http {

using namespace workstream::v1;

namespace {

// Matched path, wrong verb.
class MethodNotAllowed : public std::runtime_error {
 public:
  explicit MethodNotAllowed(const std::string& msg) : std::runtime_error(msg) {
  }
};

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("response serialization failed: " + std::string(status.message()));
  }
  return json;
}

template <typename T>
T FromJson(const std::string& body) {
  T message;
  if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
    return message;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(body, &message, options);
  if (!status.ok()) {
    throw util::InvalidArgument("body", "Malformed JSON body: " + std::string(status.message()));
  }
  return message;
}

RouteResponse Json(const google::protobuf::Message& message, unsigned status = 200) {
  return RouteResponse{status, ToJson(message)};
}

std::vector<std::string> Segments(const std::string& path) {
  std::vector<std::string> parts;
  boost::split(parts, path, boost::is_any_of("/"));

  std::vector<std::string> segments;
  for (auto& part : parts) {
    if (!part.empty()) segments.push_back(UrlDecode(part));
  }
  return segments;
}

void RequireMethod(const std::string& method, const char* expected, const std::string& path) {
  if (method != expected) throw MethodNotAllowed("Method " + method + " not allowed on " + path);
}

int ParseLimit(const std::string& text) {
  char*      end   = nullptr;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (text.empty() || end == nullptr || *end != '\0' || value <= 0 || value > 10000) {
    throw util::InvalidArgument("limit", "limit must be a positive integer");
  }
  return static_cast<int>(value);
}

std::string QueryValue(const std::map<std::string, std::string>& query, const std::string& key) {
  auto it = query.find(key);
  return it == query.end() ? std::string() : it->second;
}

} // namespace

std::string UrlDecode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < text.size() && std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
               std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
      out.push_back(static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::map<std::string, std::string> ParseQuery(const std::string& target) {
  std::map<std::string, std::string> query;

  auto pos = target.find('?');
  if (pos == std::string::npos) return query;

  const auto               raw = target.substr(pos + 1);
  std::vector<std::string> parts;
  boost::split(parts, raw, boost::is_any_of("&"));
  for (const auto& part : parts) {
    if (part.empty()) continue;
    auto eq = part.find('=');
    if (eq == std::string::npos) {
      query[UrlDecode(part)] = "";
    } else {
      query[UrlDecode(part.substr(0, eq))] = UrlDecode(part.substr(eq + 1));
    }
  }
  return query;
}

StreamRoutes::StreamRoutes(std::shared_ptr<service::StreamService> streams, std::shared_ptr<service::AdminService> admin)
    : streams_(std::move(streams)), admin_(std::move(admin)) {
}

RouteResponse StreamRoutes::Handle(const std::string& method, const std::string& target, const std::string& body) {
  const auto path = target.substr(0, target.find('?'));
  try {
    return Dispatch(method, path, target, body);
  } catch (const MethodNotAllowed& e) {
    ErrorResponse err;
    err.set_error(e.what());
    return Json(err, 405);
  } catch (const std::exception& e) {
    const auto status = ToHttpStatus(e);
    if (status >= 500) {
      WORKSTREAM_LOG_ERROR("request failed", {observability::StringField("method", method), observability::StringField("path", path),
                                              observability::StringField("error", e.what())});
    }
    return Json(ToErrorBody(e), status);
  }
}

RouteResponse StreamRoutes::Dispatch(const std::string& method, const std::string& path, const std::string& target, const std::string& body) {
  if (path == health_path_) {
    RequireMethod(method, "GET", path);
    return Json(admin_->Health());
  }

  const auto segments = Segments(path);
  if (segments.size() < 2 || segments[0] != "api") {
    throw util::NotFound("Not found: " + path);
  }

  const auto& area  = segments[1];
  const auto  query = ParseQuery(target);

  // /api/version, /api/stats
  if (segments.size() == 2 && area == "version") {
    RequireMethod(method, "GET", path);
    return Json(admin_->Version());
  }
  if (segments.size() == 2 && area == "stats") {
    RequireMethod(method, "GET", path);
    return Json(admin_->Stats());
  }

  // /api/streams...
  if (area == "streams") {
    if (segments.size() == 2) {
      if (method == "GET") {
        ListStreamsRequest req;
        req.set_status(QueryValue(query, "status"));
        req.set_category(QueryValue(query, "category"));
        req.set_priority(QueryValue(query, "priority"));
        return Json(streams_->ListStreams(req));
      }
      RequireMethod(method, "POST", path);
      return Json(streams_->AddStream(FromJson<AddStreamRequest>(body)), 201);
    }

    if (segments.size() == 3 && segments[2] == "archive-bulk" && method == "POST") {
      return Json(streams_->ArchiveBulk(FromJson<ArchiveBulkRequest>(body)));
    }

    const auto& id = segments[2];
    if (segments.size() == 3) {
      if (method == "GET") return Json(streams_->GetStream(id));
      RequireMethod(method, "PATCH", path);
      return Json(streams_->UpdateStream(id, FromJson<UpdateStreamRequest>(body)));
    }
    if (segments.size() == 4 && segments[3] == "archive") {
      RequireMethod(method, "POST", path);
      return Json(streams_->ArchiveStream(id, FromJson<ArchiveStreamRequest>(body)));
    }
    if (segments.size() == 4 && segments[3] == "history") {
      RequireMethod(method, "GET", path);
      return Json(streams_->History(id));
    }
  }

  // /api/commits...
  if (area == "commits") {
    if (segments.size() == 2) {
      if (method == "GET") {
        ListCommitsRequest req;
        req.set_stream_id(QueryValue(query, "streamId"));
        const auto limit = QueryValue(query, "limit");
        if (!limit.empty()) req.set_limit(ParseLimit(limit));
        return Json(streams_->ListCommits(req));
      }
      RequireMethod(method, "POST", path);
      return Json(streams_->AddCommit(FromJson<AddCommitRequest>(body)));
    }
    if (segments.size() == 3 && segments[2] == "scan") {
      RequireMethod(method, "POST", path);
      return Json(admin_->ScanCommits(FromJson<ScanRequest>(body)));
    }
  }

  // /api/reconciliation/...
  if (area == "reconciliation" && segments.size() == 3) {
    const auto& action = segments[2];
    if (action == "status") {
      RequireMethod(method, "GET", path);
      ReconcileRequest req;
      req.set_dry_run(true);
      return Json(admin_->Reconcile(req));
    }
    if (action == "run") {
      RequireMethod(method, "POST", path);
      return Json(admin_->Reconcile(FromJson<ReconcileRequest>(body)));
    }
    if (action == "worktrees") {
      RequireMethod(method, "GET", path);
      return Json(admin_->ListWorktrees());
    }
    if (action == "merged") {
      RequireMethod(method, "GET", path);
      return Json(admin_->ListMergedBranches());
    }
  }

  throw util::NotFound("Not found: " + path);
}

} // namespace workstream::http
