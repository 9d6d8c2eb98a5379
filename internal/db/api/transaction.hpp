#pragma once

namespace workstream::db {

/*
  Unit of work against the stream ledger.

  A stream row, its history events and its commits change together inside
  one transaction. Dropping the object without Commit() discards every
  write made through it.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
};

} // namespace workstream::db
