#pragma once

#include <stdexcept>
#include <string>

namespace booking::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws CommitConflict when a concurrent transaction won;
    the caller may rerun the whole unit of work

  SQLite: BEGIN IMMEDIATE, one writer per process
  Postgres: pqxx::work
  Memory: snapshot copy-on-write with commit-time version check
*/

class CommitConflict : public std::runtime_error {
 public:
  explicit CommitConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
