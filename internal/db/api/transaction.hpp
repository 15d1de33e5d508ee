#pragma once

#include <stdexcept>
#include <string>

namespace roombook::db {

/*
  Thrown by Commit() when a booking this transaction read or wrote was
  changed by a transaction that committed first. Nothing is applied.
*/
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws TransactionConflict on a lost version race, and
    std::runtime_error on any other failure to apply the write set

  SQLite: BEGIN IMMEDIATE
  Memory: overlay write set, validated per booking version on commit
*/

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

} // namespace roombook::db
