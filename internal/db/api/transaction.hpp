#pragma once

namespace atomicswap::db {

/*
  Unit of work over the swap store.

  Writes made through a transaction are visible to reads on the same
  transaction and to nobody else until Commit(). Dropping an uncommitted
  transaction rolls it back.

  Transactions are short: the coordinator opens one per load and one per
  compare-and-set write, and never holds one across a settlement backend
  call.

    sqlite    BEGIN IMMEDIATE, serialized by the writer lock
    postgres  pqxx::work on a pooled connection
    memory    private snapshot, base versions re-checked at Commit()
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace atomicswap::db
