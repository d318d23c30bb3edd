#pragma once

namespace jobflow::db {

/*
  A unit of work over the resources one commit group holds.

  Every backend guarantees:

  - Writes stay invisible to other transactions until Commit()
  - Rollback(), or destruction before Commit(), discards every write
  - Commit() either applies all writes of the transaction or throws

  How that maps onto storage:

    Memory  copy of the state, swapped in on commit
    JSON    one document per resource, rewritten tmp + rename on commit;
            two resources commit one after the other, not atomically
    SQLite  BEGIN IMMEDIATE / COMMIT over the single database file
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace jobflow::db
