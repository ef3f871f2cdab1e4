#pragma once

namespace nove::db {

/*
  Unit of work over licenses, activations and contacts.

  A transaction that is destroyed without Commit() rolls back, so an
  exception thrown while admitting a machine leaves no partial rows.

  Writers are serialized per backend, which is what makes the
  count-then-insert admission in LicenseRegistry atomic:

    SQLite:   connection mutex + BEGIN IMMEDIATE
    Postgres: SELECT ... FOR UPDATE on the license row
    Memory:   one exclusive lock over a copy-on-write snapshot
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  // No-op once the transaction has finished.
  virtual void Rollback() = 0;
};

} // namespace nove::db
