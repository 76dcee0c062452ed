#pragma once

namespace storygraph::db {

/*
  One graph, branch or lifecycle operation runs inside one Transaction.

  - snippet and branch writes are invisible to other transactions until
    Commit(), and all of them land together
  - read-only operations never commit; dropping the object rolls back
  - Commit() may throw util::TransactionConflict (memory backend) when
    another operation committed first

  Memory: snapshot copy, version check on commit
  SQLite: BEGIN IMMEDIATE under the connection mutex
  Postgres: one pqxx::work on a pooled connection
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

}
