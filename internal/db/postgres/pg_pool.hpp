#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace storygraph::db::postgres {

/*
  Bounded set of PostgreSQL connections for PgRepository.

  Every connection has the snippet and branch statements prepared, so the
  schema must exist before the first Acquire(). A PgTransaction holds one
  connection for its lifetime; dropping the shared_ptr hands it back.
  Acquire() blocks while max_connections are checked out.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::unique_ptr<pqxx::connection> Connect() const;
  std::shared_ptr<pqxx::connection> Wrap(std::unique_ptr<pqxx::connection> conn);
  void                              Release(std::unique_ptr<pqxx::connection> conn);
  void                              DropSlot();

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace storygraph::db::postgres
