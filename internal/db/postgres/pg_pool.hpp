#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace nove::db::postgres {

/*
  Bounded pool of libpqxx connections for PgRepository.

  A PgTransaction holds one connection for its lifetime; pqxx
  connections are never shared between threads. Every connection gets
  the license/activation/contact statements prepared when it is opened.
  Acquire() blocks while max_connections are checked out; a connection
  found closed on release is dropped and its slot freed.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Creates the tables on a dedicated connection. Must run before the
  // first Acquire(), which prepares statements against those tables.
  static void InstallSchema(const std::string& conninfo);

  // Throws std::runtime_error when a new connection cannot be opened.
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);
  void                              Forget();

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace nove::db::postgres
