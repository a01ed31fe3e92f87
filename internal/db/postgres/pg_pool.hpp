#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace chronicle::db::postgres {

/*
  PgPool

  Bounded set of libpqxx connections for the event store. A PgTx holds one
  connection for its whole transaction; Acquire() blocks once
  max_connections are checked out. Every connection gets the event, stream
  and position statements prepared when it is opened, and goes back to the
  idle list when the last shared_ptr to it drops.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Acquire a new ready-to-use connection
  std::shared_ptr<pqxx::connection> Acquire();

  const std::string& ConnInfo() const {
    return conninfo_;
  }

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace chronicle::db::postgres
