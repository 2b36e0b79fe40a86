#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace strands::db::postgres {

/*
  Bounded pool of libpqxx connections, one per PgTransaction.

  A pqxx::connection is never shared between threads: it is checked out
  for the life of one transaction and handed back by the deleter of the
  shared_ptr Acquire() returns. The settlement and accrual statements
  are prepared once per connection when it is opened.

  When all max_connections are checked out, Acquire() waits up to
  acquire_timeout and then throws, so a saturated database fails a
  request instead of stalling it.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, std::size_t max_connections,
         std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds(5000));

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Checkout(std::unique_ptr<pqxx::connection> conn);
  void                              Return(pqxx::connection* conn);

  const std::string               conninfo_;
  const std::size_t               max_connections_;
  const std::chrono::milliseconds acquire_timeout_;

  std::mutex                                     mutex_;
  std::condition_variable                        returned_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    open_ = 0;
};

} // namespace strands::db::postgres
