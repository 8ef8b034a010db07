#pragma once

#include <exception>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>

#include "common/logging/logger.h"

namespace nodelink::utils {

// Runs `task` as an independent coroutine on `executor`. An exception escaping
// the task is logged under `name` and goes no further: siblings keep running.
template <typename Executor>
void spawn_task(const Executor& executor, boost::asio::awaitable<void> task, std::string name) {
  boost::asio::co_spawn(executor, std::move(task),
                        [name = std::move(name)](std::exception_ptr error) {
                          if (!error) {
                            return;
                          }
                          try {
                            std::rethrow_exception(error);
                          } catch (const std::exception& e) {
                            LOG_ERROR("Task {} failed: {}", name, e.what());
                          }
                        });
}

}  // namespace nodelink::utils
