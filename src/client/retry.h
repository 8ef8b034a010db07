#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <fmt/format.h>

#include "common/errors/error.h"
#include "common/logging/logger.h"

namespace nodelink::client {

inline constexpr std::chrono::milliseconds kDefaultRetryBackoff{2000};

// Text reported when every attempt to reach `peer_name` at `address` failed.
inline std::string connect_failure_message(const std::string& peer_name,
                                           const std::string& address) {
  return fmt::format("failed to connect to {} at {}", peer_name, address);
}

// Runs `attempt(ec)` up to `retries` times, waiting `backoff` between failed
// attempts. Returns the first successful result, or nullopt with
// NodeErrc::kConnectFailed once every attempt has failed. The error code is
// category-only; the peer and address of the failure are logged at error
// level as connect_failure_message() and, when `failure` is set, stored there.
template <typename T, typename Attempt>
boost::asio::awaitable<std::optional<T>> with_retries(std::uint32_t retries,
                                                      std::chrono::milliseconds backoff,
                                                      const std::string& peer_name,
                                                      const std::string& address, Attempt attempt,
                                                      std::error_code& ec,
                                                      std::string* failure = nullptr) {
  for (std::uint32_t try_num = 1; try_num <= retries; ++try_num) {
    std::error_code attempt_ec;
    std::optional<T> result = co_await attempt(attempt_ec);
    if (result && !attempt_ec) {
      ec.clear();
      co_return result;
    }
    LOG_ERROR("Error connecting to {} at {}, try {}. Error: {}", peer_name, address, try_num,
              attempt_ec.message());
    if (try_num == retries) {
      break;
    }

    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, backoff);
    boost::system::error_code timer_ec;
    co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, timer_ec));
  }
  auto message = connect_failure_message(peer_name, address);
  LOG_ERROR("Error: {}", message);
  if (failure != nullptr) {
    *failure = std::move(message);
  }
  ec = NodeErrc::kConnectFailed;
  co_return std::nullopt;
}

}  // namespace nodelink::client
