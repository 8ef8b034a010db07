#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "client/retry.h"
#include "common/errors/error.h"

namespace nodelink::tests {

using boost::asio::awaitable;

namespace {

struct RetryOutcome {
  std::optional<int> result;
  std::error_code ec;
  std::string failure;
  int calls{0};
  long attempt_refs{0};
};

// Attempts fail until call number `succeed_on`; 0 never succeeds.
awaitable<RetryOutcome> retry_until(std::uint32_t retries, std::chrono::milliseconds backoff,
                                    int succeed_on) {
  RetryOutcome outcome;
  auto calls = std::make_shared<int>(0);
  auto attempt = [calls, succeed_on](std::error_code& ec) -> awaitable<std::optional<int>> {
    ++*calls;
    if (*calls == succeed_on) {
      ec.clear();
      co_return *calls * 10;
    }
    ec = TransportErrc::kHandshakeFailed;
    co_return std::nullopt;
  };
  const std::string peer = "peer";
  const std::string address = "127.0.0.1:9";
  outcome.result = co_await client::with_retries<int>(retries, backoff, peer, address,
                                                      std::move(attempt), outcome.ec,
                                                      &outcome.failure);
  outcome.calls = *calls;
  outcome.attempt_refs = calls.use_count();
  co_return outcome;
}

RetryOutcome run(std::uint32_t retries, std::chrono::milliseconds backoff, int succeed_on) {
  boost::asio::io_context io;
  auto future = boost::asio::co_spawn(io, retry_until(retries, backoff, succeed_on),
                                      boost::asio::use_future);
  io.run();
  return future.get();
}

}  // namespace

TEST(RetryTest, ExhaustsEveryAttempt) {
  const auto outcome = run(3, std::chrono::milliseconds(1), 0);
  EXPECT_FALSE(outcome.result.has_value());
  EXPECT_EQ(outcome.ec, make_error_code(NodeErrc::kConnectFailed));
  EXPECT_EQ(outcome.calls, 3);
}

TEST(RetryTest, StopsAtFirstSuccess) {
  const auto outcome = run(5, std::chrono::milliseconds(1), 2);
  ASSERT_TRUE(outcome.result.has_value());
  EXPECT_EQ(*outcome.result, 20);
  EXPECT_FALSE(outcome.ec);
  EXPECT_EQ(outcome.calls, 2);
}

TEST(RetryTest, ZeroRetriesMakesNoAttempt) {
  const auto outcome = run(0, std::chrono::milliseconds(1), 1);
  EXPECT_FALSE(outcome.result.has_value());
  EXPECT_EQ(outcome.ec, make_error_code(NodeErrc::kConnectFailed));
  EXPECT_EQ(outcome.calls, 0);
}

TEST(RetryTest, WaitsBackoffBetweenAttemptsOnly) {
  const auto start = std::chrono::steady_clock::now();
  const auto outcome = run(3, std::chrono::milliseconds(60), 0);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(outcome.calls, 3);
  // Two pauses: none follows the last attempt.
  EXPECT_GE(elapsed, std::chrono::milliseconds(120));
  EXPECT_LT(elapsed, std::chrono::milliseconds(180) + std::chrono::seconds(1));
}

TEST(RetryTest, SingleAttemptDoesNotSleep) {
  const auto start = std::chrono::steady_clock::now();
  const auto outcome = run(1, std::chrono::seconds(5), 0);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(outcome.calls, 1);
  EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(RetryTest, AttemptCapturesAreReleasedExactlyOnce) {
  const auto outcome = run(3, std::chrono::milliseconds(1), 0);
  EXPECT_EQ(outcome.calls, 3);
  EXPECT_EQ(outcome.attempt_refs, 1);
}

TEST(RetryTest, FailureNamesPeerAndAddress) {
  std::ostringstream captured;
  auto previous = spdlog::default_logger();
  auto logger = std::make_shared<spdlog::logger>(
      "retry-test", std::make_shared<spdlog::sinks::ostream_sink_mt>(captured));
  logger->set_level(spdlog::level::err);
  spdlog::set_default_logger(logger);

  const auto outcome = run(2, std::chrono::milliseconds(1), 0);
  spdlog::set_default_logger(previous);

  EXPECT_EQ(outcome.ec, make_error_code(NodeErrc::kConnectFailed));
  EXPECT_EQ(outcome.failure, "failed to connect to peer at 127.0.0.1:9");
  EXPECT_NE(captured.str().find("failed to connect to peer at 127.0.0.1:9"), std::string::npos)
      << captured.str();
}

TEST(RetryTest, SuccessLeavesFailureEmpty) {
  const auto outcome = run(2, std::chrono::milliseconds(1), 1);
  EXPECT_TRUE(outcome.result.has_value());
  EXPECT_TRUE(outcome.failure.empty());
}

}  // namespace nodelink::tests
