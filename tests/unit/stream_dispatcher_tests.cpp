#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/errors/error.h"
#include "common/protocol/request.h"
#include "common/utils/io_thread_pool.h"
#include "common/utils/spawn.h"
#include "server/accept_loop.h"
#include "server/stream_dispatcher.h"
#include "support/loopback.h"
#include "transport/framing/message_io.h"

namespace nodelink::tests {

using boost::asio::awaitable;
using ConnectionPtr = std::shared_ptr<mux::Connection>;

namespace {

// Records every request and answers with an "Ack" reply.
class RecordingDispatcher final : public server::MessageDispatcher {
 public:
  awaitable<void> handle(mux::SendStream& send, std::uint64_t message_id,
                         protocol::Request request) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      seen_.push_back({message_id, std::move(request)});
    }
    const auto reply = protocol::encode_reply(protocol::Reply{message_id, {"Ack", nullptr}});
    std::error_code ec;
    co_await framing::write_length_prefixed(send, reply, ec);
  }

  std::vector<protocol::Reply> seen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<protocol::Reply> seen_;
};

struct Outcome {
  std::vector<std::uint64_t> acked;
  std::error_code end;
};

awaitable<Outcome> exchange(ConnectionPtr client, ConnectionPtr server,
                            std::shared_ptr<server::MessageDispatcher> dispatcher) {
  Outcome outcome;
  std::error_code ec;
  auto stream = co_await client->open_bi(ec);
  if (!stream) {
    outcome.end = ec;
    co_return outcome;
  }

  // Invalid MessagePack, a bare integer, a two-entry map, then two valid
  // requests.
  const std::vector<std::uint8_t> garbage{0xC1};
  const auto integer = nlohmann::json::to_msgpack(nlohmann::json(5));
  const auto two_keys = nlohmann::json::to_msgpack(nlohmann::json{{"A", 1}, {"B", 2}});
  const auto hello = protocol::encode_request({"Hello", nlohmann::json{{"name", "alpha"}}});
  const auto ping = protocol::encode_request({"Ping", nullptr});

  co_await framing::write_message(stream->send, 1, garbage, 16, ec);
  co_await framing::write_message(stream->send, 2, integer, 16, ec);
  co_await framing::write_message(stream->send, 3, two_keys, 16, ec);
  co_await framing::write_message(stream->send, 4, hello, 16, ec);
  co_await framing::write_message(stream->send, 5, ping, 16, ec);
  co_await stream->send.finish(ec);

  auto accepted = co_await server->accept_bi(ec);
  if (!accepted) {
    outcome.end = ec;
    co_return outcome;
  }
  utils::spawn_task(server->get_executor(),
                    server::serve_stream(std::move(dispatcher), std::move(*accepted)),
                    "serve_stream");

  while (true) {
    auto data = co_await framing::read_length_prefixed(stream->recv, ec);
    if (!data) {
      outcome.end = ec;
      co_return outcome;
    }
    auto reply = protocol::decode_reply(*data, ec);
    if (!reply) {
      outcome.end = ec;
      co_return outcome;
    }
    EXPECT_EQ(reply->body.kind, "Ack");
    outcome.acked.push_back(reply->message_id);
    if (outcome.acked.size() == 2) {
      co_return outcome;
    }
  }
}

// One request/reply session: sends Ping as `message_id`, finishes, reads the
// Ack and then waits for the server to finish its half.
awaitable<std::error_code> ping_session(ConnectionPtr client, std::uint64_t message_id) {
  std::error_code ec;
  auto stream = co_await client->open_bi(ec);
  if (!stream) {
    co_return ec;
  }
  const auto ping = protocol::encode_request({"Ping", nullptr});
  co_await framing::write_message(stream->send, message_id, ping, 64, ec);
  if (!ec) {
    co_await stream->send.finish(ec);
  }
  if (ec) {
    co_return ec;
  }

  auto data = co_await framing::read_length_prefixed(stream->recv, ec);
  if (!data) {
    co_return ec;
  }
  auto reply = protocol::decode_reply(*data, ec);
  if (!reply) {
    co_return ec;
  }
  EXPECT_EQ(reply->message_id, message_id);

  auto extra = co_await framing::read_length_prefixed(stream->recv, ec);
  EXPECT_FALSE(extra.has_value());
  co_return ec;
}

}  // namespace

class StreamDispatcherTest : public ::testing::Test {
 protected:
  void TearDown() override {
    if (pair_.client) {
      pair_.client->close(0, "test done");
    }
    if (pair_.server) {
      pair_.server->close(0, "test done");
    }
  }

  utils::IoThreadPool pool_{2};
  boost::asio::any_io_executor executor_{pool_.executor()};
  ConnectionPair pair_;
};

TEST_F(StreamDispatcherTest, SkipsUndecodableMessages) {
  pair_ = make_connection_pair(executor_);
  auto dispatcher = std::make_shared<RecordingDispatcher>();
  auto outcome = run_sync(executor_, exchange(pair_.client, pair_.server, dispatcher));

  EXPECT_FALSE(outcome.end) << outcome.end.message();
  EXPECT_EQ(outcome.acked, (std::vector<std::uint64_t>{4, 5}));

  const auto seen = dispatcher->seen();
  ASSERT_EQ(seen.size(), 2U);
  EXPECT_EQ(seen[0].message_id, 4U);
  EXPECT_EQ(seen[0].body.kind, "Hello");
  EXPECT_EQ(seen[0].body.body["name"], "alpha");
  EXPECT_EQ(seen[1].message_id, 5U);
  EXPECT_EQ(seen[1].body.kind, "Ping");
  EXPECT_TRUE(seen[1].body.is_unit());
}

TEST_F(StreamDispatcherTest, EndsAtStreamFinish) {
  pair_ = make_connection_pair(executor_);
  auto dispatcher = std::make_shared<RecordingDispatcher>();
  auto served = run_sync(executor_, [](ConnectionPtr client, ConnectionPtr server,
                                       std::shared_ptr<server::MessageDispatcher> dispatcher)
                                        -> awaitable<bool> {
    std::error_code ec;
    auto stream = co_await client->open_bi(ec);
    auto accepted = co_await server->accept_bi(ec);
    if (!stream || !accepted) {
      co_return false;
    }
    co_await stream->send.finish(ec);
    // Returns once the empty stream is finished.
    co_await server::serve_stream(std::move(dispatcher), std::move(*accepted));
    co_return true;
  }(pair_.client, pair_.server, dispatcher));

  EXPECT_TRUE(served);
  EXPECT_TRUE(dispatcher->seen().empty());
}

TEST_F(StreamDispatcherTest, SessionsBeyondStreamCapacityAreServed) {
  mux::TransportConfig server_config;
  server_config.max_concurrent_bidi_streams = 1;
  pair_ = make_connection_pair(executor_, {}, server_config);

  auto dispatcher = std::make_shared<RecordingDispatcher>();
  auto handler = [dispatcher](mux::BiStream stream) {
    return server::serve_stream(dispatcher, std::move(stream));
  };
  utils::spawn_task(pair_.server->get_executor(),
                    server::accept_streams(pair_.server, std::move(handler)), "accept_streams");

  for (std::uint64_t session = 1; session <= 3; ++session) {
    const auto end = run_sync(executor_, ping_session(pair_.client, session));
    EXPECT_EQ(end, make_error_code(TransportErrc::kStreamFinished)) << "session " << session;
  }

  const auto seen = dispatcher->seen();
  ASSERT_EQ(seen.size(), 3U);
  EXPECT_EQ(seen[2].message_id, 3U);
}

}  // namespace nodelink::tests
