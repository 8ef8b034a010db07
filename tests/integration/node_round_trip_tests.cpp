#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>
#include <nlohmann/json.hpp>

#include "client/node_client.h"
#include "common/errors/error.h"
#include "common/protocol/request.h"
#include "common/utils/io_thread_pool.h"
#include "node/ack_dispatcher.h"
#include "server/node_server.h"
#include "support/loopback.h"
#include "support/test_pki.h"
#include "transport/framing/message_io.h"

namespace nodelink::tests {

using boost::asio::awaitable;
using boost::asio::ip::tcp;

namespace {

struct Exchange {
  std::vector<protocol::Reply> replies;
  std::error_code ec;
};

awaitable<std::error_code> run_server(std::shared_ptr<server::NodeServer> server) {
  std::error_code ec;
  co_await server->run(ec);
  co_return ec;
}

// Connects to `peer_name`, sends one Hello per id on a single session stream
// in chunks of `chunk_size` bytes, and collects the replies.
awaitable<Exchange> greet(client::NodeClient client, tcp::endpoint address,
                          std::string peer_name, std::vector<std::uint64_t> message_ids,
                          std::size_t chunk_size) {
  Exchange out;
  auto session = co_await client.connect(address, peer_name, 3, out.ec);
  if (!session) {
    co_return out;
  }

  for (const auto id : message_ids) {
    const auto payload = protocol::encode_request(
        {"Hello", nlohmann::json{{"name", "client-b"}, {"padding", std::string(200, 'x')}}});
    co_await framing::write_message(session->send, id, payload, chunk_size, out.ec);
    if (out.ec) {
      co_return out;
    }
  }

  for (std::size_t i = 0; i < message_ids.size(); ++i) {
    auto raw = co_await framing::read_length_prefixed(session->recv, out.ec);
    if (!raw) {
      co_return out;
    }
    auto reply = protocol::decode_reply(*raw, out.ec);
    if (!reply) {
      co_return out;
    }
    out.replies.push_back(std::move(*reply));
  }
  co_await session->send.finish(out.ec);
  co_return out;
}

}  // namespace

class NodeRoundTripTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto server_credentials = pki_.issue("server-a");
    std::error_code ec;
    auto endpoint = server::new_server(
        executor_, {boost::asio::ip::make_address("127.0.0.1"), 0}, server_credentials.cert_pem,
        server_credentials.key_pem, server_credentials.ca_cert_pem, ec);
    ASSERT_NE(endpoint, nullptr) << ec.message();
    address_ = endpoint->local_endpoint();

    dispatcher_ = std::make_shared<node::AckDispatcher>("server-a");
    server_ = std::make_shared<server::NodeServer>(endpoint, dispatcher_);
    server_done_ = boost::asio::co_spawn(executor_, run_server(server_), boost::asio::use_future);

    const auto client_credentials = pki_.issue("client-b");
    client_ = client::new_client(executor_, client_credentials.ca_cert_pem,
                                 client_credentials.cert_pem, client_credentials.key_pem, ec,
                                 client::ClientOptions{std::chrono::milliseconds(50)});
    ASSERT_TRUE(client_.has_value()) << ec.message();
  }

  void TearDown() override {
    if (client_) {
      client_->endpoint()->close();
    }
    if (server_) {
      server_->endpoint()->close();
      server_done_.wait_for(std::chrono::seconds(5));
    }
  }

  utils::IoThreadPool pool_{4};
  boost::asio::any_io_executor executor_{pool_.executor()};
  TestPki pki_;
  tcp::endpoint address_;
  std::shared_ptr<node::AckDispatcher> dispatcher_;
  std::shared_ptr<server::NodeServer> server_;
  std::future<std::error_code> server_done_;
  std::optional<client::NodeClient> client_;
};

TEST_F(NodeRoundTripTest, HelloIsAcknowledgedWithItsMessageId) {
  auto exchange = run_sync(executor_, greet(*client_, address_, "server-a", {1}, 64));

  ASSERT_FALSE(exchange.ec) << exchange.ec.message();
  ASSERT_EQ(exchange.replies.size(), 1U);
  EXPECT_EQ(exchange.replies[0].message_id, 1U);
  EXPECT_EQ(exchange.replies[0].body.kind, "Ack");
  EXPECT_TRUE(exchange.replies[0].body.is_unit());
  EXPECT_EQ(dispatcher_->handled(), 1U);
}

TEST_F(NodeRoundTripTest, RequestsOnOneStreamAreAnsweredInOrder) {
  auto exchange =
      run_sync(executor_, greet(*client_, address_, "server-a", {7, 8, 9}, 16 * 1024));

  ASSERT_FALSE(exchange.ec) << exchange.ec.message();
  ASSERT_EQ(exchange.replies.size(), 3U);
  EXPECT_EQ(exchange.replies[0].message_id, 7U);
  EXPECT_EQ(exchange.replies[1].message_id, 8U);
  EXPECT_EQ(exchange.replies[2].message_id, 9U);
}

TEST_F(NodeRoundTripTest, ConcurrentSessionsAreServedIndependently) {
  std::vector<std::future<Exchange>> sessions;
  for (std::uint64_t i = 0; i < 4; ++i) {
    sessions.push_back(boost::asio::co_spawn(
        executor_, greet(*client_, address_, "server-a", {100 + i}, 32), boost::asio::use_future));
  }
  for (std::uint64_t i = 0; i < 4; ++i) {
    auto exchange = sessions[i].get();
    ASSERT_FALSE(exchange.ec) << exchange.ec.message();
    ASSERT_EQ(exchange.replies.size(), 1U);
    EXPECT_EQ(exchange.replies[0].message_id, 100 + i);
  }
  EXPECT_EQ(dispatcher_->handled(), 4U);
}

TEST_F(NodeRoundTripTest, WrongPeerNameExhaustsRetries) {
  auto exchange = run_sync(executor_, greet(*client_, address_, "server-z", {1}, 64));
  EXPECT_EQ(exchange.ec, make_error_code(NodeErrc::kConnectFailed));
  EXPECT_TRUE(exchange.replies.empty());
  EXPECT_EQ(dispatcher_->handled(), 0U);
}

TEST_F(NodeRoundTripTest, ClosingTheEndpointStopsTheServer) {
  server_->endpoint()->close();
  ASSERT_EQ(server_done_.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(server_done_.get(), make_error_code(NodeErrc::kServerExited));
  server_.reset();
}

}  // namespace nodelink::tests
