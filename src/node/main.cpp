#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/signal_set.hpp>
#include <fmt/format.h>

#include "client/node_client.h"
#include "common/errors/error.h"
#include "common/logging/logger.h"
#include "common/protocol/request.h"
#include "common/utils/io_thread_pool.h"
#include "common/utils/spawn.h"
#include "node/ack_dispatcher.h"
#include "node/node_config.h"
#include "server/node_server.h"
#include "transport/endpoint/address.h"
#include "transport/framing/message_io.h"
#include "transport/link/tls_link.h"

using namespace nodelink;

namespace {
constexpr std::uint64_t kHelloMessageId = 1;

bool read_file(const std::string& path, std::string& out, std::error_code& ec) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    ec = std::error_code(errno, std::generic_category());
    return false;
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  out = contents.str();
  return true;
}

// Dials one peer, sends a Hello request and logs the reply.
boost::asio::awaitable<void> greet_peer(client::NodeClient client, node::PeerConfig peer,
                                        node::NodeConfig config) {
  std::error_code ec;
  auto address = transport::parse_address(peer.address, ec);
  if (!address) {
    LOG_ERROR("Invalid address for peer {}: {}", peer.name, peer.address);
    co_return;
  }

  auto session = co_await client.connect(*address, peer.name, config.connect_retries, ec);
  if (!session) {
    co_return;
  }

  protocol::Request hello{"Hello", {{"name", config.name}}};
  const auto payload = protocol::encode_request(hello);
  co_await framing::write_message(session->send, kHelloMessageId, payload, config.max_chunk_size,
                                  ec);
  if (ec) {
    LOG_ERROR("Failed to send Hello to {}: {}", peer.name, ec.message());
    co_return;
  }

  auto raw = co_await framing::read_length_prefixed(session->recv, ec, config.max_message_size);
  if (!raw) {
    LOG_ERROR("No reply from {}: {}", peer.name, ec.message());
    co_return;
  }
  auto reply = protocol::decode_reply(*raw, ec);
  if (!reply) {
    LOG_ERROR("Malformed reply from {}: {}", peer.name, ec.message());
    co_return;
  }
  LOG_INFO("Peer {} answered message {} with {}", peer.name, reply->message_id, reply->body.kind);

  co_await session->send.finish(ec);
}
}  // namespace

int main(int argc, char* argv[]) {
  node::NodeConfig config;
  std::error_code ec;

  if (!node::parse_args(argc, argv, config, ec)) {
    if (!ec) {
      return 0;
    }
    std::cerr << "Failed to parse arguments: " << ec.message() << '\n';
    return 1;
  }

  logging::configure_logging(config.verbose ? logging::LogLevel::debug : logging::LogLevel::info,
                             true, config.log_file);

  std::string error;
  if (!node::validate_config(config, error)) {
    LOG_ERROR("Configuration error: {}", error);
    return 1;
  }

  std::string ca_cert_pem;
  std::string cert_pem;
  std::string key_pem;
  for (const auto& [path, out] : {std::pair{config.ca_cert_file, &ca_cert_pem},
                                  std::pair{config.cert_file, &cert_pem},
                                  std::pair{config.key_file, &key_pem}}) {
    if (!read_file(path, *out, ec)) {
      LOG_ERROR("Failed to read {}: {}", path, ec.message());
      return 1;
    }
  }

  auto listen = transport::parse_address(config.listen_address, ec);
  if (!listen) {
    LOG_ERROR("Invalid listen address {}: {}", config.listen_address, ec.message());
    return 1;
  }

  utils::IoThreadPool pool(config.worker_threads);

  mux::TransportConfig transport_config;
  transport_config.max_concurrent_bidi_streams = config.max_concurrent_streams;

  auto endpoint = server::new_server(pool.executor(), *listen, cert_pem, key_pem, ca_cert_pem, ec,
                                     transport_config);
  if (!endpoint) {
    LOG_ERROR("Failed to start node server: {}", ec.message());
    return 1;
  }

  std::optional<client::NodeClient> node_client;
  if (!config.peers.empty()) {
    client::ClientOptions client_options;
    client_options.retry_backoff = std::chrono::milliseconds(config.retry_backoff_ms);
    node_client = client::new_client(pool.executor(), ca_cert_pem, cert_pem, key_pem, ec,
                                     client_options, transport_config);
    if (!node_client) {
      LOG_ERROR("Failed to create node client: {}", ec.message());
      endpoint->close();
      return 1;
    }
  }

  std::atomic<bool> shutdown_requested{false};
  boost::asio::signal_set signals(pool.context(), SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code& signal_ec, int signal_number) {
    if (signal_ec) {
      return;
    }
    LOG_INFO("Received {}, shutting down...", signal_number == SIGINT ? "SIGINT" : "SIGTERM");
    shutdown_requested.store(true);
    endpoint->close();
    if (node_client) {
      node_client->endpoint()->close();
    }
  });

  auto dispatcher = std::make_shared<node::AckDispatcher>(config.name);
  server::StreamOptions stream_options;
  stream_options.max_message_size = config.max_message_size;
  auto node_server = std::make_shared<server::NodeServer>(endpoint, dispatcher, stream_options);

  std::promise<std::error_code> server_exit;
  auto server_done = server_exit.get_future();
  boost::asio::co_spawn(
      pool.executor(),
      [node_server]() -> boost::asio::awaitable<std::error_code> {
        std::error_code run_ec;
        co_await node_server->run(run_ec);
        co_return run_ec;
      },
      [&server_exit](std::exception_ptr error, std::error_code run_ec) {
        if (error) {
          try {
            std::rethrow_exception(error);
          } catch (const std::exception& e) {
            LOG_ERROR("Node server failed: {}", e.what());
          }
          run_ec = NodeErrc::kServerExited;
        }
        server_exit.set_value(run_ec);
      });

  LOG_INFO("Node {} running on {} with {} worker threads", config.name,
           transport::format_endpoint(endpoint->local_endpoint()), pool.num_threads());

  if (node_client) {
    for (const auto& peer : config.peers) {
      utils::spawn_task(pool.executor(), greet_peer(*node_client, peer, config),
                        fmt::format("greeting {}", peer.name));
    }
  }

  const auto exit_ec = server_done.get();
  signals.cancel();
  endpoint->close();
  if (node_client) {
    node_client->endpoint()->close();
  }
  pool.stop();
  pool.join();

  if (shutdown_requested.load() && exit_ec == NodeErrc::kServerExited) {
    LOG_INFO("Node {} stopped", config.name);
    return 0;
  }
  LOG_ERROR("Node server stopped unexpectedly: {}", exit_ec.message());
  return 1;
}
