#include "server/node_server.h"

#include <utility>

#include <fmt/format.h>

#include "common/errors/error.h"
#include "common/logging/logger.h"
#include "common/tls/identity.h"
#include "common/utils/spawn.h"
#include "server/accept_loop.h"

namespace nodelink::server {

namespace {
boost::asio::awaitable<void> handle_connection(transport::Incoming incoming,
                                               std::shared_ptr<MessageDispatcher> dispatcher,
                                               StreamOptions options) {
  std::error_code ec;
  auto connection = co_await incoming.handshake(ec);
  if (!connection) {
    co_return;
  }
  LOG_INFO("Remote {} ({}) connected", connection->remote_address(), connection->peer_name());

  auto handler = [dispatcher, options](mux::BiStream stream) {
    return serve_stream(dispatcher, std::move(stream), options);
  };
  co_await accept_streams(connection, std::move(handler));
}
}  // namespace

NodeServer::NodeServer(std::shared_ptr<transport::Endpoint> endpoint,
                       std::shared_ptr<MessageDispatcher> dispatcher, StreamOptions options)
    : endpoint_(std::move(endpoint)), dispatcher_(std::move(dispatcher)), options_(options) {}

boost::asio::awaitable<void> NodeServer::run(std::error_code& ec) {
  while (true) {
    std::error_code accept_ec;
    auto incoming = co_await endpoint_->accept(accept_ec);
    if (!incoming) {
      LOG_DEBUG("Endpoint stopped accepting: {}", accept_ec.message());
      break;
    }
    LOG_INFO("New node connection from {}", incoming->remote_address());
    auto strand = incoming->strand();
    auto name = fmt::format("connection from {}", incoming->remote_address());
    utils::spawn_task(strand, handle_connection(std::move(*incoming), dispatcher_, options_),
                      std::move(name));
  }
  ec = NodeErrc::kServerExited;
}

std::shared_ptr<transport::Endpoint> new_server(const boost::asio::any_io_executor& executor,
                                                const boost::asio::ip::tcp::endpoint& address,
                                                std::string_view cert_pem,
                                                std::string_view key_pem,
                                                std::string_view ca_cert_pem, std::error_code& ec,
                                                mux::TransportConfig config) {
  auto identity = tls::Identity::load(ca_cert_pem, cert_pem, key_pem, ec);
  if (!identity) {
    LOG_ERROR("Failed to load node identity: {}", ec.message());
    return nullptr;
  }
  return transport::Endpoint::server(executor, address, std::move(identity), config, ec);
}

}  // namespace nodelink::server
