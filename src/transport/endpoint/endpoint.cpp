#include "transport/endpoint/endpoint.h"

#include <algorithm>
#include <chrono>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "common/errors/error.h"
#include "common/logging/logger.h"
#include "transport/link/tls_link.h"

namespace nodelink::transport {

namespace {
using boost::asio::redirect_error;
using boost::asio::use_awaitable;
using boost::asio::ip::tcp;

// Pause after a failed accept() so a persistent condition such as EMFILE does
// not spin the acceptor.
constexpr auto kAcceptErrorPause = std::chrono::milliseconds(100);

tcp::endpoint ephemeral_for(const tcp::endpoint& remote) {
  if (remote.address().is_v6()) {
    return {boost::asio::ip::address_v6::any(), 0};
  }
  return {boost::asio::ip::address_v4::any(), 0};
}
}  // namespace

// ============================================================================
// Incoming
// ============================================================================

Incoming::Incoming(std::shared_ptr<Endpoint> endpoint, Strand strand, tcp::socket socket)
    : endpoint_(std::move(endpoint)), strand_(std::move(strand)), socket_(std::move(socket)) {
  boost::system::error_code ec;
  const auto remote = socket_.remote_endpoint(ec);
  remote_address_ = ec ? std::string("<unknown>") : format_endpoint(remote);
}

boost::asio::awaitable<std::shared_ptr<mux::Connection>> Incoming::handshake(std::error_code& ec) {
  auto link = std::make_unique<TlsLink>(std::move(socket_), endpoint_->context_);
  co_await link->handshake_as_server(ec);
  if (ec) {
    LOG_WARN("TLS handshake with {} failed: {}", remote_address_, ec.message());
    link->close();
    ec = TransportErrc::kHandshakeFailed;
    co_return nullptr;
  }

  auto peer_name = link->peer_common_name();
  auto connection = mux::Connection::create(strand_, std::move(link), mux::Role::kServer,
                                            std::move(peer_name), endpoint_->config_);
  connection->start();
  endpoint_->track(connection);
  ec.clear();
  co_return connection;
}

// ============================================================================
// Endpoint
// ============================================================================

Endpoint::Endpoint(Kind kind, const boost::asio::any_io_executor& executor,
                   std::shared_ptr<const tls::Identity> identity,
                   std::shared_ptr<boost::asio::ssl::context> context, mux::TransportConfig config)
    : kind_(kind),
      executor_(executor),
      identity_(std::move(identity)),
      context_(std::move(context)),
      config_(config),
      acceptor_strand_(boost::asio::make_strand(executor)),
      acceptor_(acceptor_strand_) {}

Endpoint::~Endpoint() {
  boost::system::error_code ignored;
  acceptor_.close(ignored);
}

std::shared_ptr<Endpoint> Endpoint::client(const boost::asio::any_io_executor& executor,
                                           std::shared_ptr<const tls::Identity> identity,
                                           mux::TransportConfig config, std::error_code& ec) {
  auto context = identity->make_client_context(ec);
  if (!context) {
    return nullptr;
  }
  LOG_DEBUG("Client endpoint created for {}", identity->subject_name());
  return std::shared_ptr<Endpoint>(
      new Endpoint(Kind::kClient, executor, std::move(identity), std::move(context), config));
}

std::shared_ptr<Endpoint> Endpoint::server(const boost::asio::any_io_executor& executor,
                                           const tcp::endpoint& address,
                                           std::shared_ptr<const tls::Identity> identity,
                                           mux::TransportConfig config, std::error_code& ec) {
  auto context = identity->make_server_context(ec);
  if (!context) {
    return nullptr;
  }

  // The node protocol only uses bidirectional streams.
  config.max_concurrent_uni_streams = 0;

  std::shared_ptr<Endpoint> endpoint(
      new Endpoint(Kind::kServer, executor, std::move(identity), std::move(context), config));

  boost::system::error_code bec;
  auto& acceptor = endpoint->acceptor_;
  acceptor.open(address.protocol(), bec);
  if (!bec) {
    acceptor.set_option(tcp::acceptor::reuse_address(true), bec);
  }
  if (!bec) {
    acceptor.bind(address, bec);
  }
  if (!bec) {
    acceptor.listen(boost::asio::socket_base::max_listen_connections, bec);
  }
  if (!bec) {
    endpoint->local_endpoint_ = acceptor.local_endpoint(bec);
  }
  if (bec) {
    LOG_ERROR("Failed to bind node endpoint to {}: {}", format_endpoint(address), bec.message());
    ec = bec;
    return nullptr;
  }

  LOG_INFO("Node endpoint listening on {}", format_endpoint(endpoint->local_endpoint_));
  ec.clear();
  return endpoint;
}

bool Endpoint::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

tcp::endpoint Endpoint::local_endpoint() const { return local_endpoint_; }

void Endpoint::track(const std::shared_ptr<mux::Connection>& connection) {
  bool closed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed = closed_;
    if (!closed) {
      connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                        [](const auto& weak) { return weak.expired(); }),
                         connections_.end());
      connections_.push_back(connection);
    }
  }
  if (closed) {
    connection->close(0, "endpoint closed");
  }
}

void Endpoint::close() {
  std::vector<std::weak_ptr<mux::Connection>> connections;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    connections.swap(connections_);
  }

  boost::asio::post(acceptor_strand_, [self = shared_from_this()] {
    boost::system::error_code ignored;
    self->acceptor_.close(ignored);
  });

  for (auto& weak : connections) {
    if (auto connection = weak.lock()) {
      connection->close(0, "endpoint closed");
    }
  }
}

boost::asio::awaitable<std::shared_ptr<mux::Connection>> Endpoint::connect(
    const tcp::endpoint& remote, const std::string& peer_name, std::error_code& ec) {
  auto self = shared_from_this();
  if (is_closed()) {
    ec = TransportErrc::kEndpointClosed;
    co_return nullptr;
  }

  auto strand = boost::asio::make_strand(executor_);
  tcp::socket socket(strand);
  boost::system::error_code bec;
  socket.open(remote.protocol(), bec);
  if (!bec) {
    socket.bind(ephemeral_for(remote), bec);
  }
  if (!bec) {
    co_await socket.async_connect(remote, redirect_error(use_awaitable, bec));
  }
  if (bec) {
    ec = bec;
    co_return nullptr;
  }

  auto link = std::make_unique<TlsLink>(std::move(socket), context_);
  co_await link->handshake_as_client(peer_name, ec);
  if (ec) {
    LOG_DEBUG("TLS handshake with {} at {} failed: {}", peer_name, format_endpoint(remote),
              ec.message());
    link->close();
    ec = TransportErrc::kHandshakeFailed;
    co_return nullptr;
  }

  auto connection =
      mux::Connection::create(strand, std::move(link), mux::Role::kClient, peer_name, config_);
  connection->start();
  track(connection);
  ec.clear();
  co_return connection;
}

boost::asio::awaitable<std::optional<Incoming>> Endpoint::accept(std::error_code& ec) {
  if (kind_ != Kind::kServer) {
    ec = TransportErrc::kEndpointClosed;
    co_return std::nullopt;
  }
  auto op = [self = shared_from_this(), &ec]() { return self->do_accept(ec); };
  co_return co_await boost::asio::co_spawn(acceptor_strand_, std::move(op), use_awaitable);
}

boost::asio::awaitable<std::optional<Incoming>> Endpoint::do_accept(std::error_code& ec) {
  auto self = shared_from_this();
  while (!is_closed() && acceptor_.is_open()) {
    auto strand = boost::asio::make_strand(executor_);
    tcp::socket socket(strand);
    boost::system::error_code bec;
    co_await acceptor_.async_accept(socket, redirect_error(use_awaitable, bec));
    if (!bec) {
      ec.clear();
      co_return Incoming(self, std::move(strand), std::move(socket));
    }
    if (bec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
      break;
    }

    LOG_WARN("Accepting node connection failed: {}", bec.message());
    boost::asio::steady_timer pause(acceptor_strand_, kAcceptErrorPause);
    co_await pause.async_wait(redirect_error(use_awaitable, bec));
  }
  ec = TransportErrc::kEndpointClosed;
  co_return std::nullopt;
}

}  // namespace nodelink::transport
