#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>

#include "common/tls/identity.h"
#include "transport/link/link.h"
#include "transport/mux/connection.h"

namespace nodelink::transport {

class Endpoint;

// An inbound connection whose TLS handshake has not run yet. The accept loop
// hands it to a per-connection task, which completes the handshake.
class Incoming {
 public:
  Incoming(std::shared_ptr<Endpoint> endpoint, Strand strand, boost::asio::ip::tcp::socket socket);

  // Runs the server handshake. Returns nullptr and sets `ec` on failure.
  boost::asio::awaitable<std::shared_ptr<mux::Connection>> handshake(std::error_code& ec);

  [[nodiscard]] const std::string& remote_address() const noexcept { return remote_address_; }
  // Strand the resulting connection will run on.
  [[nodiscard]] const Strand& strand() const noexcept { return strand_; }

 private:
  std::shared_ptr<Endpoint> endpoint_;
  Strand strand_;
  boost::asio::ip::tcp::socket socket_;
  std::string remote_address_;
};

/**
 * Local network binding that makes or accepts encrypted multiplexed
 * connections. An endpoint is either client- or server-configured for its
 * whole life.
 *
 * Thread Safety: All public methods are thread-safe.
 */
class Endpoint : public std::enable_shared_from_this<Endpoint> {
 public:
  enum class Kind { kClient, kServer };

  // Client endpoint: outbound sockets bind to an ephemeral local port and use
  // the identity's client TLS context for every connection attempt.
  static std::shared_ptr<Endpoint> client(const boost::asio::any_io_executor& executor,
                                          std::shared_ptr<const tls::Identity> identity,
                                          mux::TransportConfig config, std::error_code& ec);

  // Server endpoint: listens on `address`, requires client certificates and
  // refuses inbound unidirectional streams.
  static std::shared_ptr<Endpoint> server(const boost::asio::any_io_executor& executor,
                                          const boost::asio::ip::tcp::endpoint& address,
                                          std::shared_ptr<const tls::Identity> identity,
                                          mux::TransportConfig config, std::error_code& ec);

  ~Endpoint();

  Endpoint(const Endpoint&) = delete;
  Endpoint& operator=(const Endpoint&) = delete;

  // Dials `remote` and completes the TLS handshake, verifying that the server
  // certificate is issued to `peer_name`.
  boost::asio::awaitable<std::shared_ptr<mux::Connection>> connect(
      const boost::asio::ip::tcp::endpoint& remote, const std::string& peer_name,
      std::error_code& ec);

  // Waits for the next inbound connection. Returns nullopt with
  // TransportErrc::kEndpointClosed once the endpoint is closed; transient
  // accept failures are logged and retried internally.
  boost::asio::awaitable<std::optional<Incoming>> accept(std::error_code& ec);

  // Stops accepting and closes every connection made through this endpoint.
  void close();

  [[nodiscard]] bool is_closed() const;
  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] const mux::TransportConfig& transport_config() const noexcept { return config_; }

  // Bound listening address of a server endpoint.
  [[nodiscard]] boost::asio::ip::tcp::endpoint local_endpoint() const;

 private:
  friend class Incoming;

  Endpoint(Kind kind, const boost::asio::any_io_executor& executor,
           std::shared_ptr<const tls::Identity> identity,
           std::shared_ptr<boost::asio::ssl::context> context, mux::TransportConfig config);

  boost::asio::awaitable<std::optional<Incoming>> do_accept(std::error_code& ec);
  void track(const std::shared_ptr<mux::Connection>& connection);

  Kind kind_;
  boost::asio::any_io_executor executor_;
  std::shared_ptr<const tls::Identity> identity_;
  std::shared_ptr<boost::asio::ssl::context> context_;
  mux::TransportConfig config_;

  // The acceptor is only touched from its strand.
  Strand acceptor_strand_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::ip::tcp::endpoint local_endpoint_;

  mutable std::mutex mutex_;
  bool closed_{false};
  std::vector<std::weak_ptr<mux::Connection>> connections_;
};

}  // namespace nodelink::transport
