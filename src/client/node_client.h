#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "client/retry.h"
#include "transport/endpoint/endpoint.h"
#include "transport/mux/connection.h"

namespace nodelink::client {

struct ClientOptions {
  // Fixed pause between connection attempts.
  std::chrono::milliseconds retry_backoff{kDefaultRetryBackoff};
};

/**
 * Dials other nodes through a client endpoint.
 *
 * Attempts are sequential and separated by a fixed backoff; there is no
 * exponential growth and no jitter. Copies share the endpoint.
 */
class NodeClient {
 public:
  NodeClient(std::shared_ptr<transport::Endpoint> endpoint, ClientOptions options = {});

  // Up to `retries` full handshakes with the node `peer_name` at `address`.
  // Fails with NodeErrc::kConnectFailed once they are used up; the text
  // "failed to connect to <peer_name> at <address>" is logged and, if `failure`
  // is non-null, stored there.
  boost::asio::awaitable<std::shared_ptr<mux::Connection>> try_connect(
      const boost::asio::ip::tcp::endpoint& address, const std::string& peer_name,
      std::uint32_t retries, std::error_code& ec, std::string* failure = nullptr) const;

  // Connects and opens a session stream, retrying both steps together within
  // one budget of `retries` attempts. Failures are reported as in try_connect().
  boost::asio::awaitable<std::optional<mux::BiStream>> connect(
      const boost::asio::ip::tcp::endpoint& address, const std::string& peer_name,
      std::uint32_t retries, std::error_code& ec, std::string* failure = nullptr) const;

  // Opens one bidirectional stream on an established connection. Fails with
  // the connection's close error if it has closed.
  static boost::asio::awaitable<std::optional<mux::BiStream>> open_session(
      const std::shared_ptr<mux::Connection>& connection, std::error_code& ec);

  [[nodiscard]] const std::shared_ptr<transport::Endpoint>& endpoint() const noexcept {
    return endpoint_;
  }

 private:
  boost::asio::awaitable<std::optional<mux::BiStream>> connect_once(
      const boost::asio::ip::tcp::endpoint& address, const std::string& peer_name,
      std::error_code& ec) const;

  std::shared_ptr<transport::Endpoint> endpoint_;
  ClientOptions options_;
};

// Loads the identity from PEM text and creates a client bound to an ephemeral
// local port.
std::optional<NodeClient> new_client(const boost::asio::any_io_executor& executor,
                                     std::string_view ca_cert_pem, std::string_view cert_pem,
                                     std::string_view key_pem, std::error_code& ec,
                                     ClientOptions options = {},
                                     mux::TransportConfig config = {});

}  // namespace nodelink::client
