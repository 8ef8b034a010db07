#pragma once

#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>

#include "transport/link/link.h"

namespace nodelink::transport {

// A TLS 1.3 session over TCP. The handshake is driven by the endpoint before
// the link is handed to a mux connection.
class TlsLink final : public Link {
 public:
  using Stream = boost::asio::ssl::stream<boost::asio::ip::tcp::socket>;

  TlsLink(boost::asio::ip::tcp::socket socket, std::shared_ptr<boost::asio::ssl::context> context);

  // Client side: sends SNI for `peer_name` and verifies the server
  // certificate against it.
  boost::asio::awaitable<void> handshake_as_client(const std::string& peer_name,
                                                   std::error_code& ec);

  // Server side: the context requires and verifies a client certificate.
  boost::asio::awaitable<void> handshake_as_server(std::error_code& ec);

  boost::asio::awaitable<void> read_exact(boost::asio::mutable_buffer buffer,
                                          std::error_code& ec) override;

  boost::asio::awaitable<void> write_all(boost::asio::const_buffer buffer,
                                         std::error_code& ec) override;

  void close() override;

  const std::string& remote_address() const override { return remote_address_; }

  // Subject common name presented by the peer, empty before the handshake.
  std::string peer_common_name();

 private:
  // Keeps the context alive for as long as the SSL object references it.
  std::shared_ptr<boost::asio::ssl::context> context_;
  Stream stream_;
  std::string remote_address_;
};

// Formats an endpoint as "address:port" ("[v6]:port" for IPv6).
std::string format_endpoint(const boost::asio::ip::tcp::endpoint& endpoint);

}  // namespace nodelink::transport
