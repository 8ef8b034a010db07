#include "transport/link/tls_link.h"

#include <array>
#include <utility>

#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include "common/logging/logger.h"

namespace nodelink::transport {

namespace {
using boost::asio::redirect_error;
using boost::asio::use_awaitable;
}  // namespace

std::string format_endpoint(const boost::asio::ip::tcp::endpoint& endpoint) {
  const auto address = endpoint.address();
  if (address.is_v6()) {
    return "[" + address.to_string() + "]:" + std::to_string(endpoint.port());
  }
  return address.to_string() + ":" + std::to_string(endpoint.port());
}

TlsLink::TlsLink(boost::asio::ip::tcp::socket socket,
                 std::shared_ptr<boost::asio::ssl::context> context)
    : context_(std::move(context)), stream_(std::move(socket), *context_) {
  boost::system::error_code ec;
  const auto remote = stream_.lowest_layer().remote_endpoint(ec);
  remote_address_ = ec ? std::string("<unknown>") : format_endpoint(remote);
}

boost::asio::awaitable<void> TlsLink::handshake_as_client(const std::string& peer_name,
                                                          std::error_code& ec) {
  // SNI lets a node serving several names pick the matching certificate.
  if (SSL_set_tlsext_host_name(stream_.native_handle(), peer_name.c_str()) != 1) {
    LOG_WARN("Failed to set SNI for {}", peer_name);
  }
  stream_.set_verify_callback(boost::asio::ssl::host_name_verification(peer_name));

  boost::system::error_code bec;
  co_await stream_.async_handshake(boost::asio::ssl::stream_base::client,
                                   redirect_error(use_awaitable, bec));
  ec = bec;
}

boost::asio::awaitable<void> TlsLink::handshake_as_server(std::error_code& ec) {
  boost::system::error_code bec;
  co_await stream_.async_handshake(boost::asio::ssl::stream_base::server,
                                   redirect_error(use_awaitable, bec));
  ec = bec;
}

boost::asio::awaitable<void> TlsLink::read_exact(boost::asio::mutable_buffer buffer,
                                                 std::error_code& ec) {
  boost::system::error_code bec;
  co_await boost::asio::async_read(stream_, buffer, redirect_error(use_awaitable, bec));
  ec = bec;
}

boost::asio::awaitable<void> TlsLink::write_all(boost::asio::const_buffer buffer,
                                                std::error_code& ec) {
  boost::system::error_code bec;
  co_await boost::asio::async_write(stream_, buffer, redirect_error(use_awaitable, bec));
  ec = bec;
}

void TlsLink::close() {
  auto& socket = stream_.lowest_layer();
  if (!socket.is_open()) {
    return;
  }
  boost::system::error_code ignored;
  socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
  socket.close(ignored);
}

std::string TlsLink::peer_common_name() {
  X509* cert = SSL_get0_peer_certificate(stream_.native_handle());
  if (cert == nullptr) {
    return {};
  }
  std::array<char, 256> buffer{};
  const int length = X509_NAME_get_text_by_NID(X509_get_subject_name(cert), NID_commonName,
                                               buffer.data(), static_cast<int>(buffer.size()));
  return length > 0 ? std::string(buffer.data(), static_cast<std::size_t>(length)) : std::string();
}

}  // namespace nodelink::transport
