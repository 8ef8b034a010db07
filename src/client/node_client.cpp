#include "client/node_client.h"

#include <utility>

#include "common/errors/error.h"
#include "common/logging/logger.h"
#include "common/tls/identity.h"
#include "transport/link/tls_link.h"

namespace nodelink::client {

using boost::asio::ip::tcp;

NodeClient::NodeClient(std::shared_ptr<transport::Endpoint> endpoint, ClientOptions options)
    : endpoint_(std::move(endpoint)), options_(options) {}

boost::asio::awaitable<std::shared_ptr<mux::Connection>> NodeClient::try_connect(
    const tcp::endpoint& address, const std::string& peer_name, std::uint32_t retries,
    std::error_code& ec, std::string* failure) const {
  auto endpoint = endpoint_;
  auto attempt = [endpoint, &address, &peer_name](std::error_code& attempt_ec)
      -> boost::asio::awaitable<std::optional<std::shared_ptr<mux::Connection>>> {
    auto connection = co_await endpoint->connect(address, peer_name, attempt_ec);
    if (!connection) {
      co_return std::nullopt;
    }
    co_return connection;
  };
  const auto label = transport::format_endpoint(address);
  auto result = co_await with_retries<std::shared_ptr<mux::Connection>>(
      retries, options_.retry_backoff, peer_name, label, std::move(attempt), ec, failure);
  co_return result ? std::move(*result) : nullptr;
}

boost::asio::awaitable<std::optional<mux::BiStream>> NodeClient::connect(
    const tcp::endpoint& address, const std::string& peer_name, std::uint32_t retries,
    std::error_code& ec, std::string* failure) const {
  auto attempt = [this, &address, &peer_name](std::error_code& attempt_ec) {
    return connect_once(address, peer_name, attempt_ec);
  };
  const auto label = transport::format_endpoint(address);
  co_return co_await with_retries<mux::BiStream>(retries, options_.retry_backoff, peer_name, label,
                                                 std::move(attempt), ec, failure);
}

boost::asio::awaitable<std::optional<mux::BiStream>> NodeClient::connect_once(
    const tcp::endpoint& address, const std::string& peer_name, std::error_code& ec) const {
  auto connection = co_await endpoint_->connect(address, peer_name, ec);
  if (!connection) {
    co_return std::nullopt;
  }
  LOG_INFO("Connected to {} at {}", peer_name, connection->remote_address());
  co_return co_await open_session(connection, ec);
}

boost::asio::awaitable<std::optional<mux::BiStream>> NodeClient::open_session(
    const std::shared_ptr<mux::Connection>& connection, std::error_code& ec) {
  if (auto reason = connection->close_reason()) {
    ec = reason->error();
    co_return std::nullopt;
  }
  co_return co_await connection->open_bi(ec);
}

std::optional<NodeClient> new_client(const boost::asio::any_io_executor& executor,
                                     std::string_view ca_cert_pem, std::string_view cert_pem,
                                     std::string_view key_pem, std::error_code& ec,
                                     ClientOptions options, mux::TransportConfig config) {
  auto identity = tls::Identity::load(ca_cert_pem, cert_pem, key_pem, ec);
  if (!identity) {
    LOG_ERROR("Failed to load node identity: {}", ec.message());
    return std::nullopt;
  }
  auto endpoint = transport::Endpoint::client(executor, std::move(identity), config, ec);
  if (!endpoint) {
    return std::nullopt;
  }
  return NodeClient(std::move(endpoint), options);
}

}  // namespace nodelink::client
