#pragma once

#include <memory>
#include <string_view>
#include <system_error>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "server/message_dispatcher.h"
#include "server/stream_dispatcher.h"
#include "transport/endpoint/endpoint.h"

namespace nodelink::server {

/**
 * Serves inbound node connections on a server endpoint.
 *
 * run() accepts connections until the endpoint is closed. Each connection is
 * handled by its own task on the connection's strand, and each of its
 * streams by another, so a slow or faulty stream never holds up the others.
 */
class NodeServer {
 public:
  NodeServer(std::shared_ptr<transport::Endpoint> endpoint,
             std::shared_ptr<MessageDispatcher> dispatcher, StreamOptions options = {});

  // Returns only once the endpoint stops accepting, and then always with
  // NodeErrc::kServerExited in `ec`.
  boost::asio::awaitable<void> run(std::error_code& ec);

  [[nodiscard]] const std::shared_ptr<transport::Endpoint>& endpoint() const noexcept {
    return endpoint_;
  }

 private:
  std::shared_ptr<transport::Endpoint> endpoint_;
  std::shared_ptr<MessageDispatcher> dispatcher_;
  StreamOptions options_;
};

// Loads the identity from PEM text and creates a server endpoint listening on
// `address`.
std::shared_ptr<transport::Endpoint> new_server(const boost::asio::any_io_executor& executor,
                                                const boost::asio::ip::tcp::endpoint& address,
                                                std::string_view cert_pem,
                                                std::string_view key_pem,
                                                std::string_view ca_cert_pem, std::error_code& ec,
                                                mux::TransportConfig config = {});

}  // namespace nodelink::server
