#pragma once

#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <fmt/format.h>

#include "common/errors/error.h"
#include "common/logging/logger.h"
#include "common/utils/spawn.h"

namespace nodelink::server {

// Accepts the peer's bidirectional streams until the connection closes and
// starts `handler(stream)` as an independent task on the connection's
// executor for each one.
//
// Conn provides close_reason(), accept_bi(ec), remote_address() and
// get_executor(), as mux::Connection does. The loop ends once the connection
// has a close reason or accept_bi() reports TransportErrc::kLocallyClosed;
// every other accept error is skipped.
template <typename Conn, typename Handler>
boost::asio::awaitable<void> accept_streams(std::shared_ptr<Conn> connection, Handler handler) {
  while (true) {
    if (auto reason = connection->close_reason()) {
      LOG_INFO("Connection {} is closed: {}", connection->remote_address(), reason->to_string());
      break;
    }

    std::error_code ec;
    auto stream = co_await connection->accept_bi(ec);
    if (stream) {
      LOG_DEBUG("Stream from remote {} accepted", connection->remote_address());
      utils::spawn_task(connection->get_executor(), handler(std::move(*stream)),
                        fmt::format("stream from {}", connection->remote_address()));
      continue;
    }
    if (ec == TransportErrc::kLocallyClosed) {
      break;
    }
    LOG_DEBUG("Accepting stream from {} failed: {}", connection->remote_address(), ec.message());
  }
  LOG_INFO("Connection from remote {} closed", connection->remote_address());
}

}  // namespace nodelink::server
