#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "server/message_dispatcher.h"
#include "transport/mux/stream.h"

namespace nodelink::server {

// Reset code sent when a session ends on a framing or transport error.
inline constexpr std::uint32_t kSessionAbortedCode = 0x2;

struct StreamOptions {
  // Largest declared message size accepted; 0 accepts any.
  std::size_t max_message_size{0};
};

// Serves one chunk-protocol session: reads messages from `stream` until the
// stream ends or a framing error occurs, and passes every decoded request to
// `dispatcher`. A message that does not decode is logged and skipped. Once
// the peer finishes its half the reply half is finished too; on any other
// ending the stream is reset with kSessionAbortedCode.
boost::asio::awaitable<void> serve_stream(std::shared_ptr<MessageDispatcher> dispatcher,
                                          mux::BiStream stream, StreamOptions options = {});

}  // namespace nodelink::server
