#pragma once

#include <cstdint>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "common/protocol/request.h"
#include "transport/mux/stream.h"

namespace nodelink::server {

// Handles the requests arriving on node streams. Implementations carry their
// own context and write any response to `send`, the sending half of the
// stream the request arrived on.
//
// Several streams may be served at once, so handle() can run concurrently for
// different streams. Calls for one stream are sequential.
class MessageDispatcher {
 public:
  virtual ~MessageDispatcher() = default;

  virtual boost::asio::awaitable<void> handle(mux::SendStream& send, std::uint64_t message_id,
                                              protocol::Request request) = 0;
};

}  // namespace nodelink::server
