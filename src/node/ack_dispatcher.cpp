#include "node/ack_dispatcher.h"

#include <utility>

#include "common/logging/logger.h"
#include "transport/framing/message_io.h"

namespace nodelink::node {

AckDispatcher::AckDispatcher(std::string node_name) : node_name_(std::move(node_name)) {}

boost::asio::awaitable<void> AckDispatcher::handle(mux::SendStream& send,
                                                   std::uint64_t message_id,
                                                   protocol::Request request) {
  LOG_INFO("[{}] request {} on stream {}: {} {}", node_name_, message_id, send.id(), request.kind,
           request.is_unit() ? std::string() : request.body.dump());
  ++handled_;

  const auto reply = protocol::encode_reply(protocol::Reply{message_id, {"Ack", nullptr}});
  std::error_code ec;
  co_await framing::write_length_prefixed(send, reply, ec);
  if (ec) {
    LOG_WARN("[{}] failed to acknowledge request {}: {}", node_name_, message_id, ec.message());
  }
}

}  // namespace nodelink::node
