#include "server/stream_dispatcher.h"

#include <utility>

#include "common/errors/error.h"
#include "common/logging/logger.h"
#include "transport/framing/message_io.h"

namespace nodelink::server {

boost::asio::awaitable<void> serve_stream(std::shared_ptr<MessageDispatcher> dispatcher,
                                          mux::BiStream stream, StreamOptions options) {
  const auto stream_id = stream.recv.id();
  framing::MessageReader reader(stream.recv, options.max_message_size);
  std::size_t served = 0;

  std::error_code end;
  while (true) {
    std::error_code ec;
    auto message = co_await reader.next(ec);
    if (!message) {
      if (ec == TransportErrc::kStreamFinished) {
        LOG_DEBUG("Stream {} finished after {} messages", stream_id, served);
      } else {
        LOG_DEBUG("Stream {} read loop ended: {}", stream_id, ec.message());
      }
      end = ec;
      break;
    }

    auto request = protocol::decode_request(message->payload, ec);
    if (!request) {
      LOG_DEBUG("Error deserializing request {} on stream {}: {}", message->message_id, stream_id,
                ec.message());
      continue;
    }

    co_await dispatcher->handle(stream.send, message->message_id, std::move(*request));
    ++served;
  }

  // The peer is done sending; finish our half so the stream is released on
  // both sides. Any other ending abandons the stream.
  if (end == TransportErrc::kStreamFinished) {
    std::error_code ec;
    co_await stream.send.finish(ec);
    if (ec) {
      LOG_DEBUG("Failed to finish stream {}: {}", stream_id, ec.message());
    }
  } else {
    stream.send.reset(kSessionAbortedCode);
  }
}

}  // namespace nodelink::server
