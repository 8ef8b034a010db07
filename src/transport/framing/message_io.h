#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "transport/framing/chunk_codec.h"
#include "transport/framing/reassembly_buffer.h"
#include "transport/mux/stream.h"

namespace nodelink::framing {

// Reads one chunk (header and data). A stream that finishes cleanly before
// the header reports TransportErrc::kStreamFinished; one that finishes inside
// a chunk reports FramingErrc::kTruncatedHeader or kTruncatedPayload. With a
// non-zero `max_message_size`, a header declaring a larger chunk or message
// fails with FramingErrc::kMessageTooLarge before any chunk data is read.
boost::asio::awaitable<std::optional<Chunk>> read_next_chunk(mux::RecvStream& recv,
                                                             std::error_code& ec,
                                                             std::size_t max_message_size = 0);

// Reads chunks from one stream until a message is complete.
class MessageReader {
 public:
  explicit MessageReader(mux::RecvStream& recv, std::size_t max_message_size = 0);

  // Returns the next completed message. Any error ends the session: the
  // caller should stop reading the stream.
  boost::asio::awaitable<std::optional<CompletedMessage>> next(std::error_code& ec);

  [[nodiscard]] std::size_t pending_count() const { return buffer_.pending_count(); }

 private:
  mux::RecvStream& recv_;
  std::size_t max_message_size_;
  ReassemblyBuffer buffer_;
};

// Sends `payload` as message `message_id`, one stream write per chunk. Writers
// sharing the stream interleave at chunk granularity.
boost::asio::awaitable<void> write_message(mux::SendStream& send, std::uint64_t message_id,
                                           std::span<const std::uint8_t> payload,
                                           std::size_t max_chunk_size, std::error_code& ec);

// Length-prefixed protocol: [length: 4 bytes little-endian][length bytes].
boost::asio::awaitable<void> write_length_prefixed(mux::SendStream& send,
                                                   std::span<const std::uint8_t> payload,
                                                   std::error_code& ec);

// `max_size` of 0 accepts any length.
boost::asio::awaitable<std::optional<std::vector<std::uint8_t>>> read_length_prefixed(
    mux::RecvStream& recv, std::error_code& ec, std::size_t max_size = 0);

}  // namespace nodelink::framing
