#include "transport/framing/message_io.h"

#include <array>
#include <limits>

#include "common/errors/error.h"
#include "common/logging/logger.h"

namespace nodelink::framing {

boost::asio::awaitable<std::optional<Chunk>> read_next_chunk(mux::RecvStream& recv,
                                                             std::error_code& ec,
                                                             std::size_t max_message_size) {
  std::array<std::uint8_t, ChunkCodec::kHeaderSize> raw{};
  std::size_t filled = 0;
  while (filled < raw.size()) {
    const auto count = co_await recv.read_some(std::span(raw).subspan(filled), ec);
    if (ec) {
      if (ec == TransportErrc::kStreamFinished && filled > 0) {
        ec = FramingErrc::kTruncatedHeader;
      }
      co_return std::nullopt;
    }
    filled += count;
  }

  Chunk chunk;
  chunk.header = ChunkCodec::decode_header(std::span<const std::uint8_t, ChunkCodec::kHeaderSize>(raw));
  if (max_message_size != 0 && (chunk.header.chunk_size > max_message_size ||
                                chunk.header.message_size > max_message_size)) {
    LOG_DEBUG("Chunk {} of message {} declares {} of {} bytes, limit {}", chunk.header.chunk_id,
              chunk.header.message_id, chunk.header.chunk_size, chunk.header.message_size,
              max_message_size);
    ec = FramingErrc::kMessageTooLarge;
    co_return std::nullopt;
  }
  chunk.data.resize(chunk.header.chunk_size);
  co_await recv.read_exact(chunk.data, ec);
  if (ec) {
    if (ec == TransportErrc::kStreamFinished) {
      ec = FramingErrc::kTruncatedPayload;
    }
    co_return std::nullopt;
  }

  LOG_TRACE("read message_id={} chunk_id={}", chunk.header.message_id, chunk.header.chunk_id);
  co_return chunk;
}

MessageReader::MessageReader(mux::RecvStream& recv, std::size_t max_message_size)
    : recv_(recv), max_message_size_(max_message_size), buffer_(max_message_size) {}

boost::asio::awaitable<std::optional<CompletedMessage>> MessageReader::next(std::error_code& ec) {
  while (true) {
    auto chunk = co_await read_next_chunk(recv_, ec, max_message_size_);
    if (!chunk) {
      co_return std::nullopt;
    }
    auto message = buffer_.push(std::move(*chunk), ec);
    if (ec) {
      co_return std::nullopt;
    }
    if (message) {
      co_return message;
    }
  }
}

boost::asio::awaitable<void> write_message(mux::SendStream& send, std::uint64_t message_id,
                                           std::span<const std::uint8_t> payload,
                                           std::size_t max_chunk_size, std::error_code& ec) {
  auto chunks = ChunkCodec::encode_message(message_id, payload, max_chunk_size, ec);
  if (ec) {
    co_return;
  }
  for (const auto& chunk : chunks) {
    co_await send.write_all(chunk, ec);
    if (ec) {
      co_return;
    }
  }
}

boost::asio::awaitable<void> write_length_prefixed(mux::SendStream& send,
                                                   std::span<const std::uint8_t> payload,
                                                   std::error_code& ec) {
  if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
    ec = FramingErrc::kMessageTooLarge;
    co_return;
  }
  const auto size = static_cast<std::uint32_t>(payload.size());
  std::vector<std::uint8_t> wire;
  wire.reserve(4 + payload.size());
  for (int i = 0; i < 4; ++i) {
    wire.push_back(static_cast<std::uint8_t>(size >> (8 * i)));
  }
  wire.insert(wire.end(), payload.begin(), payload.end());
  co_await send.write_all(wire, ec);
}

boost::asio::awaitable<std::optional<std::vector<std::uint8_t>>> read_length_prefixed(
    mux::RecvStream& recv, std::error_code& ec, std::size_t max_size) {
  std::array<std::uint8_t, 4> prefix{};
  co_await recv.read_exact(prefix, ec);
  if (ec) {
    co_return std::nullopt;
  }
  const std::uint32_t size = static_cast<std::uint32_t>(prefix[0]) |
                             (static_cast<std::uint32_t>(prefix[1]) << 8) |
                             (static_cast<std::uint32_t>(prefix[2]) << 16) |
                             (static_cast<std::uint32_t>(prefix[3]) << 24);
  if (max_size != 0 && size > max_size) {
    ec = FramingErrc::kMessageTooLarge;
    co_return std::nullopt;
  }

  std::vector<std::uint8_t> payload(size);
  co_await recv.read_exact(payload, ec);
  if (ec) {
    if (ec == TransportErrc::kStreamFinished) {
      ec = FramingErrc::kTruncatedPayload;
    }
    co_return std::nullopt;
  }
  co_return payload;
}

}  // namespace nodelink::framing
