#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

namespace nodelink::framing {

// Header in front of every chunk of a message on a node stream.
struct ChunkHeader {
  std::uint64_t message_id{0};
  // Total size of the message this chunk belongs to.
  std::uint32_t message_size{0};
  // Position of the chunk within its message. Diagnostic only.
  std::uint64_t chunk_id{0};
  std::uint32_t chunk_size{0};
};

struct Chunk {
  ChunkHeader header;
  std::vector<std::uint8_t> data;
};

// Chunk protocol used on node streams. Wire format, all fields little-endian:
//   [message_id: 8 bytes]
//   [message_size: 4 bytes]
//   [chunk_id: 8 bytes]
//   [chunk_size: 4 bytes]
//   [payload: chunk_size bytes]
// Chunks of different messages may interleave on one stream; chunks of one
// message arrive in order.
class ChunkCodec {
 public:
  static constexpr std::size_t kHeaderSize = 8 + 4 + 8 + 4;  // 24 bytes
  static constexpr std::size_t kDefaultMaxChunkSize = 16 * 1024;

  static std::array<std::uint8_t, kHeaderSize> encode_header(const ChunkHeader& header);
  static ChunkHeader decode_header(std::span<const std::uint8_t, kHeaderSize> data);

  // Splits `payload` into wire chunks (header and data) of at most
  // `max_chunk_size` data bytes each, with chunk ids counting from 0. An empty
  // payload yields a single empty chunk. A `max_chunk_size` of 0 selects
  // kDefaultMaxChunkSize. Fails with FramingErrc::kMessageTooLarge when the
  // payload does not fit the 32-bit size field.
  static std::vector<std::vector<std::uint8_t>> encode_message(
      std::uint64_t message_id, std::span<const std::uint8_t> payload, std::size_t max_chunk_size,
      std::error_code& ec);
};

}  // namespace nodelink::framing
