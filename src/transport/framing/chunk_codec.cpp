#include "transport/framing/chunk_codec.h"

#include <algorithm>
#include <limits>

#include "common/errors/error.h"

namespace nodelink::framing {

namespace {
void write_u32_le(std::uint8_t* out, std::uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    out[i] = static_cast<std::uint8_t>(value >> (8 * i));
  }
}

void write_u64_le(std::uint8_t* out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out[i] = static_cast<std::uint8_t>(value >> (8 * i));
  }
}

std::uint32_t read_u32_le(const std::uint8_t* in) {
  std::uint32_t value = 0;
  for (int i = 3; i >= 0; --i) {
    value = (value << 8) | in[i];
  }
  return value;
}

std::uint64_t read_u64_le(const std::uint8_t* in) {
  std::uint64_t value = 0;
  for (int i = 7; i >= 0; --i) {
    value = (value << 8) | in[i];
  }
  return value;
}
}  // namespace

std::array<std::uint8_t, ChunkCodec::kHeaderSize> ChunkCodec::encode_header(
    const ChunkHeader& header) {
  std::array<std::uint8_t, kHeaderSize> out{};
  write_u64_le(out.data(), header.message_id);
  write_u32_le(out.data() + 8, header.message_size);
  write_u64_le(out.data() + 12, header.chunk_id);
  write_u32_le(out.data() + 20, header.chunk_size);
  return out;
}

ChunkHeader ChunkCodec::decode_header(std::span<const std::uint8_t, kHeaderSize> data) {
  ChunkHeader header;
  header.message_id = read_u64_le(data.data());
  header.message_size = read_u32_le(data.data() + 8);
  header.chunk_id = read_u64_le(data.data() + 12);
  header.chunk_size = read_u32_le(data.data() + 20);
  return header;
}

std::vector<std::vector<std::uint8_t>> ChunkCodec::encode_message(
    std::uint64_t message_id, std::span<const std::uint8_t> payload, std::size_t max_chunk_size,
    std::error_code& ec) {
  if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
    ec = FramingErrc::kMessageTooLarge;
    return {};
  }
  if (max_chunk_size == 0) {
    max_chunk_size = kDefaultMaxChunkSize;
  }
  max_chunk_size = std::min<std::size_t>(max_chunk_size, std::numeric_limits<std::uint32_t>::max());

  const auto message_size = static_cast<std::uint32_t>(payload.size());
  std::vector<std::vector<std::uint8_t>> chunks;
  chunks.reserve(payload.empty() ? 1 : (payload.size() + max_chunk_size - 1) / max_chunk_size);

  std::size_t offset = 0;
  std::uint64_t chunk_id = 0;
  do {
    const auto size = std::min(max_chunk_size, payload.size() - offset);
    ChunkHeader header;
    header.message_id = message_id;
    header.message_size = message_size;
    header.chunk_id = chunk_id++;
    header.chunk_size = static_cast<std::uint32_t>(size);

    std::vector<std::uint8_t> wire;
    wire.reserve(kHeaderSize + size);
    const auto encoded = encode_header(header);
    wire.insert(wire.end(), encoded.begin(), encoded.end());
    const auto piece = payload.subspan(offset, size);
    wire.insert(wire.end(), piece.begin(), piece.end());
    chunks.push_back(std::move(wire));
    offset += size;
  } while (offset < payload.size());

  ec.clear();
  return chunks;
}

}  // namespace nodelink::framing
