#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "transport/mux/frame.h"

namespace nodelink::mux {

// Serializes and parses the frames multiplexing streams over one link.
// Wire format:
//   [kind: 1 byte]
//   [stream_id: 8 bytes big-endian]
//   [length: 4 bytes big-endian]
//   [payload: length bytes]
//   kOpen, kFin:  empty payload
//   kData:        stream bytes
//   kReset:       [error code: 4 bytes big-endian]
//   kClose:       stream_id 0, [error code: 4 bytes big-endian][reason: UTF-8]
class MuxCodec {
 public:
  // Serialize a frame to bytes.
  static std::vector<std::uint8_t> encode(const MuxFrame& frame);

  // Parse a fixed-size header. Returns nullopt on an unknown kind or an
  // oversized length.
  static std::optional<FrameHeader> decode_header(std::span<const std::uint8_t> data);

  // Parse a complete frame. Returns nullopt on malformed input.
  static std::optional<MuxFrame> decode(std::span<const std::uint8_t> data);

  static std::optional<std::uint32_t> decode_reset_code(std::span<const std::uint8_t> payload);
  static std::optional<CloseInfo> decode_close(std::span<const std::uint8_t> payload);

  static constexpr std::size_t kHeaderSize = 1 + 8 + 4;  // 13 bytes
  static constexpr std::size_t kMaxPayloadSize = 64 * 1024;
  static constexpr std::size_t kMaxCloseReasonSize = 1024;
};

// Helpers to create each frame kind.
MuxFrame make_open_frame(std::uint64_t stream_id);

MuxFrame make_data_frame(std::uint64_t stream_id, std::span<const std::uint8_t> payload);

MuxFrame make_fin_frame(std::uint64_t stream_id);

MuxFrame make_reset_frame(std::uint64_t stream_id, std::uint32_t code);

MuxFrame make_close_frame(std::uint32_t code, std::string_view reason);

}  // namespace nodelink::mux
