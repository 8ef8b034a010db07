#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace nodelink::mux {

enum class FrameKind : std::uint8_t { kOpen = 1, kData = 2, kFin = 3, kReset = 4, kClose = 5 };

// Which side of the link initiated a stream or plays a role in the handshake.
enum class Role : std::uint8_t { kClient = 0, kServer = 1 };

enum class StreamDirection : std::uint8_t { kBidirectional = 0, kUnidirectional = 1 };

// Stream ids carry their initiator in bit 0 and their direction in bit 1, so
// both sides allocate ids without coordination.
constexpr std::uint64_t make_stream_id(std::uint64_t index, Role initiator,
                                       StreamDirection direction) {
  return (index << 2) | (initiator == Role::kServer ? 0x1U : 0x0U) |
         (direction == StreamDirection::kUnidirectional ? 0x2U : 0x0U);
}

constexpr Role stream_initiator(std::uint64_t stream_id) {
  return (stream_id & 0x1U) != 0 ? Role::kServer : Role::kClient;
}

constexpr StreamDirection stream_direction(std::uint64_t stream_id) {
  return (stream_id & 0x2U) != 0 ? StreamDirection::kUnidirectional
                                 : StreamDirection::kBidirectional;
}

struct FrameHeader {
  FrameKind kind{};
  std::uint64_t stream_id{0};
  std::uint32_t length{0};
};

struct MuxFrame {
  FrameKind kind{};
  std::uint64_t stream_id{0};
  std::vector<std::uint8_t> payload;
};

// Decoded CLOSE payload.
struct CloseInfo {
  std::uint32_t code{0};
  std::string reason;
};

}  // namespace nodelink::mux
