#include "transport/mux/mux_codec.h"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace {

void write_u32(std::vector<std::uint8_t>& out, std::uint32_t value) {
  out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
  out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

void write_u64(std::vector<std::uint8_t>& out, std::uint64_t value) {
  for (int i = 7; i >= 0; --i) {
    out.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
  }
}

std::uint32_t read_u32(std::span<const std::uint8_t> data, std::size_t offset) {
  return (static_cast<std::uint32_t>(data[offset]) << 24) |
         (static_cast<std::uint32_t>(data[offset + 1]) << 16) |
         (static_cast<std::uint32_t>(data[offset + 2]) << 8) |
         static_cast<std::uint32_t>(data[offset + 3]);
}

std::uint64_t read_u64(std::span<const std::uint8_t> data, std::size_t offset) {
  std::uint64_t value = 0;
  for (int i = 0; i < 8; ++i) {
    value = (value << 8) | data[offset + static_cast<std::size_t>(i)];
  }
  return value;
}

bool known_kind(std::uint8_t kind) {
  return kind >= static_cast<std::uint8_t>(nodelink::mux::FrameKind::kOpen) &&
         kind <= static_cast<std::uint8_t>(nodelink::mux::FrameKind::kClose);
}

}  // namespace

namespace nodelink::mux {

std::vector<std::uint8_t> MuxCodec::encode(const MuxFrame& frame) {
  std::vector<std::uint8_t> out;
  out.reserve(kHeaderSize + frame.payload.size());
  out.push_back(static_cast<std::uint8_t>(frame.kind));
  write_u64(out, frame.stream_id);
  write_u32(out, static_cast<std::uint32_t>(frame.payload.size()));
  out.insert(out.end(), frame.payload.begin(), frame.payload.end());
  return out;
}

std::optional<FrameHeader> MuxCodec::decode_header(std::span<const std::uint8_t> data) {
  if (data.size() < kHeaderSize || !known_kind(data[0])) {
    return std::nullopt;
  }
  FrameHeader header;
  header.kind = static_cast<FrameKind>(data[0]);
  header.stream_id = read_u64(data, 1);
  header.length = read_u32(data, 9);
  if (header.length > kMaxPayloadSize) {
    return std::nullopt;
  }
  return header;
}

std::optional<MuxFrame> MuxCodec::decode(std::span<const std::uint8_t> data) {
  auto header = decode_header(data);
  if (!header || data.size() != kHeaderSize + header->length) {
    return std::nullopt;
  }
  MuxFrame frame;
  frame.kind = header->kind;
  frame.stream_id = header->stream_id;
  frame.payload.assign(data.begin() + kHeaderSize, data.end());
  return frame;
}

std::optional<std::uint32_t> MuxCodec::decode_reset_code(std::span<const std::uint8_t> payload) {
  if (payload.size() != 4) {
    return std::nullopt;
  }
  return read_u32(payload, 0);
}

std::optional<CloseInfo> MuxCodec::decode_close(std::span<const std::uint8_t> payload) {
  if (payload.size() < 4 || payload.size() > 4 + kMaxCloseReasonSize) {
    return std::nullopt;
  }
  CloseInfo info;
  info.code = read_u32(payload, 0);
  info.reason.assign(payload.begin() + 4, payload.end());
  return info;
}

MuxFrame make_open_frame(std::uint64_t stream_id) {
  MuxFrame frame{};
  frame.kind = FrameKind::kOpen;
  frame.stream_id = stream_id;
  return frame;
}

MuxFrame make_data_frame(std::uint64_t stream_id, std::span<const std::uint8_t> payload) {
  MuxFrame frame{};
  frame.kind = FrameKind::kData;
  frame.stream_id = stream_id;
  frame.payload.assign(payload.begin(), payload.end());
  return frame;
}

MuxFrame make_fin_frame(std::uint64_t stream_id) {
  MuxFrame frame{};
  frame.kind = FrameKind::kFin;
  frame.stream_id = stream_id;
  return frame;
}

MuxFrame make_reset_frame(std::uint64_t stream_id, std::uint32_t code) {
  MuxFrame frame{};
  frame.kind = FrameKind::kReset;
  frame.stream_id = stream_id;
  write_u32(frame.payload, code);
  return frame;
}

MuxFrame make_close_frame(std::uint32_t code, std::string_view reason) {
  MuxFrame frame{};
  frame.kind = FrameKind::kClose;
  frame.stream_id = 0;
  write_u32(frame.payload, code);
  const auto size = std::min(reason.size(), MuxCodec::kMaxCloseReasonSize);
  frame.payload.insert(frame.payload.end(), reason.begin(), reason.begin() + static_cast<std::ptrdiff_t>(size));
  return frame;
}

}  // namespace nodelink::mux
