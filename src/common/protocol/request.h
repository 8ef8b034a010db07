#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

namespace nodelink::protocol {

// A runtime request carried in one node message.
//
// Encoded as MessagePack in externally tagged form: a unit request is the bare
// string `kind`; any other request is a single-entry map `{kind: body}`.
struct Request {
  std::string kind;
  // Null for a unit request.
  nlohmann::json body;

  [[nodiscard]] bool is_unit() const noexcept { return body.is_null(); }
};

// A node's answer to one request, sent length-prefixed on the stream the
// request arrived on.
// Wire format: [message_id: 8 bytes little-endian][encoded Request]
struct Reply {
  std::uint64_t message_id{0};
  Request body;
};

std::vector<std::uint8_t> encode_request(const Request& request);

// Fails with FramingErrc::kDecodeFailed on malformed MessagePack or on a value
// that is neither a string nor a single-entry map.
std::optional<Request> decode_request(std::span<const std::uint8_t> data, std::error_code& ec);

std::vector<std::uint8_t> encode_reply(const Reply& reply);
std::optional<Reply> decode_reply(std::span<const std::uint8_t> data, std::error_code& ec);

}  // namespace nodelink::protocol
