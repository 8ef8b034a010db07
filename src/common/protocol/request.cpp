#include "common/protocol/request.h"

#include "common/errors/error.h"

using json = nlohmann::json;

namespace nodelink::protocol {

std::vector<std::uint8_t> encode_request(const Request& request) {
  if (request.is_unit()) {
    return json::to_msgpack(json(request.kind));
  }
  json tagged = json::object();
  tagged[request.kind] = request.body;
  return json::to_msgpack(tagged);
}

std::optional<Request> decode_request(std::span<const std::uint8_t> data, std::error_code& ec) {
  const auto* begin = data.data();
  const auto* end = begin + data.size();
  const json value = json::from_msgpack(begin, end, /*strict=*/true, /*allow_exceptions=*/false);
  if (value.is_discarded()) {
    ec = FramingErrc::kDecodeFailed;
    return std::nullopt;
  }

  if (value.is_string()) {
    ec.clear();
    return Request{value.get<std::string>(), nullptr};
  }
  if (value.is_object() && value.size() == 1) {
    const auto it = value.begin();
    ec.clear();
    return Request{it.key(), it.value()};
  }

  ec = FramingErrc::kDecodeFailed;
  return std::nullopt;
}

std::vector<std::uint8_t> encode_reply(const Reply& reply) {
  std::vector<std::uint8_t> out;
  for (int i = 0; i < 8; ++i) {
    out.push_back(static_cast<std::uint8_t>(reply.message_id >> (8 * i)));
  }
  const auto body = encode_request(reply.body);
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

std::optional<Reply> decode_reply(std::span<const std::uint8_t> data, std::error_code& ec) {
  if (data.size() < 8) {
    ec = FramingErrc::kDecodeFailed;
    return std::nullopt;
  }
  Reply reply;
  for (int i = 7; i >= 0; --i) {
    reply.message_id = (reply.message_id << 8) | data[static_cast<std::size_t>(i)];
  }
  auto body = decode_request(data.subspan(8), ec);
  if (!body) {
    return std::nullopt;
  }
  reply.body = std::move(*body);
  return reply;
}

}  // namespace nodelink::protocol
