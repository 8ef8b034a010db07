#include "transport/endpoint/address.h"

#include <charconv>
#include <cstdint>
#include <string>

#include "common/errors/error.h"

namespace nodelink::transport {

std::optional<boost::asio::ip::tcp::endpoint> parse_address(std::string_view text,
                                                            std::error_code& ec) {
  const auto colon = text.rfind(':');
  if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size()) {
    ec = TransportErrc::kInvalidAddress;
    return std::nullopt;
  }

  std::string_view host = text.substr(0, colon);
  const std::string_view port_text = text.substr(colon + 1);
  if (host.front() == '[') {
    if (host.size() < 3 || host.back() != ']') {
      ec = TransportErrc::kInvalidAddress;
      return std::nullopt;
    }
    host = host.substr(1, host.size() - 2);
  }

  std::uint16_t port = 0;
  const auto [end, parse_ec] =
      std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
  if (parse_ec != std::errc() || end != port_text.data() + port_text.size()) {
    ec = TransportErrc::kInvalidAddress;
    return std::nullopt;
  }

  boost::system::error_code bec;
  const auto address = boost::asio::ip::make_address(std::string(host), bec);
  if (bec) {
    ec = TransportErrc::kInvalidAddress;
    return std::nullopt;
  }

  ec.clear();
  return boost::asio::ip::tcp::endpoint(address, port);
}

}  // namespace nodelink::transport
