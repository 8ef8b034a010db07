#pragma once

#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

#include <boost/asio/ip/tcp.hpp>

namespace nodelink::transport {

// Parses "a.b.c.d:port" or "[v6]:port". Host names are not resolved.
std::optional<boost::asio::ip::tcp::endpoint> parse_address(std::string_view text,
                                                            std::error_code& ec);

}  // namespace nodelink::transport
