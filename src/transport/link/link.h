#pragma once

#include <string>
#include <system_error>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/strand.hpp>

namespace nodelink::transport {

// Every connection is pinned to one strand: its socket, its reader task and
// the tasks of all its streams.
using Strand = boost::asio::strand<boost::asio::any_io_executor>;

/**
 * An established, ordered and reliable byte pipe to one peer. The mux layer
 * runs its frames over a Link without knowing how the bytes are protected.
 *
 * At most one read and one write may be outstanding at a time, and both must
 * be started from the link's strand.
 */
class Link {
 public:
  virtual ~Link() = default;

  virtual boost::asio::awaitable<void> read_exact(boost::asio::mutable_buffer buffer,
                                                  std::error_code& ec) = 0;

  virtual boost::asio::awaitable<void> write_all(boost::asio::const_buffer buffer,
                                                 std::error_code& ec) = 0;

  // Abort outstanding operations and release the socket.
  virtual void close() = 0;

  // "address:port" of the peer, captured when the link was established.
  virtual const std::string& remote_address() const = 0;
};

}  // namespace nodelink::transport
