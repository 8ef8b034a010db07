#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include "transport/mux/frame.h"

namespace nodelink::mux {

class Connection;

namespace detail {

// Wakes every coroutine currently waiting on it. Waiters re-check their
// condition after waking. Must only be used from the owning strand.
class AsyncSignal {
 public:
  explicit AsyncSignal(const boost::asio::any_io_executor& executor);

  boost::asio::awaitable<void> wait();
  void notify();

 private:
  boost::asio::steady_timer timer_;
};

// Per-stream state. Owned by the connection's stream table and by the stream
// handles; only touched from the connection's strand.
struct StreamState {
  StreamState(std::uint64_t stream_id, bool local, const boost::asio::any_io_executor& executor);

  [[nodiscard]] std::size_t available() const noexcept { return recv_buffer.size() - recv_offset; }
  void consume(std::span<std::uint8_t> out) noexcept;

  std::uint64_t id;
  StreamDirection direction;
  bool locally_initiated;

  std::vector<std::uint8_t> recv_buffer;
  std::size_t recv_offset{0};
  bool fin_received{false};
  bool reset_received{false};
  std::uint32_t reset_code{0};

  bool fin_sent{false};
  bool reset_sent{false};
  bool write_busy{false};

  AsyncSignal readable;
  AsyncSignal writable;
};

// Shared by every handle of one stream. When the last handle goes away the
// connection resets the stream if it is still open and releases its slot.
class StreamGuard {
 public:
  StreamGuard(std::shared_ptr<Connection> connection, std::shared_ptr<StreamState> state);
  ~StreamGuard();

  StreamGuard(const StreamGuard&) = delete;
  StreamGuard& operator=(const StreamGuard&) = delete;

 private:
  std::shared_ptr<Connection> connection_;
  std::shared_ptr<StreamState> state_;
};

}  // namespace detail

// Reset code sent when an inbound stream exceeds the configured capacity.
inline constexpr std::uint32_t kStreamRefusedCode = 0x1;

// The sending half of a stream. A stream stays registered with its connection
// until both directions are done or every handle to it has been destroyed.
class SendStream {
 public:
  SendStream() = default;
  SendStream(std::shared_ptr<Connection> connection, std::shared_ptr<detail::StreamState> state,
             std::shared_ptr<detail::StreamGuard> guard);

  SendStream(const SendStream&) = delete;
  SendStream& operator=(const SendStream&) = delete;
  SendStream(SendStream&&) noexcept = default;
  SendStream& operator=(SendStream&&) noexcept = default;

  // Writes all of `data`. The bytes of one call are contiguous on the stream
  // even when other tasks write to the same stream concurrently.
  boost::asio::awaitable<void> write_all(std::span<const std::uint8_t> data, std::error_code& ec);

  // Signals that no more data will be written.
  boost::asio::awaitable<void> finish(std::error_code& ec);

  // Abandons the stream in both directions.
  void reset(std::uint32_t code);

  [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }
  [[nodiscard]] std::uint64_t id() const noexcept;

 private:
  std::shared_ptr<Connection> connection_;
  std::shared_ptr<detail::StreamState> state_;
  std::shared_ptr<detail::StreamGuard> guard_;
};

// The receiving half of a stream.
class RecvStream {
 public:
  RecvStream() = default;
  RecvStream(std::shared_ptr<Connection> connection, std::shared_ptr<detail::StreamState> state,
             std::shared_ptr<detail::StreamGuard> guard);

  RecvStream(const RecvStream&) = delete;
  RecvStream& operator=(const RecvStream&) = delete;
  RecvStream(RecvStream&&) noexcept = default;
  RecvStream& operator=(RecvStream&&) noexcept = default;

  // Fills `out` completely. Fails with TransportErrc::kStreamFinished if the
  // peer finishes the stream first.
  boost::asio::awaitable<void> read_exact(std::span<std::uint8_t> out, std::error_code& ec);

  // Reads at least one byte unless the stream ended or failed.
  boost::asio::awaitable<std::size_t> read_some(std::span<std::uint8_t> out, std::error_code& ec);

  [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }
  [[nodiscard]] std::uint64_t id() const noexcept;

 private:
  std::shared_ptr<Connection> connection_;
  std::shared_ptr<detail::StreamState> state_;
  std::shared_ptr<detail::StreamGuard> guard_;
};

struct BiStream {
  SendStream send;
  RecvStream recv;
};

}  // namespace nodelink::mux
