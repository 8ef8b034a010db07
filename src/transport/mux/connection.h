#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "transport/link/link.h"
#include "transport/mux/frame.h"
#include "transport/mux/stream.h"

namespace nodelink::mux {

// Limits applied to a connection's inbound streams.
struct TransportConfig {
  // Inbound bidirectional streams open at the same time.
  std::size_t max_concurrent_bidi_streams{256};
  // Inbound unidirectional streams open at the same time; 0 refuses them all.
  std::size_t max_concurrent_uni_streams{256};
};

// Why a connection ended.
struct CloseReason {
  enum class Kind { kLocallyClosed, kPeerClosed, kConnectionLost, kProtocolViolation };

  Kind kind{Kind::kLocallyClosed};
  std::uint32_t code{0};
  std::string reason;

  // Error reported to operations attempted after the close.
  [[nodiscard]] std::error_code error() const;
  [[nodiscard]] std::string to_string() const;
};

/**
 * A multiplexed connection to one peer over an established Link.
 *
 * Streams are opened by either side with open_bi()/open_uni() and announced to
 * the other side, where accept_bi()/accept_uni() return them. Each stream is an
 * ordered byte channel; streams are independent of each other.
 *
 * Thread Safety:
 *   All state lives on the connection's strand. Public operations may be
 *   called from any executor; they hop to the strand when needed. Tasks that
 *   run on the strand (see get_executor()) avoid the hop.
 */
class Connection : public std::enable_shared_from_this<Connection> {
 public:
  static std::shared_ptr<Connection> create(transport::Strand strand,
                                            std::unique_ptr<transport::Link> link, Role role,
                                            std::string peer_name, TransportConfig config = {});

  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Starts the frame reader. Must be called once, after create().
  void start();

  [[nodiscard]] const transport::Strand& get_executor() const noexcept { return strand_; }

  boost::asio::awaitable<std::optional<BiStream>> open_bi(std::error_code& ec);
  boost::asio::awaitable<std::optional<SendStream>> open_uni(std::error_code& ec);

  // Waits for the peer to open a stream. Fails with TransportErrc::kLocallyClosed
  // once close() has been called, or with the close error otherwise.
  boost::asio::awaitable<std::optional<BiStream>> accept_bi(std::error_code& ec);
  boost::asio::awaitable<std::optional<RecvStream>> accept_uni(std::error_code& ec);

  // Sends CLOSE with `code` and `reason` and tears the link down. Idempotent.
  void close(std::uint32_t code, std::string reason);

  [[nodiscard]] std::optional<CloseReason> close_reason() const;

  [[nodiscard]] const std::string& remote_address() const noexcept { return remote_address_; }
  [[nodiscard]] const std::string& peer_name() const noexcept { return peer_name_; }
  [[nodiscard]] Role role() const noexcept { return role_; }

 private:
  friend class SendStream;
  friend class RecvStream;
  friend class detail::StreamGuard;

  using StatePtr = std::shared_ptr<detail::StreamState>;

  Connection(transport::Strand strand, std::unique_ptr<transport::Link> link, Role role,
             std::string peer_name, TransportConfig config);

  // Runs `op` on the strand and returns its result to the caller's executor.
  template <typename T, typename Op>
  boost::asio::awaitable<T> on_strand(Op op) {
    if (strand_.running_in_this_thread()) {
      co_return co_await op();
    }
    co_return co_await boost::asio::co_spawn(strand_, std::move(op), boost::asio::use_awaitable);
  }

  boost::asio::awaitable<void> read_loop();
  boost::asio::awaitable<void> handle_frame(FrameKind kind, std::uint64_t stream_id,
                                            std::span<const std::uint8_t> payload);
  boost::asio::awaitable<void> handle_open(std::uint64_t stream_id);

  boost::asio::awaitable<void> write_frame(const MuxFrame& frame, std::error_code& ec);
  boost::asio::awaitable<void> write_frame_unchecked(const MuxFrame& frame, std::error_code& ec);

  boost::asio::awaitable<std::optional<BiStream>> do_open_bi(std::error_code& ec);
  boost::asio::awaitable<std::optional<SendStream>> do_open_uni(std::error_code& ec);
  boost::asio::awaitable<std::optional<BiStream>> do_accept_bi(std::error_code& ec);
  boost::asio::awaitable<std::optional<RecvStream>> do_accept_uni(std::error_code& ec);

  boost::asio::awaitable<std::size_t> stream_read_some(StatePtr state, std::span<std::uint8_t> out,
                                                       std::error_code& ec);
  boost::asio::awaitable<void> stream_write(StatePtr state, std::span<const std::uint8_t> data,
                                            std::error_code& ec);
  boost::asio::awaitable<void> stream_finish(StatePtr state, std::error_code& ec);
  void stream_reset(StatePtr state, std::uint32_t code);
  // Called once the last handle of a stream is gone.
  void stream_dropped(StatePtr state);
  // Strand only. Marks the stream reset, releases it and sends RESET.
  void send_reset(const StatePtr& state, std::uint32_t code);

  BiStream make_bi_stream(const StatePtr& state);

  // Stream-level error for a write or read that cannot proceed, or none.
  std::error_code stream_send_error(const detail::StreamState& state) const;

  StatePtr register_stream(std::uint64_t stream_id, bool local);
  void release_if_done(const StatePtr& state);
  void release(const StatePtr& state);

  // Marks the connection closed, wakes every waiter and closes the link.
  // When `send_close` is set a CLOSE frame is flushed first.
  void begin_close(CloseReason reason, bool send_close);
  void notify_all();

  transport::Strand strand_;
  std::unique_ptr<transport::Link> link_;
  Role role_;
  std::string peer_name_;
  std::string remote_address_;
  TransportConfig config_;

  // Strand-only state.
  bool started_{false};
  bool closed_{false};
  bool link_write_busy_{false};
  std::uint64_t next_bidi_index_{0};
  std::uint64_t next_uni_index_{0};
  std::size_t inbound_bidi_open_{0};
  std::size_t inbound_uni_open_{0};
  std::unordered_map<std::uint64_t, StatePtr> streams_;
  std::deque<StatePtr> incoming_bidi_;
  std::deque<StatePtr> incoming_uni_;
  detail::AsyncSignal link_writable_;
  detail::AsyncSignal incoming_;

  mutable std::mutex close_mutex_;
  std::optional<CloseReason> close_reason_;
};

}  // namespace nodelink::mux
