#include "transport/mux/stream.h"

#include <algorithm>
#include <cstring>
#include <utility>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "common/errors/error.h"
#include "transport/mux/connection.h"

namespace nodelink::mux {

namespace detail {

namespace {
// Shift consumed bytes out once they dominate the buffer.
constexpr std::size_t kCompactThreshold = 64 * 1024;
}  // namespace

AsyncSignal::AsyncSignal(const boost::asio::any_io_executor& executor)
    : timer_(executor, boost::asio::steady_timer::time_point::max()) {}

boost::asio::awaitable<void> AsyncSignal::wait() {
  boost::system::error_code ignored;
  co_await timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ignored));
}

void AsyncSignal::notify() { timer_.cancel(); }

StreamState::StreamState(std::uint64_t stream_id, bool local,
                         const boost::asio::any_io_executor& executor)
    : id(stream_id),
      direction(stream_direction(stream_id)),
      locally_initiated(local),
      readable(executor),
      writable(executor) {}

void StreamState::consume(std::span<std::uint8_t> out) noexcept {
  std::memcpy(out.data(), recv_buffer.data() + recv_offset, out.size());
  recv_offset += out.size();
  if (recv_offset == recv_buffer.size()) {
    recv_buffer.clear();
    recv_offset = 0;
  } else if (recv_offset >= kCompactThreshold && recv_offset * 2 >= recv_buffer.size()) {
    recv_buffer.erase(recv_buffer.begin(),
                      recv_buffer.begin() + static_cast<std::ptrdiff_t>(recv_offset));
    recv_offset = 0;
  }
}

StreamGuard::StreamGuard(std::shared_ptr<Connection> connection,
                         std::shared_ptr<StreamState> state)
    : connection_(std::move(connection)), state_(std::move(state)) {}

StreamGuard::~StreamGuard() { connection_->stream_dropped(std::move(state_)); }

}  // namespace detail

SendStream::SendStream(std::shared_ptr<Connection> connection,
                       std::shared_ptr<detail::StreamState> state,
                       std::shared_ptr<detail::StreamGuard> guard)
    : connection_(std::move(connection)), state_(std::move(state)), guard_(std::move(guard)) {}

std::uint64_t SendStream::id() const noexcept { return state_ ? state_->id : 0; }

boost::asio::awaitable<void> SendStream::write_all(std::span<const std::uint8_t> data,
                                                   std::error_code& ec) {
  if (!state_) {
    ec = TransportErrc::kStreamReset;
    co_return;
  }
  auto connection = connection_;
  auto state = state_;
  auto op = [connection, state, data, &ec]() { return connection->stream_write(state, data, ec); };
  co_await connection->on_strand<void>(std::move(op));
}

boost::asio::awaitable<void> SendStream::finish(std::error_code& ec) {
  if (!state_) {
    ec = TransportErrc::kStreamReset;
    co_return;
  }
  auto connection = connection_;
  auto state = state_;
  auto op = [connection, state, &ec]() { return connection->stream_finish(state, ec); };
  co_await connection->on_strand<void>(std::move(op));
}

void SendStream::reset(std::uint32_t code) {
  if (state_) {
    connection_->stream_reset(state_, code);
  }
}

RecvStream::RecvStream(std::shared_ptr<Connection> connection,
                       std::shared_ptr<detail::StreamState> state,
                       std::shared_ptr<detail::StreamGuard> guard)
    : connection_(std::move(connection)), state_(std::move(state)), guard_(std::move(guard)) {}

std::uint64_t RecvStream::id() const noexcept { return state_ ? state_->id : 0; }

boost::asio::awaitable<std::size_t> RecvStream::read_some(std::span<std::uint8_t> out,
                                                          std::error_code& ec) {
  if (!state_) {
    ec = TransportErrc::kStreamReset;
    co_return 0;
  }
  auto connection = connection_;
  auto state = state_;
  auto op = [connection, state, out, &ec]() {
    return connection->stream_read_some(state, out, ec);
  };
  co_return co_await connection->on_strand<std::size_t>(std::move(op));
}

boost::asio::awaitable<void> RecvStream::read_exact(std::span<std::uint8_t> out,
                                                    std::error_code& ec) {
  std::size_t filled = 0;
  while (filled < out.size()) {
    const auto count = co_await read_some(out.subspan(filled), ec);
    if (ec) {
      co_return;
    }
    filled += count;
  }
  ec.clear();
}

}  // namespace nodelink::mux
