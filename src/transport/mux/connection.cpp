#include "transport/mux/connection.h"

#include <algorithm>
#include <array>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>

#include "common/errors/error.h"
#include "common/logging/logger.h"
#include "common/utils/spawn.h"
#include "transport/mux/mux_codec.h"

namespace nodelink::mux {

namespace {
constexpr std::uint32_t kProtocolViolationCode = 0x1;
}  // namespace

std::error_code CloseReason::error() const {
  switch (kind) {
    case Kind::kLocallyClosed:
      return TransportErrc::kLocallyClosed;
    case Kind::kPeerClosed:
      return TransportErrc::kPeerClosed;
    case Kind::kConnectionLost:
      return TransportErrc::kConnectionLost;
    case Kind::kProtocolViolation:
      return TransportErrc::kProtocolViolation;
  }
  return TransportErrc::kConnectionLost;
}

std::string CloseReason::to_string() const {
  std::string text;
  switch (kind) {
    case Kind::kLocallyClosed:
      text = "closed locally";
      break;
    case Kind::kPeerClosed:
      text = "closed by peer";
      break;
    case Kind::kConnectionLost:
      text = "connection lost";
      break;
    case Kind::kProtocolViolation:
      text = "protocol violation";
      break;
  }
  text += " (code " + std::to_string(code) + ")";
  if (!reason.empty()) {
    text += ": " + reason;
  }
  return text;
}

std::shared_ptr<Connection> Connection::create(transport::Strand strand,
                                               std::unique_ptr<transport::Link> link, Role role,
                                               std::string peer_name, TransportConfig config) {
  return std::shared_ptr<Connection>(
      new Connection(std::move(strand), std::move(link), role, std::move(peer_name), config));
}

Connection::Connection(transport::Strand strand, std::unique_ptr<transport::Link> link, Role role,
                       std::string peer_name, TransportConfig config)
    : strand_(std::move(strand)),
      link_(std::move(link)),
      role_(role),
      peer_name_(std::move(peer_name)),
      remote_address_(link_->remote_address()),
      config_(config),
      link_writable_(strand_),
      incoming_(strand_) {}

Connection::~Connection() { LOG_DEBUG("Connection to {} released", remote_address_); }

void Connection::start() {
  boost::asio::post(strand_, [self = shared_from_this()] {
    if (self->started_) {
      return;
    }
    self->started_ = true;
    utils::spawn_task(self->strand_, self->read_loop(), "mux reader " + self->remote_address_);
  });
}

std::optional<CloseReason> Connection::close_reason() const {
  std::lock_guard<std::mutex> lock(close_mutex_);
  return close_reason_;
}

void Connection::close(std::uint32_t code, std::string reason) {
  boost::asio::post(strand_, [self = shared_from_this(), code, reason = std::move(reason)]() mutable {
    self->begin_close(CloseReason{CloseReason::Kind::kLocallyClosed, code, std::move(reason)}, true);
  });
}

void Connection::begin_close(CloseReason reason, bool send_close) {
  if (closed_) {
    return;
  }
  closed_ = true;
  LOG_DEBUG("Connection {} {}", remote_address_, reason.to_string());

  MuxFrame close_frame = make_close_frame(reason.code, reason.reason);
  {
    std::lock_guard<std::mutex> lock(close_mutex_);
    close_reason_ = std::move(reason);
  }
  notify_all();

  if (!send_close) {
    link_->close();
    return;
  }
  auto self = shared_from_this();
  utils::spawn_task(
      strand_,
      [](std::shared_ptr<Connection> conn, MuxFrame frame) -> boost::asio::awaitable<void> {
        std::error_code ec;
        co_await conn->write_frame_unchecked(frame, ec);
        if (ec) {
          LOG_DEBUG("Failed to send CLOSE to {}: {}", conn->remote_address_, ec.message());
        }
        conn->link_->close();
      }(self, std::move(close_frame)),
      "mux close " + remote_address_);
}

void Connection::notify_all() {
  incoming_.notify();
  link_writable_.notify();
  for (auto& [id, state] : streams_) {
    state->readable.notify();
    state->writable.notify();
  }
}

boost::asio::awaitable<void> Connection::read_loop() {
  auto self = shared_from_this();
  std::array<std::uint8_t, MuxCodec::kHeaderSize> header_bytes{};
  std::vector<std::uint8_t> payload;

  while (!closed_) {
    std::error_code ec;
    co_await link_->read_exact(boost::asio::buffer(header_bytes), ec);
    if (ec) {
      if (!closed_) {
        begin_close(CloseReason{CloseReason::Kind::kConnectionLost, 0, ec.message()}, false);
      }
      break;
    }

    auto header = MuxCodec::decode_header(header_bytes);
    if (!header) {
      LOG_WARN("Malformed frame header from {}", remote_address_);
      begin_close(CloseReason{CloseReason::Kind::kProtocolViolation, kProtocolViolationCode,
                              "malformed frame header"},
                  true);
      break;
    }

    payload.resize(header->length);
    if (header->length > 0) {
      co_await link_->read_exact(boost::asio::buffer(payload), ec);
      if (ec) {
        if (!closed_) {
          begin_close(CloseReason{CloseReason::Kind::kConnectionLost, 0, ec.message()}, false);
        }
        break;
      }
    }

    co_await handle_frame(header->kind, header->stream_id, payload);
  }
  LOG_DEBUG("Frame reader for {} finished", remote_address_);
}

boost::asio::awaitable<void> Connection::handle_frame(FrameKind kind, std::uint64_t stream_id,
                                                      std::span<const std::uint8_t> payload) {
  if (closed_) {
    co_return;
  }

  if (kind == FrameKind::kClose) {
    auto info = MuxCodec::decode_close(payload);
    if (!info) {
      begin_close(CloseReason{CloseReason::Kind::kProtocolViolation, kProtocolViolationCode,
                              "malformed CLOSE frame"},
                  false);
      co_return;
    }
    begin_close(CloseReason{CloseReason::Kind::kPeerClosed, info->code, std::move(info->reason)},
                false);
    co_return;
  }

  if (kind == FrameKind::kOpen) {
    co_await handle_open(stream_id);
    co_return;
  }

  auto it = streams_.find(stream_id);
  if (it == streams_.end()) {
    // Released or refused locally; late frames for it are dropped.
    LOG_TRACE("Dropping frame for unknown stream {} from {}", stream_id, remote_address_);
    co_return;
  }
  auto state = it->second;

  switch (kind) {
    case FrameKind::kData:
      if (state->direction == StreamDirection::kUnidirectional && state->locally_initiated) {
        begin_close(CloseReason{CloseReason::Kind::kProtocolViolation, kProtocolViolationCode,
                                "data on a send-only stream"},
                    true);
        co_return;
      }
      if (state->fin_received) {
        begin_close(CloseReason{CloseReason::Kind::kProtocolViolation, kProtocolViolationCode,
                                "data after FIN"},
                    true);
        co_return;
      }
      state->recv_buffer.insert(state->recv_buffer.end(), payload.begin(), payload.end());
      state->readable.notify();
      break;
    case FrameKind::kFin:
      state->fin_received = true;
      state->readable.notify();
      release_if_done(state);
      break;
    case FrameKind::kReset: {
      auto code = MuxCodec::decode_reset_code(payload);
      state->reset_received = true;
      state->reset_code = code.value_or(0);
      state->readable.notify();
      state->writable.notify();
      release(state);
      break;
    }
    case FrameKind::kOpen:
    case FrameKind::kClose:
      break;
  }
}

boost::asio::awaitable<void> Connection::handle_open(std::uint64_t stream_id) {
  if (stream_initiator(stream_id) == role_ || streams_.count(stream_id) != 0) {
    begin_close(CloseReason{CloseReason::Kind::kProtocolViolation, kProtocolViolationCode,
                            "invalid stream id in OPEN"},
                true);
    co_return;
  }

  const bool uni = stream_direction(stream_id) == StreamDirection::kUnidirectional;
  const std::size_t open = uni ? inbound_uni_open_ : inbound_bidi_open_;
  const std::size_t limit =
      uni ? config_.max_concurrent_uni_streams : config_.max_concurrent_bidi_streams;
  if (open >= limit) {
    LOG_DEBUG("Refusing {} stream {} from {}: limit {}", uni ? "unidirectional" : "bidirectional",
              stream_id, remote_address_, limit);
    std::error_code ec;
    co_await write_frame(make_reset_frame(stream_id, kStreamRefusedCode), ec);
    co_return;
  }

  auto state = register_stream(stream_id, false);
  if (uni) {
    ++inbound_uni_open_;
    incoming_uni_.push_back(std::move(state));
  } else {
    ++inbound_bidi_open_;
    incoming_bidi_.push_back(std::move(state));
  }
  incoming_.notify();
}

Connection::StatePtr Connection::register_stream(std::uint64_t stream_id, bool local) {
  auto state = std::make_shared<detail::StreamState>(stream_id, local, strand_);
  streams_.emplace(stream_id, state);
  return state;
}

void Connection::release_if_done(const StatePtr& state) {
  const bool recv_done = state->fin_received || state->reset_received || state->reset_sent;
  const bool send_done = state->fin_sent || state->reset_received || state->reset_sent;
  bool done = false;
  if (state->direction == StreamDirection::kBidirectional) {
    done = recv_done && send_done;
  } else {
    done = state->locally_initiated ? send_done : recv_done;
  }
  if (done) {
    release(state);
  }
}

void Connection::release(const StatePtr& state) {
  if (streams_.erase(state->id) == 0) {
    return;
  }
  if (!state->locally_initiated) {
    if (state->direction == StreamDirection::kUnidirectional) {
      --inbound_uni_open_;
    } else {
      --inbound_bidi_open_;
    }
  }
}

boost::asio::awaitable<void> Connection::write_frame(const MuxFrame& frame, std::error_code& ec) {
  if (closed_) {
    ec = close_reason()->error();
    co_return;
  }
  co_await write_frame_unchecked(frame, ec);
}

boost::asio::awaitable<void> Connection::write_frame_unchecked(const MuxFrame& frame,
                                                               std::error_code& ec) {
  auto self = shared_from_this();
  while (link_write_busy_) {
    co_await link_writable_.wait();
  }
  // Lost the race against close() while waiting; only CLOSE itself may pass.
  if (closed_ && frame.kind != FrameKind::kClose) {
    ec = close_reason()->error();
    co_return;
  }

  link_write_busy_ = true;
  const auto bytes = MuxCodec::encode(frame);
  co_await link_->write_all(boost::asio::buffer(bytes), ec);
  link_write_busy_ = false;
  link_writable_.notify();

  if (ec && !closed_) {
    begin_close(CloseReason{CloseReason::Kind::kConnectionLost, 0, ec.message()}, false);
  }
}

boost::asio::awaitable<std::optional<BiStream>> Connection::open_bi(std::error_code& ec) {
  auto op = [this, &ec]() { return do_open_bi(ec); };
  co_return co_await on_strand<std::optional<BiStream>>(std::move(op));
}

boost::asio::awaitable<std::optional<SendStream>> Connection::open_uni(std::error_code& ec) {
  auto op = [this, &ec]() { return do_open_uni(ec); };
  co_return co_await on_strand<std::optional<SendStream>>(std::move(op));
}

boost::asio::awaitable<std::optional<BiStream>> Connection::accept_bi(std::error_code& ec) {
  auto op = [this, &ec]() { return do_accept_bi(ec); };
  co_return co_await on_strand<std::optional<BiStream>>(std::move(op));
}

boost::asio::awaitable<std::optional<RecvStream>> Connection::accept_uni(std::error_code& ec) {
  auto op = [this, &ec]() { return do_accept_uni(ec); };
  co_return co_await on_strand<std::optional<RecvStream>>(std::move(op));
}

boost::asio::awaitable<std::optional<BiStream>> Connection::do_open_bi(std::error_code& ec) {
  auto self = shared_from_this();
  if (closed_) {
    ec = close_reason()->error();
    co_return std::nullopt;
  }
  const auto id = make_stream_id(next_bidi_index_++, role_, StreamDirection::kBidirectional);
  auto state = register_stream(id, true);
  co_await write_frame(make_open_frame(id), ec);
  if (ec) {
    release(state);
    co_return std::nullopt;
  }
  ec.clear();
  co_return make_bi_stream(state);
}

boost::asio::awaitable<std::optional<SendStream>> Connection::do_open_uni(std::error_code& ec) {
  auto self = shared_from_this();
  if (closed_) {
    ec = close_reason()->error();
    co_return std::nullopt;
  }
  const auto id = make_stream_id(next_uni_index_++, role_, StreamDirection::kUnidirectional);
  auto state = register_stream(id, true);
  co_await write_frame(make_open_frame(id), ec);
  if (ec) {
    release(state);
    co_return std::nullopt;
  }
  ec.clear();
  co_return SendStream(self, state, std::make_shared<detail::StreamGuard>(self, state));
}

boost::asio::awaitable<std::optional<BiStream>> Connection::do_accept_bi(std::error_code& ec) {
  auto self = shared_from_this();
  while (incoming_bidi_.empty()) {
    if (closed_) {
      ec = close_reason()->error();
      co_return std::nullopt;
    }
    co_await incoming_.wait();
  }
  auto state = std::move(incoming_bidi_.front());
  incoming_bidi_.pop_front();
  ec.clear();
  co_return make_bi_stream(state);
}

boost::asio::awaitable<std::optional<RecvStream>> Connection::do_accept_uni(std::error_code& ec) {
  auto self = shared_from_this();
  while (incoming_uni_.empty()) {
    if (closed_) {
      ec = close_reason()->error();
      co_return std::nullopt;
    }
    co_await incoming_.wait();
  }
  auto state = std::move(incoming_uni_.front());
  incoming_uni_.pop_front();
  ec.clear();
  co_return RecvStream(self, state, std::make_shared<detail::StreamGuard>(self, state));
}

std::error_code Connection::stream_send_error(const detail::StreamState& state) const {
  if (state.reset_received) {
    return state.reset_code == kStreamRefusedCode ? TransportErrc::kStreamRefused
                                                  : TransportErrc::kStreamReset;
  }
  if (state.reset_sent) {
    return TransportErrc::kStreamReset;
  }
  if (state.fin_sent) {
    return TransportErrc::kWriteAfterFinish;
  }
  if (closed_) {
    return close_reason()->error();
  }
  return {};
}

boost::asio::awaitable<std::size_t> Connection::stream_read_some(StatePtr state,
                                                                 std::span<std::uint8_t> out,
                                                                 std::error_code& ec) {
  auto self = shared_from_this();
  if (out.empty()) {
    co_return 0;
  }
  while (true) {
    if (state->available() > 0) {
      const auto count = std::min(out.size(), state->available());
      state->consume(out.first(count));
      ec.clear();
      co_return count;
    }
    if (state->reset_received || state->reset_sent) {
      ec = state->reset_received && state->reset_code == kStreamRefusedCode
               ? TransportErrc::kStreamRefused
               : TransportErrc::kStreamReset;
      co_return 0;
    }
    if (state->fin_received) {
      ec = TransportErrc::kStreamFinished;
      co_return 0;
    }
    if (closed_) {
      ec = close_reason()->error();
      co_return 0;
    }
    co_await state->readable.wait();
  }
}

boost::asio::awaitable<void> Connection::stream_write(StatePtr state,
                                                      std::span<const std::uint8_t> data,
                                                      std::error_code& ec) {
  auto self = shared_from_this();
  while (state->write_busy) {
    co_await state->writable.wait();
  }
  ec = stream_send_error(*state);
  if (ec) {
    co_return;
  }

  state->write_busy = true;
  std::size_t offset = 0;
  while (offset < data.size()) {
    const auto count = std::min(MuxCodec::kMaxPayloadSize, data.size() - offset);
    co_await write_frame(make_data_frame(state->id, data.subspan(offset, count)), ec);
    if (!ec) {
      ec = stream_send_error(*state);
    }
    if (ec) {
      break;
    }
    offset += count;
  }
  state->write_busy = false;
  state->writable.notify();
}

boost::asio::awaitable<void> Connection::stream_finish(StatePtr state, std::error_code& ec) {
  auto self = shared_from_this();
  while (state->write_busy) {
    co_await state->writable.wait();
  }
  if (state->fin_sent) {
    ec.clear();
    co_return;
  }
  ec = stream_send_error(*state);
  if (ec) {
    co_return;
  }
  state->fin_sent = true;
  co_await write_frame(make_fin_frame(state->id), ec);
  release_if_done(state);
}

BiStream Connection::make_bi_stream(const StatePtr& state) {
  auto self = shared_from_this();
  auto guard = std::make_shared<detail::StreamGuard>(self, state);
  return BiStream{SendStream(self, state, guard), RecvStream(self, state, guard)};
}

void Connection::stream_reset(StatePtr state, std::uint32_t code) {
  boost::asio::post(strand_, [self = shared_from_this(), state = std::move(state), code] {
    if (state->reset_sent || state->reset_received || self->closed_) {
      return;
    }
    self->send_reset(state, code);
  });
}

void Connection::stream_dropped(StatePtr state) {
  boost::asio::post(strand_, [self = shared_from_this(), state = std::move(state)] {
    if (self->streams_.count(state->id) == 0) {
      return;
    }
    if (self->closed_) {
      self->release(state);
      return;
    }
    LOG_TRACE("Stream {} to {} dropped while open", state->id, self->remote_address_);
    self->send_reset(state, 0);
  });
}

void Connection::send_reset(const StatePtr& state, std::uint32_t code) {
  state->reset_sent = true;
  state->readable.notify();
  state->writable.notify();
  release(state);
  utils::spawn_task(
      strand_,
      [](std::shared_ptr<Connection> conn, std::uint64_t id,
         std::uint32_t reset_code) -> boost::asio::awaitable<void> {
        std::error_code ec;
        co_await conn->write_frame(make_reset_frame(id, reset_code), ec);
      }(shared_from_this(), state->id, code),
      "mux reset");
}

}  // namespace nodelink::mux
