#include "transport/framing/reassembly_buffer.h"

#include <algorithm>
#include <utility>

#include "common/errors/error.h"
#include "common/logging/logger.h"

namespace nodelink::framing {

namespace {
// Upper bound on memory reserved up front from an untrusted declared size.
constexpr std::size_t kMaxInitialReserve = 1 << 20;
}  // namespace

ReassemblyBuffer::ReassemblyBuffer(std::size_t max_message_size)
    : max_message_size_(max_message_size) {}

std::optional<CompletedMessage> ReassemblyBuffer::push(Chunk chunk, std::error_code& ec) {
  const auto message_id = chunk.header.message_id;
  auto it = pending_.find(message_id);
  if (it == pending_.end()) {
    const std::size_t declared = chunk.header.message_size;
    if (max_message_size_ != 0 && declared > max_message_size_) {
      LOG_WARN("Message {} declares {} bytes, limit is {}", message_id, declared,
               max_message_size_);
      ec = FramingErrc::kMessageTooLarge;
      return std::nullopt;
    }
    Pending entry;
    entry.declared_size = declared;
    entry.data.reserve(std::min(declared, kMaxInitialReserve));
    it = pending_.emplace(message_id, std::move(entry)).first;
  }

  auto& entry = it->second;
  if (chunk.data.size() > entry.declared_size - entry.data.size()) {
    LOG_WARN("Chunk {} of message {} overflows declared size {} ({} + {} bytes)",
             chunk.header.chunk_id, message_id, entry.declared_size, entry.data.size(),
             chunk.data.size());
    pending_.erase(it);
    ec = FramingErrc::kChunkOverflow;
    return std::nullopt;
  }

  if (entry.data.empty()) {
    entry.data = std::move(chunk.data);
  } else {
    entry.data.insert(entry.data.end(), chunk.data.begin(), chunk.data.end());
  }
  ec.clear();

  if (entry.data.size() < entry.declared_size) {
    return std::nullopt;
  }

  CompletedMessage message{message_id, std::move(entry.data)};
  pending_.erase(it);
  LOG_TRACE("Finished collecting message_id={}", message_id);
  return message;
}

std::size_t ReassemblyBuffer::buffered_bytes() const {
  std::size_t total = 0;
  for (const auto& [id, entry] : pending_) {
    total += entry.data.size();
  }
  return total;
}

}  // namespace nodelink::framing
