#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "transport/framing/chunk_codec.h"

namespace nodelink::framing {

struct CompletedMessage {
  std::uint64_t message_id{0};
  std::vector<std::uint8_t> payload;
};

/**
 * Collects the chunks of the messages in flight on one stream, keyed by
 * message id, and hands out each message once its declared size is reached.
 *
 * The first chunk of a message fixes its declared size; the size carried by
 * later chunks is ignored. Chunk ids are not inspected.
 *
 * Not thread-safe: owned by the task that reads the stream.
 */
class ReassemblyBuffer {
 public:
  // `max_message_size` of 0 accepts any declared size.
  explicit ReassemblyBuffer(std::size_t max_message_size = 0);

  // Adds a chunk. Returns the message it completes, if any.
  // Errors (the entry for the message is dropped):
  //   FramingErrc::kMessageTooLarge - first chunk declares more than the limit
  //   FramingErrc::kChunkOverflow   - chunk would exceed the declared size
  std::optional<CompletedMessage> push(Chunk chunk, std::error_code& ec);

  [[nodiscard]] std::size_t pending_count() const { return pending_.size(); }
  [[nodiscard]] bool has_pending(std::uint64_t message_id) const {
    return pending_.find(message_id) != pending_.end();
  }
  // Bytes held for incomplete messages.
  [[nodiscard]] std::size_t buffered_bytes() const;

 private:
  struct Pending {
    std::size_t declared_size{0};
    std::vector<std::uint8_t> data;
  };

  std::size_t max_message_size_;
  std::unordered_map<std::uint64_t, Pending> pending_;
};

}  // namespace nodelink::framing
