#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "server/message_dispatcher.h"

namespace nodelink::node {

// Logs every request and answers it with a unit "Ack" reply carrying the
// request's message id.
class AckDispatcher final : public server::MessageDispatcher {
 public:
  explicit AckDispatcher(std::string node_name);

  boost::asio::awaitable<void> handle(mux::SendStream& send, std::uint64_t message_id,
                                      protocol::Request request) override;

  [[nodiscard]] std::uint64_t handled() const noexcept { return handled_.load(); }

 private:
  std::string node_name_;
  std::atomic<std::uint64_t> handled_{0};
};

}  // namespace nodelink::node
