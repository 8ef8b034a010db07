#pragma once

#include <system_error>

namespace nodelink {

// Credential ingestion and TLS context construction. All of these are fatal
// startup conditions.
enum class IdentityErrc {
  kCaCertificateMissing = 1,
  kCaCertificateInvalid,
  kCertificateMissing,
  kCertificateInvalid,
  kPrivateKeyMissing,
  kPrivateKeyInvalid,
  kPrivateKeyMismatch,
  kCertificateUntrusted,
  kTlsContextFailed,
};

// Multiplexed connection and stream conditions.
enum class TransportErrc {
  kLocallyClosed = 1,
  kPeerClosed,
  kConnectionLost,
  kProtocolViolation,
  kStreamFinished,
  kStreamReset,
  kStreamRefused,
  kStreamLimitReached,
  kWriteAfterFinish,
  kHandshakeFailed,
  kEndpointClosed,
  kInvalidAddress,
};

// Chunk protocol and message-level conditions.
enum class FramingErrc {
  kTruncatedHeader = 1,
  kTruncatedPayload,
  kChunkOverflow,
  kMessageTooLarge,
  kDecodeFailed,
};

// Node-level outcomes reported to callers.
enum class NodeErrc {
  kConnectFailed = 1,
  kServerExited,
  kInvalidConfig,
};

const std::error_category& identity_category() noexcept;
const std::error_category& transport_category() noexcept;
const std::error_category& framing_category() noexcept;
const std::error_category& node_category() noexcept;

std::error_code make_error_code(IdentityErrc e) noexcept;
std::error_code make_error_code(TransportErrc e) noexcept;
std::error_code make_error_code(FramingErrc e) noexcept;
std::error_code make_error_code(NodeErrc e) noexcept;

}  // namespace nodelink

namespace std {
template <>
struct is_error_code_enum<nodelink::IdentityErrc> : true_type {};
template <>
struct is_error_code_enum<nodelink::TransportErrc> : true_type {};
template <>
struct is_error_code_enum<nodelink::FramingErrc> : true_type {};
template <>
struct is_error_code_enum<nodelink::NodeErrc> : true_type {};
}  // namespace std
