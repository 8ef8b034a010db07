#include "common/errors/error.h"

#include <string>

namespace nodelink {

namespace {

class IdentityCategory : public std::error_category {
 public:
  const char* name() const noexcept override { return "nodelink.identity"; }

  std::string message(int value) const override {
    switch (static_cast<IdentityErrc>(value)) {
      case IdentityErrc::kCaCertificateMissing:
        return "CA certificate: no PEM item found";
      case IdentityErrc::kCaCertificateInvalid:
        return "CA certificate: not a valid X.509 certificate";
      case IdentityErrc::kCertificateMissing:
        return "node certificate: no PEM item found";
      case IdentityErrc::kCertificateInvalid:
        return "node certificate: not a valid X.509 certificate";
      case IdentityErrc::kPrivateKeyMissing:
        return "private key: no PEM item found";
      case IdentityErrc::kPrivateKeyInvalid:
        return "private key: not a valid PKCS#8 private key";
      case IdentityErrc::kPrivateKeyMismatch:
        return "private key does not match the node certificate";
      case IdentityErrc::kCertificateUntrusted:
        return "node certificate is not issued by the CA certificate";
      case IdentityErrc::kTlsContextFailed:
        return "failed to build TLS context";
    }
    return "unknown identity error";
  }
};

class TransportCategory : public std::error_category {
 public:
  const char* name() const noexcept override { return "nodelink.transport"; }

  std::string message(int value) const override {
    switch (static_cast<TransportErrc>(value)) {
      case TransportErrc::kLocallyClosed:
        return "connection closed locally";
      case TransportErrc::kPeerClosed:
        return "connection closed by peer";
      case TransportErrc::kConnectionLost:
        return "connection lost";
      case TransportErrc::kProtocolViolation:
        return "peer violated the multiplexing protocol";
      case TransportErrc::kStreamFinished:
        return "stream finished by peer";
      case TransportErrc::kStreamReset:
        return "stream reset";
      case TransportErrc::kStreamRefused:
        return "stream refused by peer";
      case TransportErrc::kStreamLimitReached:
        return "stream limit reached";
      case TransportErrc::kWriteAfterFinish:
        return "write on a finished stream";
      case TransportErrc::kHandshakeFailed:
        return "TLS handshake failed";
      case TransportErrc::kEndpointClosed:
        return "endpoint closed";
      case TransportErrc::kInvalidAddress:
        return "invalid socket address";
    }
    return "unknown transport error";
  }
};

class FramingCategory : public std::error_category {
 public:
  const char* name() const noexcept override { return "nodelink.framing"; }

  std::string message(int value) const override {
    switch (static_cast<FramingErrc>(value)) {
      case FramingErrc::kTruncatedHeader:
        return "failed to read chunk header";
      case FramingErrc::kTruncatedPayload:
        return "failed to read chunk payload";
      case FramingErrc::kChunkOverflow:
        return "chunk data exceeds declared message size";
      case FramingErrc::kMessageTooLarge:
        return "message size exceeds the configured maximum";
      case FramingErrc::kDecodeFailed:
        return "failed to deserialize request";
    }
    return "unknown framing error";
  }
};

class NodeCategory : public std::error_category {
 public:
  const char* name() const noexcept override { return "nodelink.node"; }

  std::string message(int value) const override {
    switch (static_cast<NodeErrc>(value)) {
      case NodeErrc::kConnectFailed:
        return "failed to connect";
      case NodeErrc::kServerExited:
        return "node server exited";
      case NodeErrc::kInvalidConfig:
        return "invalid configuration";
    }
    return "unknown node error";
  }
};

}  // namespace

const std::error_category& identity_category() noexcept {
  static const IdentityCategory category;
  return category;
}

const std::error_category& transport_category() noexcept {
  static const TransportCategory category;
  return category;
}

const std::error_category& framing_category() noexcept {
  static const FramingCategory category;
  return category;
}

const std::error_category& node_category() noexcept {
  static const NodeCategory category;
  return category;
}

std::error_code make_error_code(IdentityErrc e) noexcept {
  return {static_cast<int>(e), identity_category()};
}

std::error_code make_error_code(TransportErrc e) noexcept {
  return {static_cast<int>(e), transport_category()};
}

std::error_code make_error_code(FramingErrc e) noexcept {
  return {static_cast<int>(e), framing_category()};
}

std::error_code make_error_code(NodeErrc e) noexcept {
  return {static_cast<int>(e), node_category()};
}

}  // namespace nodelink
