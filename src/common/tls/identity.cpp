#include "common/tls/identity.h"

#include <array>
#include <utility>
#include <vector>

#include <boost/system/system_error.hpp>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509_vfy.h>

#include "common/errors/error.h"
#include "common/logging/logger.h"

namespace nodelink::tls {

namespace {

struct BioDeleter {
  void operator()(BIO* bio) const noexcept { BIO_free(bio); }
};
struct StoreDeleter {
  void operator()(X509_STORE* store) const noexcept { X509_STORE_free(store); }
};
struct StoreCtxDeleter {
  void operator()(X509_STORE_CTX* ctx) const noexcept { X509_STORE_CTX_free(ctx); }
};
struct Pkcs8Deleter {
  void operator()(PKCS8_PRIV_KEY_INFO* info) const noexcept { PKCS8_PRIV_KEY_INFO_free(info); }
};

constexpr const char* kCertificateLabel = "CERTIFICATE";
constexpr const char* kPrivateKeyLabel = "PRIVATE KEY";

struct PemItem {
  std::string label;
  std::vector<unsigned char> der;
};

std::string last_ssl_error() {
  const unsigned long code = ERR_get_error();
  if (code == 0) {
    return "no OpenSSL error";
  }
  std::array<char, 256> buffer{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  ERR_clear_error();
  return buffer.data();
}

// Reads the first PEM block from `pem`. Returns false when there is none.
bool read_first_item(std::string_view pem, PemItem& item) {
  std::unique_ptr<BIO, BioDeleter> bio(
      BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
  if (!bio) {
    return false;
  }

  char* name = nullptr;
  char* header = nullptr;
  unsigned char* data = nullptr;
  long length = 0;
  if (PEM_read_bio(bio.get(), &name, &header, &data, &length) != 1) {
    ERR_clear_error();
    return false;
  }

  item.label = name;
  item.der.assign(data, data + length);
  OPENSSL_free(name);
  OPENSSL_free(header);
  OPENSSL_free(data);
  return true;
}

X509Ptr parse_certificate(std::string_view pem, IdentityErrc missing, IdentityErrc invalid,
                          const char* artifact, std::error_code& ec) {
  PemItem item;
  if (!read_first_item(pem, item)) {
    LOG_ERROR("{}: no PEM item found", artifact);
    ec = missing;
    return nullptr;
  }
  if (item.label != kCertificateLabel) {
    LOG_ERROR("{}: expected a {} PEM item, found {}", artifact, kCertificateLabel, item.label);
    ec = invalid;
    return nullptr;
  }

  const unsigned char* cursor = item.der.data();
  X509Ptr cert(d2i_X509(nullptr, &cursor, static_cast<long>(item.der.size())));
  if (!cert) {
    LOG_ERROR("{}: malformed certificate: {}", artifact, last_ssl_error());
    ec = invalid;
    return nullptr;
  }
  return cert;
}

EvpPkeyPtr parse_private_key(std::string_view pem, std::error_code& ec) {
  PemItem item;
  if (!read_first_item(pem, item)) {
    LOG_ERROR("private key: no PEM item found");
    ec = IdentityErrc::kPrivateKeyMissing;
    return nullptr;
  }
  if (item.label != kPrivateKeyLabel) {
    LOG_ERROR("private key: expected a {} PEM item, found {}", kPrivateKeyLabel, item.label);
    ec = IdentityErrc::kPrivateKeyInvalid;
    return nullptr;
  }

  const unsigned char* cursor = item.der.data();
  std::unique_ptr<PKCS8_PRIV_KEY_INFO, Pkcs8Deleter> info(
      d2i_PKCS8_PRIV_KEY_INFO(nullptr, &cursor, static_cast<long>(item.der.size())));
  OPENSSL_cleanse(item.der.data(), item.der.size());
  if (!info) {
    LOG_ERROR("private key: malformed PKCS#8 structure: {}", last_ssl_error());
    ec = IdentityErrc::kPrivateKeyInvalid;
    return nullptr;
  }

  EvpPkeyPtr key(EVP_PKCS82PKEY(info.get()));
  if (!key) {
    LOG_ERROR("private key: unsupported key: {}", last_ssl_error());
    ec = IdentityErrc::kPrivateKeyInvalid;
    return nullptr;
  }
  return key;
}

bool issued_by(X509* cert, X509* ca_cert) {
  std::unique_ptr<X509_STORE, StoreDeleter> store(X509_STORE_new());
  std::unique_ptr<X509_STORE_CTX, StoreCtxDeleter> ctx(X509_STORE_CTX_new());
  if (!store || !ctx || X509_STORE_add_cert(store.get(), ca_cert) != 1 ||
      X509_STORE_CTX_init(ctx.get(), store.get(), cert, nullptr) != 1) {
    LOG_ERROR("Failed to set up certificate verification: {}", last_ssl_error());
    return false;
  }
  if (X509_verify_cert(ctx.get()) != 1) {
    LOG_ERROR("Node certificate verification failed: {}",
              X509_verify_cert_error_string(X509_STORE_CTX_get_error(ctx.get())));
    ERR_clear_error();
    return false;
  }
  return true;
}

}  // namespace

Identity::Identity(X509Ptr ca_cert, X509Ptr cert, EvpPkeyPtr key)
    : ca_cert_(std::move(ca_cert)), cert_(std::move(cert)), key_(std::move(key)) {}

std::shared_ptr<const Identity> Identity::load(std::string_view ca_cert_pem,
                                               std::string_view cert_pem,
                                               std::string_view key_pem, std::error_code& ec) {
  auto ca_cert = parse_certificate(ca_cert_pem, IdentityErrc::kCaCertificateMissing,
                                   IdentityErrc::kCaCertificateInvalid, "CA certificate", ec);
  if (!ca_cert) {
    return nullptr;
  }
  auto key = parse_private_key(key_pem, ec);
  if (!key) {
    return nullptr;
  }
  auto cert = parse_certificate(cert_pem, IdentityErrc::kCertificateMissing,
                                IdentityErrc::kCertificateInvalid, "node certificate", ec);
  if (!cert) {
    return nullptr;
  }

  if (X509_check_private_key(cert.get(), key.get()) != 1) {
    ERR_clear_error();
    LOG_ERROR("Private key does not match the node certificate");
    ec = IdentityErrc::kPrivateKeyMismatch;
    return nullptr;
  }
  if (!issued_by(cert.get(), ca_cert.get())) {
    ec = IdentityErrc::kCertificateUntrusted;
    return nullptr;
  }

  ec.clear();
  return std::shared_ptr<const Identity>(
      new Identity(std::move(ca_cert), std::move(cert), std::move(key)));
}

bool Identity::configure(boost::asio::ssl::context& ctx, std::error_code& ec) const {
  SSL_CTX* native = ctx.native_handle();
  if (SSL_CTX_set_min_proto_version(native, TLS1_3_VERSION) != 1 ||
      SSL_CTX_use_certificate(native, cert_.get()) != 1 ||
      SSL_CTX_use_PrivateKey(native, key_.get()) != 1 ||
      SSL_CTX_check_private_key(native) != 1 ||
      X509_STORE_add_cert(SSL_CTX_get_cert_store(native), ca_cert_.get()) != 1) {
    LOG_ERROR("Failed to configure TLS context: {}", last_ssl_error());
    ec = IdentityErrc::kTlsContextFailed;
    return false;
  }
  return true;
}

std::shared_ptr<boost::asio::ssl::context> Identity::make_client_context(
    std::error_code& ec) const {
  try {
    auto ctx = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);
    if (!configure(*ctx, ec)) {
      return nullptr;
    }
    ctx->set_verify_mode(boost::asio::ssl::verify_peer);
    ec.clear();
    return ctx;
  } catch (const boost::system::system_error& e) {
    LOG_ERROR("Failed to create TLS client context: {}", e.what());
    ec = IdentityErrc::kTlsContextFailed;
    return nullptr;
  }
}

std::shared_ptr<boost::asio::ssl::context> Identity::make_server_context(
    std::error_code& ec) const {
  try {
    auto ctx = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_server);
    if (!configure(*ctx, ec)) {
      return nullptr;
    }
    if (SSL_CTX_add_client_CA(ctx->native_handle(), ca_cert_.get()) != 1) {
      LOG_ERROR("Failed to advertise client CA: {}", last_ssl_error());
      ec = IdentityErrc::kTlsContextFailed;
      return nullptr;
    }
    ctx->set_verify_mode(boost::asio::ssl::verify_peer |
                         boost::asio::ssl::verify_fail_if_no_peer_cert);
    ec.clear();
    return ctx;
  } catch (const boost::system::system_error& e) {
    LOG_ERROR("Failed to create TLS server context: {}", e.what());
    ec = IdentityErrc::kTlsContextFailed;
    return nullptr;
  }
}

std::string Identity::subject_name() const {
  std::array<char, 256> buffer{};
  const int length = X509_NAME_get_text_by_NID(X509_get_subject_name(cert_.get()),
                                               NID_commonName, buffer.data(),
                                               static_cast<int>(buffer.size()));
  if (length <= 0) {
    return {};
  }
  return std::string(buffer.data(), static_cast<std::size_t>(length));
}

}  // namespace nodelink::tls
