#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <boost/asio/ssl/context.hpp>
#include <openssl/evp.h>
#include <openssl/x509.h>

namespace nodelink::tls {

struct X509Deleter {
  void operator()(X509* cert) const noexcept { X509_free(cert); }
};
struct EvpPkeyDeleter {
  void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
};

using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

/**
 * The node's credentials: the cluster CA certificate, the node certificate
 * and its private key.
 *
 * An Identity only exists once all three PEM inputs have parsed to the
 * expected item type, the key matches the certificate and the certificate
 * verifies against the CA. It is immutable afterwards and shared read-only
 * by every endpoint and connection built from it.
 */
class Identity {
 public:
  // Parses and validates the three PEM inputs. Returns nullptr and sets `ec`
  // to an IdentityErrc naming the offending artifact on failure.
  static std::shared_ptr<const Identity> load(std::string_view ca_cert_pem,
                                              std::string_view cert_pem,
                                              std::string_view key_pem, std::error_code& ec);

  Identity(const Identity&) = delete;
  Identity& operator=(const Identity&) = delete;

  // TLS 1.3 client context: trusts only the CA, presents the node certificate.
  // The dialed peer name is verified per connection by the endpoint.
  std::shared_ptr<boost::asio::ssl::context> make_client_context(std::error_code& ec) const;

  // TLS 1.3 server context: presents the node certificate and requires every
  // client to present a certificate issued by the CA.
  std::shared_ptr<boost::asio::ssl::context> make_server_context(std::error_code& ec) const;

  // Subject common name of the node certificate, for logging.
  std::string subject_name() const;

  X509* ca_certificate() const noexcept { return ca_cert_.get(); }
  X509* certificate() const noexcept { return cert_.get(); }

 private:
  Identity(X509Ptr ca_cert, X509Ptr cert, EvpPkeyPtr key);

  bool configure(boost::asio::ssl::context& ctx, std::error_code& ec) const;

  X509Ptr ca_cert_;
  X509Ptr cert_;
  EvpPkeyPtr key_;
};

}  // namespace nodelink::tls
