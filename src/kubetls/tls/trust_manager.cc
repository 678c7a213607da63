#include "kubetls/tls/trust_manager.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include "absl/strings/str_cat.h"
#include "kubetls/error/tls_error.h"

namespace kubetls {
namespace tls {

TrustManager::TrustManager(std::shared_ptr<const keystore::KeyStore> truststore)
                : truststore_(std::move(truststore)),
                  anchors_(truststore_->TrustAnchors()) {}

void TrustManager::Install(asio::ssl::context& ctx) const {
  X509_STORE* store = SSL_CTX_get_cert_store(ctx.native_handle());
  if (store == nullptr)
    throw CryptoProviderError("TLS context has no certificate store");

  for (const auto& anchor : anchors_) {
    if (X509_STORE_add_cert(store, anchor.native_handle()) == 1)
      continue;
    // Two aliases may hold the same CA certificate.
    unsigned long err = ERR_peek_last_error();
    if (ERR_GET_LIB(err) == ERR_LIB_X509 &&
        ERR_GET_REASON(err) == X509_R_CERT_ALREADY_IN_HASH_TABLE) {
      ERR_clear_error();
      continue;
    }
    throw CryptoProviderError(
        absl::StrCat("trust anchor '", anchor.SubjectName(), "' rejected"));
  }

  boost::system::error_code ec;
  ctx.set_verify_mode(asio::ssl::verify_peer, ec);
  if (ec) {
    throw CryptoProviderError(
        absl::StrCat("cannot enable peer verification: ", ec.message()));
  }
}

}  // namespace tls
}  // namespace kubetls
