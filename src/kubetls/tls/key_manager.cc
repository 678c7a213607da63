#include "kubetls/tls/key_manager.h"

#include <openssl/ssl.h>

#include "absl/strings/str_cat.h"
#include "kubetls/error/tls_error.h"

namespace kubetls {
namespace tls {

KeyManager::KeyManager(std::shared_ptr<const keystore::KeyStore> keystore,
                       std::optional<std::string> preferred_alias)
                : keystore_(std::move(keystore)) {
  if (preferred_alias && keystore_->IsKeyEntry(*preferred_alias)) {
    alias_ = std::move(preferred_alias);
    return;
  }
  for (const auto& alias : keystore_->Aliases()) {
    if (keystore_->IsKeyEntry(alias)) {
      alias_ = alias;
      return;
    }
  }
}

void KeyManager::Install(asio::ssl::context& ctx) const {
  if (!alias_)
    return;

  const keystore::PrivateKeyEntry* entry = keystore_->GetKeyEntry(*alias_);
  SSL_CTX* native = ctx.native_handle();

  if (SSL_CTX_use_certificate(native, entry->chain.front().native_handle()) !=
      1) {
    throw CryptoProviderError(
        absl::StrCat("client certificate '", *alias_, "' rejected"));
  }
  if (SSL_CTX_use_PrivateKey(native, entry->private_key.get()) != 1) {
    throw CryptoProviderError(
        absl::StrCat("client private key for '", *alias_, "' rejected"));
  }
  for (size_t i = 1; i < entry->chain.size(); ++i) {
    if (SSL_CTX_add1_chain_cert(native, entry->chain[i].native_handle()) !=
        1) {
      throw CryptoProviderError(
          absl::StrCat("chain certificate ", i, " of '", *alias_,
                       "' rejected"));
    }
  }
  if (SSL_CTX_check_private_key(native) != 1) {
    throw CryptoProviderError(absl::StrCat(
        "client private key does not match certificate '", *alias_, "'"));
  }
}

}  // namespace tls
}  // namespace kubetls
