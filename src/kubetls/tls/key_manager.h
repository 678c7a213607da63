#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <optional>
#include <string>

#include "kubetls/keystore/key_store.h"

namespace kubetls {
namespace tls {
namespace asio = boost::asio;

// Selects the client identity offered during the handshake.
class KeyManager {
 public:
  // Offers `preferred_alias` when it names a key entry, otherwise the first
  // key entry by alias. A keystore without key entries offers nothing.
  explicit KeyManager(std::shared_ptr<const keystore::KeyStore> keystore,
                      std::optional<std::string> preferred_alias = {});

  const std::optional<std::string>& ChosenAlias() const { return alias_; }
  const keystore::KeyStore& key_store() const { return *keystore_; }

  // Loads the chosen key and chain into `ctx`.
  // Throws CryptoProviderError when OpenSSL rejects them.
  void Install(asio::ssl::context& ctx) const;

 private:
  std::shared_ptr<const keystore::KeyStore> keystore_;
  std::optional<std::string> alias_;
};

}  // namespace tls
}  // namespace kubetls
