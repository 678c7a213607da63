#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <vector>

#include "kubetls/keystore/key_store.h"

namespace kubetls {
namespace tls {
namespace asio = boost::asio;

// Verifies servers against the trusted certificates of a truststore and the
// leaf certificates of its key entries.
class TrustManager {
 public:
  explicit TrustManager(std::shared_ptr<const keystore::KeyStore> truststore);

  size_t AnchorCount() const { return anchors_.size(); }
  const keystore::KeyStore& trust_store() const { return *truststore_; }

  // Adds the anchors to the context's X509 store and enables peer
  // verification. Throws CryptoProviderError.
  void Install(asio::ssl::context& ctx) const;

 private:
  std::shared_ptr<const keystore::KeyStore> truststore_;
  std::vector<crypto::X509Certificate> anchors_;
};

}  // namespace tls
}  // namespace kubetls
