#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>

#include "kubetls/tls/key_manager.h"
#include "kubetls/tls/trust_manager.h"

namespace kubetls {
namespace tls {
namespace asio = boost::asio;

// A built client TLS context together with the managers and stores it was
// built from. Copies share the same underlying context.
class TlsContext {
 public:
  TlsContext(std::shared_ptr<asio::ssl::context> ctx,
             std::shared_ptr<const KeyManager> key_manager,
             std::shared_ptr<const TrustManager> trust_manager);

  // Attach to an asio::ssl::stream; no further configuration is needed.
  std::shared_ptr<asio::ssl::context> GetContext() const { return ctx_; }

  bool HasClientIdentity() const {
    return key_manager_->ChosenAlias().has_value();
  }

  const KeyManager& key_manager() const { return *key_manager_; }
  const TrustManager& trust_manager() const { return *trust_manager_; }

 private:
  std::shared_ptr<asio::ssl::context> ctx_;
  std::shared_ptr<const KeyManager> key_manager_;
  std::shared_ptr<const TrustManager> trust_manager_;
};

}  // namespace tls
}  // namespace kubetls
