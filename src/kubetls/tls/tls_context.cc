#include "kubetls/tls/tls_context.h"

#include <stdexcept>

namespace kubetls {
namespace tls {

TlsContext::TlsContext(std::shared_ptr<asio::ssl::context> ctx,
                       std::shared_ptr<const KeyManager> key_manager,
                       std::shared_ptr<const TrustManager> trust_manager)
                : ctx_(std::move(ctx)),
                  key_manager_(std::move(key_manager)),
                  trust_manager_(std::move(trust_manager)) {
  if (!ctx_ || !key_manager_ || !trust_manager_) {
    throw std::invalid_argument(
        "TlsContext: context, key manager and trust manager are required.");
  }
}

}  // namespace tls
}  // namespace kubetls
