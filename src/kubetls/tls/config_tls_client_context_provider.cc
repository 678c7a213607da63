#include "kubetls/tls/config_tls_client_context_provider.h"

namespace kubetls {
namespace tls {
ConfigTlsClientContextProvider::ConfigTlsClientContextProvider(
    const config::ClientTlsConfig& cfg, const TlsContextBuilder& builder)
                : tls_(builder.Build(cfg)) {}

std::shared_ptr<asio::ssl::context>
ConfigTlsClientContextProvider::GetContext() const {
  return tls_.GetContext();
}

bool ConfigTlsClientContextProvider::OffersClientCertificate() const {
  return tls_.HasClientIdentity();
}
}  // namespace tls
}  // namespace kubetls
