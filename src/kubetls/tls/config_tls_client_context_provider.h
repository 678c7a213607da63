#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>

#include "kubetls/config/client_tls_config.h"
#include "kubetls/tls/tls_context.h"
#include "kubetls/tls/tls_context_builder.h"
#include "kubetls/tls/tls_context_provider.h"

namespace kubetls {
namespace tls {
namespace asio = boost::asio;
// Client context built once, at construction, from cluster configuration.
class ConfigTlsClientContextProvider : public TlsContextProvider {
 public:
  explicit ConfigTlsClientContextProvider(
      const config::ClientTlsConfig& cfg,
      const TlsContextBuilder& builder = TlsContextBuilder());

  std::shared_ptr<asio::ssl::context> GetContext() const override;
  bool OffersClientCertificate() const override;

  const TlsContext& context() const { return tls_; }

 private:
  TlsContext tls_;
};
}  // namespace tls
}  // namespace kubetls
