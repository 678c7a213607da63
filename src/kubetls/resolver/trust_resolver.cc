#include "kubetls/resolver/trust_resolver.h"

#include "absl/strings/str_format.h"
#include "kubetls/log/log_adapter.h"
#include "kubetls/util/byte_source.h"

namespace kubetls {
namespace resolver {

std::optional<size_t> AddExplicitTrustAnchors(
    const config::ClientTlsConfig& cfg, keystore::KeyStore& truststore) {
  auto bundle = util::ResolveByteSource(cfg.ca_cert_data, cfg.ca_cert_file);
  if (!bundle)
    return std::nullopt;
  return truststore.LoadPemBundle(*bundle);
}

keystore::KeyStore ResolveTrustStore(const config::ClientTlsConfig& cfg,
                                     DefaultStoreResolver& defaults) {
  keystore::KeyStore truststore;
  if (auto added = AddExplicitTrustAnchors(cfg, truststore)) {
    KUBETLS_LOG_DEBUG(
        absl::StrFormat("trusting %d configured CA certificate(s)", *added));
    return truststore;
  }
  return *defaults.DefaultTrustStore();
}

}  // namespace resolver
}  // namespace kubetls
