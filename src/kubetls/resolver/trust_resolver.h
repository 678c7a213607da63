#pragma once

#include <optional>

#include "kubetls/config/client_tls_config.h"
#include "kubetls/keystore/key_store.h"
#include "kubetls/resolver/default_store_resolver.h"

namespace kubetls {
namespace resolver {

// Adds the explicitly configured CA certificates (inline data, else file)
// to `truststore`. Returns how many were added, or nullopt when no CA input
// is configured.
std::optional<size_t> AddExplicitTrustAnchors(
    const config::ClientTlsConfig& cfg, keystore::KeyStore& truststore);

// Truststore holding exactly the explicit CA certificates, or a copy of
// the default truststore when none are configured.
keystore::KeyStore ResolveTrustStore(const config::ClientTlsConfig& cfg,
                                     DefaultStoreResolver& defaults);

}  // namespace resolver
}  // namespace kubetls
