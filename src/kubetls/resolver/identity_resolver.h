#pragma once

#include <optional>
#include <string>

#include "kubetls/config/client_tls_config.h"
#include "kubetls/keystore/key_store.h"

namespace kubetls {
namespace resolver {

// Adds the configured client identity to `keystore`. Returns its alias, or
// nullopt when the key or the certificate is not configured; in that case
// nothing is read and nothing is added.
std::optional<std::string> ResolveClientIdentity(
    const config::ClientTlsConfig& cfg, keystore::KeyStore& keystore);

}  // namespace resolver
}  // namespace kubetls
