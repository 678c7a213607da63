#pragma once

#include <memory>
#include <string>

#include "kubetls/config/system_store_config.h"
#include "kubetls/keystore/key_store.h"
#include "kubetls/util/lazy_value.h"

namespace kubetls {
namespace resolver {

// Loads the default keystore and truststore at most once each and hands
// out the same immutable stores afterwards.
class DefaultStoreResolver {
 public:
  explicit DefaultStoreResolver(config::SystemStoreConfig cfg);

  DefaultStoreResolver(const DefaultStoreResolver&)            = delete;
  DefaultStoreResolver& operator=(const DefaultStoreResolver&) = delete;

  // `keystore_file` as PKCS#12, or an empty store.
  std::shared_ptr<const keystore::KeyStore> DefaultKeyStore();

  // First of: `truststore_file`, `<security_directory>/cert.pem`,
  // `standard_ca_bundle`. Throws IoError when the chosen file is missing.
  std::shared_ptr<const keystore::KeyStore> DefaultTrustStore();

  // File DefaultTrustStore() loads from, probed now.
  std::string TrustStorePath() const;

  const config::SystemStoreConfig& config() const { return cfg_; }

  // Process-wide instance configured from the environment.
  static DefaultStoreResolver& Process();

 private:
  keystore::KeyStore LoadKeyStore() const;
  keystore::KeyStore LoadTrustStore() const;

  const config::SystemStoreConfig cfg_;
  util::LazyValue<keystore::KeyStore> keystore_;
  util::LazyValue<keystore::KeyStore> truststore_;
};

}  // namespace resolver
}  // namespace kubetls
