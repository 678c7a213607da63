#include "kubetls/config/system_store_config.h"

#include <openssl/x509.h>

#include <cstdlib>

namespace kubetls {
namespace config {
namespace {

std::optional<std::string> GetEnv(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0')
    return std::nullopt;
  return std::string(value);
}

}  // namespace

/* STATIC */
SystemStoreConfig SystemStoreConfig::FromEnvironment() {
  SystemStoreConfig cfg;
  cfg.security_directory = X509_get_default_cert_area();

  cfg.keystore_file = GetEnv(kKeyStoreEnv);
  if (auto pass = GetEnv(kKeyStorePasswordEnv))
    cfg.keystore_password = *pass;

  cfg.truststore_file = GetEnv(kTrustStoreEnv);
  if (auto pass = GetEnv(kTrustStorePasswordEnv))
    cfg.truststore_password = *pass;

  if (auto dir = GetEnv(kSecurityDirEnv))
    cfg.security_directory = *dir;
  if (auto bundle = GetEnv(kCaBundleEnv))
    cfg.standard_ca_bundle = *bundle;
  return cfg;
}

}  // namespace config
}  // namespace kubetls
