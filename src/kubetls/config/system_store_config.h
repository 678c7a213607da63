#pragma once

#include <optional>
#include <string>

namespace kubetls {
namespace config {

inline constexpr char kKeyStoreEnv[]           = "KUBETLS_KEYSTORE";
inline constexpr char kKeyStorePasswordEnv[]   = "KUBETLS_KEYSTORE_PASSWORD";
inline constexpr char kTrustStoreEnv[]         = "KUBETLS_TRUSTSTORE";
inline constexpr char kTrustStorePasswordEnv[] = "KUBETLS_TRUSTSTORE_PASSWORD";
inline constexpr char kSecurityDirEnv[]        = "KUBETLS_SECURITY_DIR";
inline constexpr char kCaBundleEnv[]           = "KUBETLS_CA_BUNDLE";

inline constexpr char kDefaultTrustStorePassword[] = "changeit";
inline constexpr char kDefaultCaBundle[] = "/etc/ssl/certs/ca-certificates.crt";
inline constexpr char kAlternateTrustBundleName[] = "cert.pem";

/// Process-wide locations of the default keystore and truststore.
struct SystemStoreConfig {
  // PKCS#12 file holding the default client identity.
  std::optional<std::string> keystore_file;
  std::string keystore_password;

  // PEM bundle or PKCS#12 file replacing the system trust anchors.
  std::optional<std::string> truststore_file;
  std::string truststore_password = kDefaultTrustStorePassword;

  // Directory probed for `cert.pem`; OpenSSL's cert area by default.
  std::string security_directory;
  std::string standard_ca_bundle = kDefaultCaBundle;

  // Defaults overridden by the KUBETLS_* environment variables. Unset and
  // empty variables keep the default.
  static SystemStoreConfig FromEnvironment();
};

}  // namespace config
}  // namespace kubetls
