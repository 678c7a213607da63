#pragma once

#include <optional>
#include <string>

namespace kubetls {
namespace config {

/// TLS-related fields of a cluster client configuration. Inline `*_data`
/// fields hold base64 encoded PEM and win over the matching `*_file` path.
struct ClientTlsConfig {
  std::optional<std::string> client_cert_data;
  std::optional<std::string> client_cert_file;
  std::optional<std::string> client_key_data;
  std::optional<std::string> client_key_file;
  std::optional<std::string> client_key_pass;

  // May decode to several concatenated PEM certificates.
  std::optional<std::string> ca_cert_data;
  std::optional<std::string> ca_cert_file;
};

}  // namespace config
}  // namespace kubetls
