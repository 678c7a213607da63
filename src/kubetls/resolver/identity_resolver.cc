#include "kubetls/resolver/identity_resolver.h"

#include <vector>

#include "absl/strings/str_format.h"
#include "kubetls/log/log_adapter.h"
#include "kubetls/pem/pem_decoder.h"
#include "kubetls/util/byte_source.h"

namespace kubetls {
namespace resolver {

std::optional<std::string> ResolveClientIdentity(
    const config::ClientTlsConfig& cfg, keystore::KeyStore& keystore) {
  const bool has_key  = cfg.client_key_data || cfg.client_key_file;
  const bool has_cert = cfg.client_cert_data || cfg.client_cert_file;
  if (!has_key || !has_cert) {
    // Client certificates are optional, a half-configured pair is not an
    // error.
    if (has_key != has_cert) {
      KUBETLS_LOG_WARNING(absl::StrFormat(
          "client %s configured without a client %s; connecting without a "
          "client certificate",
          has_key ? "key" : "certificate", has_key ? "certificate" : "key"));
    }
    return std::nullopt;
  }

  auto key_bytes  = util::ResolveByteSource(cfg.client_key_data,
                                            cfg.client_key_file);
  auto cert_bytes = util::ResolveByteSource(cfg.client_cert_data,
                                            cfg.client_cert_file);

  pem::ParsedKeyPair key_pair = pem::DecodePrivateKey(*key_bytes);
  std::vector<crypto::X509Certificate> chain{
      pem::DecodeCertificate(*cert_bytes)};

  std::string alias = keystore.AddIdentity(
      key_pair.private_key, cfg.client_key_pass.value_or(""),
      std::move(chain));
  KUBETLS_LOG_DEBUG(absl::StrFormat("client identity '%s' (%s)", alias,
                                    key_pair.label));
  return alias;
}

}  // namespace resolver
}  // namespace kubetls
