#pragma once

#include <string>
#include <variant>

#include "kubetls/crypto/openssl_types.h"

namespace kubetls {
namespace pem {

// Unencrypted private key block; `der` is the decoded body.
struct PemKeyPair {
  std::string label;
  std::string der;
};

// Certificate block found where a key was expected.
struct PemCertificateHolder {
  std::string label;
  std::string der;
};

// Anything else: CSR, public key, encrypted key, no PEM at all.
struct PemUnsupportedObject {
  std::string kind;
};

using PemObject =
    std::variant<PemKeyPair, PemCertificateHolder, PemUnsupportedObject>;

// Private key converted to OpenSSL's native representation; public
// material is part of the EVP_PKEY.
struct ParsedKeyPair {
  std::string label;
  crypto::PrivateKeyPtr private_key;
};

}  // namespace pem
}  // namespace kubetls
