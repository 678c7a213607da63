#pragma once

#include <string>
#include <vector>

#include "kubetls/crypto/x509_certificate.h"
#include "kubetls/pem/pem_object.h"

namespace kubetls {
namespace pem {

inline constexpr char kNoPemObject[]        = "<none>";
inline constexpr char kMalformedPemObject[] = "<malformed PEM>";

// Reads the first PEM block of `bytes` and classifies it by label.
PemObject ReadPemObject(const std::string& bytes);

// Decodes exactly one PEM object into a private key.
// Throws MalformedInputError(kCertificateInKeySlot) for a certificate and
// MalformedInputError(kUnsupportedPemObject) for anything else.
ParsedKeyPair DecodePrivateKey(const std::string& bytes);

// Decodes one certificate, PEM or DER.
// Throws MalformedInputError(kInvalidCertificateBytes).
crypto::X509Certificate DecodeCertificate(const std::string& bytes);

// Decodes every certificate of a PEM bundle (or one DER certificate).
// Blank input yields no certificates.
std::vector<crypto::X509Certificate> DecodeCertificates(
    const std::string& bytes);

}  // namespace pem
}  // namespace kubetls
