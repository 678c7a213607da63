#include "kubetls/pem/pem_decoder.h"

#include <openssl/err.h>
#include <openssl/pem.h>

#include <memory>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "kubetls/error/tls_error.h"

namespace kubetls {
namespace pem {
namespace {

constexpr char kPemBeginMarker[] = "-----BEGIN";

struct OpenSslFree {
  void operator()(void* p) const { OPENSSL_free(p); }
};
template <typename T>
using OpenSslBuffer = std::unique_ptr<T, OpenSslFree>;

bool IsKeyPairLabel(const std::string& label) {
  return label == PEM_STRING_RSA || label == PEM_STRING_ECPRIVATEKEY ||
         label == PEM_STRING_DSA || label == PEM_STRING_PKCS8INF;
}

bool IsCertificateLabel(const std::string& label) {
  return label == PEM_STRING_X509 || label == PEM_STRING_X509_OLD ||
         label == PEM_STRING_X509_TRUSTED;
}

// PEM_read_bio* fails with PEM_R_NO_START_LINE once the input is exhausted.
bool LastErrorIsEndOfInput() {
  unsigned long err = ERR_peek_last_error();
  return ERR_GET_LIB(err) == ERR_LIB_PEM &&
         ERR_GET_REASON(err) == PEM_R_NO_START_LINE;
}

bool IsBlank(const std::string& bytes) {
  for (char c : bytes) {
    if (!absl::ascii_isspace(c))
      return false;
  }
  return true;
}

int KeyTypeForLabel(const std::string& label) {
  if (label == PEM_STRING_RSA)
    return EVP_PKEY_RSA;
  if (label == PEM_STRING_ECPRIVATEKEY)
    return EVP_PKEY_EC;
  return EVP_PKEY_DSA;
}

crypto::PrivateKeyPtr ConvertKeyPair(const PemKeyPair& kp) {
  const auto* p = reinterpret_cast<const unsigned char*>(kp.der.data());
  long len      = static_cast<long>(kp.der.size());

  EVP_PKEY* pkey = nullptr;
  if (kp.label == PEM_STRING_PKCS8INF) {
    crypto::Pkcs8Ptr p8(d2i_PKCS8_PRIV_KEY_INFO(nullptr, &p, len));
    if (p8)
      pkey = EVP_PKCS82PKEY(p8.get());
  } else {
    pkey = d2i_PrivateKey(KeyTypeForLabel(kp.label), nullptr, &p, len);
  }

  if (pkey == nullptr) {
    std::string ssl_errors = DrainOpenSslErrors();
    throw MalformedInputError(
        MalformedInputReason::kUnsupportedPemObject,
        absl::StrCat("failed to parse the private key: ", kp.label,
                     " content is not a usable key-pair (", ssl_errors, ")"));
  }
  return crypto::AdoptPrivateKey(pkey);
}

struct KeyPairVisitor {
  ParsedKeyPair operator()(const PemKeyPair& kp) const {
    return ParsedKeyPair{kp.label, ConvertKeyPair(kp)};
  }
  ParsedKeyPair operator()(const PemCertificateHolder&) const {
    throw MalformedInputError(
        MalformedInputReason::kCertificateInKeySlot,
        "failed to parse the private key, it looks like you might be "
        "specifying the client certificate instead of the private key");
  }
  ParsedKeyPair operator()(const PemUnsupportedObject& other) const {
    throw MalformedInputError(
        MalformedInputReason::kUnsupportedPemObject,
        absl::StrCat("failed to parse the private key: ", other.kind,
                     " is not a PEM key-pair"));
  }
};

crypto::X509Certificate CertificateOrThrow(X509* cert) {
  if (cert == nullptr) {
    std::string ssl_errors = DrainOpenSslErrors();
    throw MalformedInputError(
        MalformedInputReason::kInvalidCertificateBytes,
        absl::StrCat("not a valid X.509 certificate (", ssl_errors, ")"));
  }
  return crypto::X509Certificate(crypto::AdoptX509(cert));
}

crypto::X509Certificate DecodeDerCertificate(const std::string& bytes) {
  const auto* p = reinterpret_cast<const unsigned char*>(bytes.data());
  return CertificateOrThrow(
      d2i_X509(nullptr, &p, static_cast<long>(bytes.size())));
}

}  // namespace

PemObject ReadPemObject(const std::string& bytes) {
  crypto::BioPtr bio = crypto::MakeMemoryBio(bytes.data(), bytes.size());
  if (!bio)
    throw CryptoProviderError("failed to allocate memory BIO");

  char* name_raw          = nullptr;
  char* header_raw        = nullptr;
  unsigned char* data_raw = nullptr;
  long len                = 0;
  if (PEM_read_bio(bio.get(), &name_raw, &header_raw, &data_raw, &len) != 1) {
    bool empty = LastErrorIsEndOfInput();
    ERR_clear_error();
    return PemUnsupportedObject{empty ? kNoPemObject : kMalformedPemObject};
  }
  OpenSslBuffer<char> name(name_raw);
  OpenSslBuffer<char> header(header_raw);
  OpenSslBuffer<unsigned char> data(data_raw);

  std::string label(name.get());
  std::string der(reinterpret_cast<const char*>(data.get()),
                  static_cast<size_t>(len));

  if (IsCertificateLabel(label))
    return PemCertificateHolder{label, std::move(der)};
  if (IsKeyPairLabel(label)) {
    // Traditional keys carry "Proc-Type: 4,ENCRYPTED" in their header.
    if (header && absl::StrContains(header.get(), "ENCRYPTED"))
      return PemUnsupportedObject{absl::StrCat("encrypted ", label)};
    return PemKeyPair{label, std::move(der)};
  }
  return PemUnsupportedObject{label};
}

ParsedKeyPair DecodePrivateKey(const std::string& bytes) {
  return std::visit(KeyPairVisitor{}, ReadPemObject(bytes));
}

crypto::X509Certificate DecodeCertificate(const std::string& bytes) {
  if (!absl::StrContains(bytes, kPemBeginMarker))
    return DecodeDerCertificate(bytes);

  crypto::BioPtr bio = crypto::MakeMemoryBio(bytes.data(), bytes.size());
  if (!bio)
    throw CryptoProviderError("failed to allocate memory BIO");
  return CertificateOrThrow(
      PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
}

std::vector<crypto::X509Certificate> DecodeCertificates(
    const std::string& bytes) {
  std::vector<crypto::X509Certificate> certs;
  if (IsBlank(bytes))
    return certs;
  if (!absl::StrContains(bytes, kPemBeginMarker)) {
    certs.push_back(DecodeDerCertificate(bytes));
    return certs;
  }

  crypto::BioPtr bio = crypto::MakeMemoryBio(bytes.data(), bytes.size());
  if (!bio)
    throw CryptoProviderError("failed to allocate memory BIO");
  while (true) {
    X509* cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
    if (cert == nullptr)
      break;
    certs.emplace_back(crypto::AdoptX509(cert));
  }
  if (!LastErrorIsEndOfInput() || certs.empty()) {
    std::string ssl_errors = DrainOpenSslErrors();
    throw MalformedInputError(
        MalformedInputReason::kInvalidCertificateBytes,
        absl::StrCat("certificate bundle is malformed after ", certs.size(),
                     " certificate(s) (", ssl_errors, ")"));
  }
  ERR_clear_error();
  return certs;
}

}  // namespace pem
}  // namespace kubetls
