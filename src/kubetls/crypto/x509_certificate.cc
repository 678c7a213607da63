#include "kubetls/crypto/x509_certificate.h"

#include <stdexcept>

#include "kubetls/error/tls_error.h"

namespace kubetls {
namespace crypto {

std::string FormatName(const X509_NAME* name) {
  BioPtr bio(BIO_new(BIO_s_mem()));
  if (!bio)
    throw CryptoProviderError("failed to allocate memory BIO");
  if (X509_NAME_print_ex(bio.get(), name, 0, XN_FLAG_RFC2253) < 0)
    throw CryptoProviderError("failed to format distinguished name");
  char* data = nullptr;
  long len   = BIO_get_mem_data(bio.get(), &data);
  return std::string(data, static_cast<size_t>(len));
}

/* PUBLIC */

X509Certificate::X509Certificate(X509Ptr cert) : cert_(std::move(cert)) {
  if (!cert_)
    throw std::invalid_argument("X509Certificate: null certificate");
  subject_ = FormatName(X509_get_subject_name(cert_.get()));
}

std::string X509Certificate::IssuerName() const {
  return FormatName(X509_get_issuer_name(cert_.get()));
}

bool X509Certificate::SameAs(const X509Certificate& other) const {
  return X509_cmp(cert_.get(), other.cert_.get()) == 0;
}

}  // namespace crypto
}  // namespace kubetls
