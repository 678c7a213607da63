#pragma once

#include <string>

#include "kubetls/crypto/openssl_types.h"

namespace kubetls {
namespace crypto {

// One decoded X.509 certificate.
class X509Certificate {
 public:
  explicit X509Certificate(X509Ptr cert);

  // Subject distinguished name in RFC 2253 form, e.g. "CN=a,O=b".
  const std::string& SubjectName() const { return subject_; }
  std::string IssuerName() const;

  bool SameAs(const X509Certificate& other) const;

  X509* native_handle() const { return cert_.get(); }

 private:
  X509Ptr cert_;
  std::string subject_;
};

std::string FormatName(const X509_NAME* name);

}  // namespace crypto
}  // namespace kubetls
