#pragma once

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pkcs12.h>
#include <openssl/x509.h>

#include <memory>

namespace kubetls {
namespace crypto {

struct BioDeleter {
  void operator()(BIO* bio) const { BIO_free_all(bio); }
};
struct X509Deleter {
  void operator()(X509* x509) const { X509_free(x509); }
};
struct EvpPkeyDeleter {
  void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};
struct Pkcs12Deleter {
  void operator()(PKCS12* p12) const { PKCS12_free(p12); }
};
struct Pkcs8Deleter {
  void operator()(PKCS8_PRIV_KEY_INFO* p8) const {
    PKCS8_PRIV_KEY_INFO_free(p8);
  }
};
struct X509StackDeleter {
  void operator()(STACK_OF(X509) * certs) const {
    sk_X509_pop_free(certs, X509_free);
  }
};

using BioPtr        = std::unique_ptr<BIO, BioDeleter>;
using Pkcs12Ptr     = std::unique_ptr<PKCS12, Pkcs12Deleter>;
using Pkcs8Ptr      = std::unique_ptr<PKCS8_PRIV_KEY_INFO, Pkcs8Deleter>;
using X509StackPtr  = std::unique_ptr<STACK_OF(X509), X509StackDeleter>;

// Keys and certificates are shared between stores and contexts; entries
// never mutate them after decoding.
using PrivateKeyPtr = std::shared_ptr<EVP_PKEY>;
using X509Ptr       = std::shared_ptr<X509>;

inline PrivateKeyPtr AdoptPrivateKey(EVP_PKEY* pkey) {
  return PrivateKeyPtr(pkey, EvpPkeyDeleter());
}
inline X509Ptr AdoptX509(X509* x509) {
  return X509Ptr(x509, X509Deleter());
}

// Read-only memory BIO over `data`; `data` must outlive the BIO.
inline BioPtr MakeMemoryBio(const void* data, size_t size) {
  return BioPtr(BIO_new_mem_buf(data, static_cast<int>(size)));
}

}  // namespace crypto
}  // namespace kubetls
