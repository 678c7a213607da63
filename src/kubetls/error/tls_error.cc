#include "kubetls/error/tls_error.h"

#include <openssl/err.h>

#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace kubetls {

const char* ToString(MalformedInputReason reason) {
  switch (reason) {
    case MalformedInputReason::kCertificateInKeySlot:
      return "certificate-in-key-slot";
    case MalformedInputReason::kUnsupportedPemObject:
      return "unsupported-pem-object";
    case MalformedInputReason::kInvalidCertificateBytes:
      return "invalid-certificate-bytes";
    case MalformedInputReason::kInvalidBase64:
      return "invalid-base64";
    case MalformedInputReason::kInvalidKeyStore:
      return "invalid-keystore";
  }
  return "unknown";
}

MalformedInputError::MalformedInputError(MalformedInputReason reason,
                                         const std::string& detail)
                : TlsError(absl::StrCat("MalformedInput: ", ToString(reason),
                                        ": ", detail)),
                  reason_(reason),
                  detail_(detail) {}

IoError::IoError(const std::string& path, const std::string& detail)
                : TlsError(absl::StrCat("IOFailure: ", path, ": ", detail)),
                  path_(path) {}

CryptoProviderError::CryptoProviderError(const std::string& detail)
                : TlsError([&detail] {
                    std::string ssl_errors = DrainOpenSslErrors();
                    if (ssl_errors.empty())
                      return absl::StrCat("CryptoProviderFailure: ", detail);
                    return absl::StrCat("CryptoProviderFailure: ", detail,
                                        " (", ssl_errors, ")");
                  }()) {}

std::string DrainOpenSslErrors() {
  std::vector<std::string> errors;
  unsigned long code = 0;
  while ((code = ERR_get_error()) != 0) {
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    errors.emplace_back(buf);
  }
  return absl::StrJoin(errors, "; ");
}

}  // namespace kubetls
