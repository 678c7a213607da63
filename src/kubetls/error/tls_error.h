#pragma once

#include <stdexcept>
#include <string>

namespace kubetls {

// Root of every error raised while assembling a TLS client context.
class TlsError : public std::runtime_error {
 public:
  explicit TlsError(const std::string& what) : std::runtime_error(what) {}
};

enum class MalformedInputReason {
  kCertificateInKeySlot,
  kUnsupportedPemObject,
  kInvalidCertificateBytes,
  kInvalidBase64,
  kInvalidKeyStore
};

const char* ToString(MalformedInputReason reason);

// Input bytes decoded into a structurally wrong or unsupported artifact.
class MalformedInputError : public TlsError {
 public:
  MalformedInputError(MalformedInputReason reason, const std::string& detail);

  MalformedInputReason reason() const { return reason_; }
  const std::string& detail() const { return detail_; }

 private:
  MalformedInputReason reason_;
  std::string detail_;
};

// A configured file could not be opened or read.
class IoError : public TlsError {
 public:
  IoError(const std::string& path, const std::string& detail);

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

// OpenSSL refused the assembled material or failed to initialize.
class CryptoProviderError : public TlsError {
 public:
  // Appends and clears the thread's OpenSSL error queue.
  explicit CryptoProviderError(const std::string& detail);
};

// Joins the pending OpenSSL errors of the calling thread into one line and
// clears the queue. Returns an empty string when nothing is pending.
std::string DrainOpenSslErrors();

}  // namespace kubetls
