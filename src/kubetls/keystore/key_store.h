#pragma once

#include <string>
#include <variant>
#include <vector>

#include "absl/container/node_hash_map.h"
#include "kubetls/crypto/openssl_types.h"
#include "kubetls/crypto/x509_certificate.h"

namespace kubetls {
namespace keystore {

// Client identity: key, its passphrase and the chain leaf-first.
struct PrivateKeyEntry {
  crypto::PrivateKeyPtr private_key;
  std::string passphrase;
  std::vector<crypto::X509Certificate> chain;
};

// Trust anchor.
struct TrustedCertificateEntry {
  crypto::X509Certificate certificate;
};

using KeyStoreEntry = std::variant<PrivateKeyEntry, TrustedCertificateEntry>;

// In-memory alias -> entry collection, used as keystore and truststore.
// Setting an existing alias replaces its entry.
class KeyStore {
 public:
  KeyStore() = default;

  void SetKeyEntry(const std::string& alias, crypto::PrivateKeyPtr key,
                   std::string passphrase,
                   std::vector<crypto::X509Certificate> chain);
  void SetCertificateEntry(const std::string& alias,
                           crypto::X509Certificate cert);

  // Identity entry aliased by the leaf's subject name. Returns the alias.
  std::string AddIdentity(crypto::PrivateKeyPtr key, std::string passphrase,
                          std::vector<crypto::X509Certificate> chain);

  // Trust entries aliased "<subject>-<i>", i counting from 0 within
  // `certs`. Returns the number added.
  size_t AddTrustedCertificates(
      const std::vector<crypto::X509Certificate>& certs);

  // Every PEM certificate of `bytes` as a trust entry.
  size_t LoadPemBundle(const std::string& bytes);

  // PKCS#12 container: key + certificate become an identity entry, any
  // remaining certificates become trust entries.
  // Throws MalformedInputError(kInvalidKeyStore).
  void LoadPkcs12(const std::string& bytes, const std::string& password);

  // Copies all entries of `other`, replacing entries with equal aliases.
  void Merge(const KeyStore& other);

  bool Contains(const std::string& alias) const;
  bool IsKeyEntry(const std::string& alias) const;
  bool IsCertificateEntry(const std::string& alias) const;

  // nullptr when `alias` is absent or of the other kind.
  const PrivateKeyEntry* GetKeyEntry(const std::string& alias) const;
  // The trusted certificate, or the leaf of an identity entry.
  const crypto::X509Certificate* GetCertificate(
      const std::string& alias) const;

  std::vector<std::string> Aliases() const;  // sorted
  std::vector<crypto::X509Certificate> TrustedCertificates() const;
  // Trusted certificates plus the leaf certificate of every key entry, in
  // alias order.
  std::vector<crypto::X509Certificate> TrustAnchors() const;
  size_t KeyEntryCount() const;
  size_t Size() const { return entries_.size(); }
  bool Empty() const { return entries_.empty(); }

 private:
  absl::node_hash_map<std::string, KeyStoreEntry> entries_;
};

}  // namespace keystore
}  // namespace kubetls
