#include "kubetls/keystore/key_store.h"

#include <openssl/pkcs12.h>

#include <algorithm>
#include <stdexcept>

#include "absl/strings/str_cat.h"
#include "kubetls/error/tls_error.h"
#include "kubetls/pem/pem_decoder.h"

namespace kubetls {
namespace keystore {

/* PUBLIC */

void KeyStore::SetKeyEntry(const std::string& alias, crypto::PrivateKeyPtr key,
                           std::string passphrase,
                           std::vector<crypto::X509Certificate> chain) {
  if (!key || chain.empty()) {
    throw std::invalid_argument(
        "KeyStore: a key entry needs a private key and a certificate chain.");
  }
  entries_.insert_or_assign(
      alias, PrivateKeyEntry{std::move(key), std::move(passphrase),
                             std::move(chain)});
}

void KeyStore::SetCertificateEntry(const std::string& alias,
                                   crypto::X509Certificate cert) {
  entries_.insert_or_assign(alias, TrustedCertificateEntry{std::move(cert)});
}

std::string KeyStore::AddIdentity(crypto::PrivateKeyPtr key,
                                  std::string passphrase,
                                  std::vector<crypto::X509Certificate> chain) {
  if (chain.empty()) {
    throw std::invalid_argument(
        "KeyStore: a key entry needs a certificate chain.");
  }
  std::string alias = chain.front().SubjectName();
  SetKeyEntry(alias, std::move(key), std::move(passphrase), std::move(chain));
  return alias;
}

size_t KeyStore::AddTrustedCertificates(
    const std::vector<crypto::X509Certificate>& certs) {
  for (size_t i = 0; i < certs.size(); ++i) {
    SetCertificateEntry(absl::StrCat(certs[i].SubjectName(), "-", i),
                        certs[i]);
  }
  return certs.size();
}

size_t KeyStore::LoadPemBundle(const std::string& bytes) {
  return AddTrustedCertificates(pem::DecodeCertificates(bytes));
}

void KeyStore::LoadPkcs12(const std::string& bytes,
                          const std::string& password) {
  crypto::BioPtr bio = crypto::MakeMemoryBio(bytes.data(), bytes.size());
  if (!bio)
    throw CryptoProviderError("failed to allocate memory BIO");

  crypto::Pkcs12Ptr p12(d2i_PKCS12_bio(bio.get(), nullptr));
  if (!p12) {
    std::string ssl_errors = DrainOpenSslErrors();
    throw MalformedInputError(
        MalformedInputReason::kInvalidKeyStore,
        absl::StrCat("not a PKCS#12 keystore (", ssl_errors, ")"));
  }

  EVP_PKEY* pkey_raw     = nullptr;
  X509* cert_raw         = nullptr;
  STACK_OF(X509)* ca_raw = nullptr;
  if (PKCS12_parse(p12.get(), password.c_str(), &pkey_raw, &cert_raw,
                   &ca_raw) != 1) {
    std::string ssl_errors = DrainOpenSslErrors();
    throw MalformedInputError(
        MalformedInputReason::kInvalidKeyStore,
        absl::StrCat("cannot open PKCS#12 keystore, wrong password? (",
                     ssl_errors, ")"));
  }
  crypto::PrivateKeyPtr pkey =
      pkey_raw ? crypto::AdoptPrivateKey(pkey_raw) : nullptr;
  crypto::X509Ptr cert = cert_raw ? crypto::AdoptX509(cert_raw) : nullptr;
  crypto::X509StackPtr ca(ca_raw);

  std::vector<crypto::X509Certificate> others;
  if (ca) {
    for (int i = 0; i < sk_X509_num(ca.get()); ++i) {
      X509* c = sk_X509_value(ca.get(), i);
      X509_up_ref(c);
      others.emplace_back(crypto::AdoptX509(c));
    }
  }

  if (pkey && cert) {
    std::vector<crypto::X509Certificate> chain;
    chain.emplace_back(cert);
    chain.insert(chain.end(), others.begin(), others.end());
    AddIdentity(std::move(pkey), password, std::move(chain));
    return;
  }
  if (cert)
    others.insert(others.begin(), crypto::X509Certificate(cert));
  AddTrustedCertificates(others);
}

void KeyStore::Merge(const KeyStore& other) {
  for (const auto& [alias, entry] : other.entries_) {
    entries_.insert_or_assign(alias, entry);
  }
}

bool KeyStore::Contains(const std::string& alias) const {
  return entries_.find(alias) != entries_.end();
}

bool KeyStore::IsKeyEntry(const std::string& alias) const {
  return GetKeyEntry(alias) != nullptr;
}

bool KeyStore::IsCertificateEntry(const std::string& alias) const {
  auto it = entries_.find(alias);
  return it != entries_.end() &&
         std::holds_alternative<TrustedCertificateEntry>(it->second);
}

const PrivateKeyEntry* KeyStore::GetKeyEntry(const std::string& alias) const {
  auto it = entries_.find(alias);
  return it != entries_.end() ? std::get_if<PrivateKeyEntry>(&it->second)
                              : nullptr;
}

const crypto::X509Certificate* KeyStore::GetCertificate(
    const std::string& alias) const {
  auto it = entries_.find(alias);
  if (it == entries_.end())
    return nullptr;
  if (const auto* trusted = std::get_if<TrustedCertificateEntry>(&it->second))
    return &trusted->certificate;
  return &std::get<PrivateKeyEntry>(it->second).chain.front();
}

std::vector<std::string> KeyStore::Aliases() const {
  std::vector<std::string> aliases;
  aliases.reserve(entries_.size());
  for (const auto& [alias, entry] : entries_) {
    aliases.push_back(alias);
  }
  std::sort(aliases.begin(), aliases.end());
  return aliases;
}

std::vector<crypto::X509Certificate> KeyStore::TrustedCertificates() const {
  std::vector<crypto::X509Certificate> certs;
  for (const auto& alias : Aliases()) {
    const auto& entry = entries_.at(alias);
    if (const auto* trusted = std::get_if<TrustedCertificateEntry>(&entry))
      certs.push_back(trusted->certificate);
  }
  return certs;
}

std::vector<crypto::X509Certificate> KeyStore::TrustAnchors() const {
  std::vector<crypto::X509Certificate> certs;
  for (const auto& alias : Aliases()) {
    const auto& entry = entries_.at(alias);
    if (const auto* trusted = std::get_if<TrustedCertificateEntry>(&entry))
      certs.push_back(trusted->certificate);
    else if (const auto* key = std::get_if<PrivateKeyEntry>(&entry))
      certs.push_back(key->chain.front());
  }
  return certs;
}

size_t KeyStore::KeyEntryCount() const {
  return static_cast<size_t>(
      std::count_if(entries_.begin(), entries_.end(), [](const auto& kv) {
        return std::holds_alternative<PrivateKeyEntry>(kv.second);
      }));
}

}  // namespace keystore
}  // namespace kubetls
