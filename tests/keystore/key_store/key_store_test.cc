#include "kubetls/keystore/key_store.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <set>
#include <stdexcept>

#include "kubetls/error/tls_error.h"
#include "kubetls/pem/pem_decoder.h"
#include "support/error_matchers.h"
#include "support/test_certificates.h"

using namespace kubetls;
using namespace kubetls::keystore;
using kubetls::test::HasReason;

namespace {
struct DecodedIdentity {
  crypto::PrivateKeyPtr key;
  crypto::X509Certificate cert;
};

DecodedIdentity Decode(const test::TestIdentity& id) {
  return DecodedIdentity{pem::DecodePrivateKey(id.key_pem).private_key,
                         pem::DecodeCertificate(id.cert_pem)};
}
}  // namespace

TEST_CASE("New KeyStore is empty", "[KeyStore]") {
  KeyStore store;
  REQUIRE(store.Empty());
  REQUIRE(store.Size() == 0);
  REQUIRE(store.Aliases().empty());
  REQUIRE(store.GetKeyEntry("missing") == nullptr);
  REQUIRE(store.GetCertificate("missing") == nullptr);
}

TEST_CASE("AddIdentity stores key, passphrase and chain under the subject",
          "[KeyStore]") {
  auto id = Decode(test::MakeSelfSignedIdentity("client"));
  KeyStore store;

  std::string alias = store.AddIdentity(id.key, "pass", {id.cert});
  REQUIRE(alias == "CN=client");
  REQUIRE(store.IsKeyEntry(alias));
  REQUIRE_FALSE(store.IsCertificateEntry(alias));
  REQUIRE(store.KeyEntryCount() == 1);

  const PrivateKeyEntry* entry = store.GetKeyEntry(alias);
  REQUIRE(entry != nullptr);
  REQUIRE(entry->passphrase == "pass");
  REQUIRE(entry->chain.size() == 1);
  REQUIRE(entry->chain.front().SameAs(id.cert));
  REQUIRE(entry->private_key.get() == id.key.get());
  REQUIRE(store.GetCertificate(alias)->SameAs(id.cert));
}

TEST_CASE("SetKeyEntry rejects an entry without chain", "[KeyStore]") {
  auto id = Decode(test::MakeSelfSignedIdentity("client"));
  KeyStore store;
  REQUIRE_THROWS_AS(store.SetKeyEntry("a", id.key, "", {}),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(store.SetKeyEntry("a", nullptr, "", {id.cert}),
                    std::invalid_argument);
}

TEST_CASE("AddTrustedCertificates gives every certificate a unique alias",
          "[KeyStore]") {
  int n = GENERATE(0, 1, 5);
  // Same subject for all: only the ordinal keeps aliases apart.
  std::vector<crypto::X509Certificate> certs;
  for (int i = 0; i < n; ++i) {
    certs.push_back(
        pem::DecodeCertificate(test::MakeSelfSignedIdentity("ca").cert_pem));
  }

  KeyStore store;
  REQUIRE(store.AddTrustedCertificates(certs) == static_cast<size_t>(n));
  REQUIRE(store.Size() == static_cast<size_t>(n));

  auto aliases = store.Aliases();
  REQUIRE(std::set<std::string>(aliases.begin(), aliases.end()).size() ==
          static_cast<size_t>(n));
  for (int i = 0; i < n; ++i) {
    std::string alias = "CN=ca-" + std::to_string(i);
    REQUIRE(store.IsCertificateEntry(alias));
    REQUIRE(store.GetCertificate(alias)->SameAs(certs[i]));
  }
}

TEST_CASE("Setting an alias twice keeps the last entry", "[KeyStore]") {
  auto first  = pem::DecodeCertificate(test::MakeSelfSignedIdentity("a").cert_pem);
  auto second = pem::DecodeCertificate(test::MakeSelfSignedIdentity("b").cert_pem);
  KeyStore store;
  store.SetCertificateEntry("anchor", first);
  store.SetCertificateEntry("anchor", second);
  REQUIRE(store.Size() == 1);
  REQUIRE(store.GetCertificate("anchor")->SameAs(second));
}

TEST_CASE("Merge copies entries from another store", "[KeyStore]") {
  auto id = Decode(test::MakeSelfSignedIdentity("client"));
  KeyStore base;
  base.LoadPemBundle(test::MakeCaBundle("root", 2));

  KeyStore copy = base;
  copy.AddIdentity(id.key, "", {id.cert});
  REQUIRE(base.Size() == 2);
  REQUIRE(copy.Size() == 3);

  KeyStore merged;
  merged.Merge(copy);
  REQUIRE(merged.Aliases() == copy.Aliases());
  REQUIRE(merged.TrustedCertificates().size() == 2);
}

TEST_CASE("LoadPkcs12 imports the identity", "[KeyStore]") {
  auto id = test::MakeSelfSignedIdentity("p12");
  KeyStore store;
  store.LoadPkcs12(test::MakePkcs12(id, "hunter2"), "hunter2");

  REQUIRE(store.KeyEntryCount() == 1);
  const PrivateKeyEntry* entry = store.GetKeyEntry("CN=p12");
  REQUIRE(entry != nullptr);
  REQUIRE(entry->passphrase == "hunter2");
  REQUIRE(entry->chain.front().SameAs(pem::DecodeCertificate(id.cert_pem)));
}

TEST_CASE("TrustAnchors includes the leaf of key entries", "[KeyStore]") {
  auto id = Decode(test::MakeSelfSignedIdentity("client"));
  KeyStore store;
  store.LoadPemBundle(test::MakeCaBundle("root", 2));
  store.AddIdentity(id.key, "", {id.cert});

  REQUIRE(store.TrustedCertificates().size() == 2);
  auto anchors = store.TrustAnchors();
  REQUIRE(anchors.size() == 3);
  REQUIRE(anchors.front().SameAs(id.cert));  // "CN=client" sorts first
}

TEST_CASE("LoadPkcs12 rejects a wrong password and garbage", "[KeyStore]") {
  auto p12 = test::MakePkcs12(test::MakeSelfSignedIdentity("p12"), "right");
  KeyStore store;
  REQUIRE_THROWS_MATCHES(store.LoadPkcs12(p12, "wrong"), MalformedInputError,
                         HasReason(MalformedInputReason::kInvalidKeyStore));
  REQUIRE_THROWS_MATCHES(store.LoadPkcs12("garbage", ""), MalformedInputError,
                         HasReason(MalformedInputReason::kInvalidKeyStore));
  REQUIRE(store.Empty());
}
