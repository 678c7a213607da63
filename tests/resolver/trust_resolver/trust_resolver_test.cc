#include "kubetls/resolver/trust_resolver.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <set>

#include "kubetls/error/tls_error.h"
#include "support/test_certificates.h"

using namespace kubetls;
using namespace kubetls::resolver;

namespace {
// Defaults backed by a one-certificate bundle.
struct Defaults {
  test::TempFile bundle{test::MakeCaBundle("system", 1)};
  DefaultStoreResolver resolver{[this] {
    config::SystemStoreConfig cfg;
    cfg.truststore_file = bundle.path();
    return cfg;
  }()};
};
}  // namespace

TEST_CASE("Inline CA bundle yields one entry per certificate",
          "[TrustResolver]") {
  int n = GENERATE(0, 1, 5);
  config::ClientTlsConfig cfg;
  cfg.ca_cert_data = test::Base64(test::MakeCaBundle("ca", n));

  Defaults defaults;
  keystore::KeyStore store = ResolveTrustStore(cfg, defaults.resolver);
  REQUIRE(store.Size() == static_cast<size_t>(n));
  auto aliases = store.Aliases();
  REQUIRE(std::set<std::string>(aliases.begin(), aliases.end()).size() ==
          static_cast<size_t>(n));
  // Defaults are not consulted.
  REQUIRE_FALSE(store.Contains("CN=system0-0"));
}

TEST_CASE("Two concatenated CAs are aliased by subject and ordinal",
          "[TrustResolver]") {
  std::string bundle = test::MakeSelfSignedIdentity("A").cert_pem +
                       test::MakeSelfSignedIdentity("B").cert_pem;
  config::ClientTlsConfig cfg;
  cfg.ca_cert_data = test::Base64(bundle);

  keystore::KeyStore store;
  REQUIRE(AddExplicitTrustAnchors(cfg, store) == std::optional<size_t>(2));
  REQUIRE(store.Aliases() == std::vector<std::string>{"CN=A-0", "CN=B-1"});
  REQUIRE(store.KeyEntryCount() == 0);
}

TEST_CASE("CA file is read when no inline data is given", "[TrustResolver]") {
  test::TempFile file(test::MakeCaBundle("file", 3));
  config::ClientTlsConfig cfg;
  cfg.ca_cert_file = file.path();

  keystore::KeyStore store;
  REQUIRE(AddExplicitTrustAnchors(cfg, store) == std::optional<size_t>(3));
  REQUIRE(store.Contains("CN=file2-2"));
}

TEST_CASE("Inline CA data wins over the CA file", "[TrustResolver]") {
  config::ClientTlsConfig cfg;
  cfg.ca_cert_data = test::Base64(test::MakeCaBundle("inline", 1));
  cfg.ca_cert_file = test::MissingPath();

  keystore::KeyStore store;
  REQUIRE(AddExplicitTrustAnchors(cfg, store) == std::optional<size_t>(1));
  REQUIRE(store.Contains("CN=inline0-0"));
}

TEST_CASE("Without CA input the default truststore is used",
          "[TrustResolver]") {
  config::ClientTlsConfig cfg;
  keystore::KeyStore probe;
  REQUIRE_FALSE(AddExplicitTrustAnchors(cfg, probe).has_value());

  Defaults defaults;
  keystore::KeyStore store = ResolveTrustStore(cfg, defaults.resolver);
  REQUIRE(store.Aliases() == std::vector<std::string>{"CN=system0-0"});
}

TEST_CASE("Missing CA file is an IoError", "[TrustResolver]") {
  config::ClientTlsConfig cfg;
  cfg.ca_cert_file = test::MissingPath();
  keystore::KeyStore store;
  REQUIRE_THROWS_AS(AddExplicitTrustAnchors(cfg, store), IoError);
}

TEST_CASE("CA file that is a directory is an IoError", "[TrustResolver]") {
  test::TempDir dir;
  config::ClientTlsConfig cfg;
  cfg.ca_cert_file = dir.path();
  keystore::KeyStore store;
  REQUIRE_THROWS_AS(AddExplicitTrustAnchors(cfg, store), IoError);
}

TEST_CASE("Default truststore path that is a directory is an IoError",
          "[TrustResolver]") {
  test::TempDir dir;
  config::SystemStoreConfig system;
  system.truststore_file = dir.path();
  DefaultStoreResolver defaults(system);

  config::ClientTlsConfig cfg;
  REQUIRE_THROWS_AS(ResolveTrustStore(cfg, defaults), IoError);
}
