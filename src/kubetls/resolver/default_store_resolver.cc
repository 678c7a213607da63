#include "kubetls/resolver/default_store_resolver.h"

#include <filesystem>
#include <system_error>

#include "absl/strings/match.h"
#include "absl/strings/str_format.h"
#include "kubetls/log/log_adapter.h"
#include "kubetls/util/byte_source.h"

namespace kubetls {
namespace resolver {
namespace {

bool IsRegularFile(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

}  // namespace

DefaultStoreResolver::DefaultStoreResolver(config::SystemStoreConfig cfg)
                : cfg_(std::move(cfg)),
                  keystore_([this] { return LoadKeyStore(); }),
                  truststore_([this] { return LoadTrustStore(); }) {}

/* STATIC */
DefaultStoreResolver& DefaultStoreResolver::Process() {
  static DefaultStoreResolver instance(
      config::SystemStoreConfig::FromEnvironment());
  return instance;
}

/* PUBLIC */

std::shared_ptr<const keystore::KeyStore>
DefaultStoreResolver::DefaultKeyStore() {
  return keystore_.Get();
}

std::shared_ptr<const keystore::KeyStore>
DefaultStoreResolver::DefaultTrustStore() {
  return truststore_.Get();
}

std::string DefaultStoreResolver::TrustStorePath() const {
  if (cfg_.truststore_file && !cfg_.truststore_file->empty())
    return *cfg_.truststore_file;
  if (!cfg_.security_directory.empty()) {
    auto alternate = std::filesystem::path(cfg_.security_directory) /
                     config::kAlternateTrustBundleName;
    if (IsRegularFile(alternate))
      return alternate.string();
  }
  return cfg_.standard_ca_bundle;
}

/* PRIVATE */

keystore::KeyStore DefaultStoreResolver::LoadKeyStore() const {
  keystore::KeyStore store;
  if (!cfg_.keystore_file || cfg_.keystore_file->empty())
    return store;

  store.LoadPkcs12(util::ReadFileBytes(*cfg_.keystore_file),
                   cfg_.keystore_password);
  KUBETLS_LOG_INFO(absl::StrFormat("default keystore loaded from %s (%d entries)",
                                   *cfg_.keystore_file, store.Size()));
  return store;
}

keystore::KeyStore DefaultStoreResolver::LoadTrustStore() const {
  const std::string path  = TrustStorePath();
  const std::string bytes = util::ReadFileBytes(path);

  keystore::KeyStore store;
  if (absl::StrContains(bytes, "-----BEGIN"))
    store.LoadPemBundle(bytes);
  else
    store.LoadPkcs12(bytes, cfg_.truststore_password);
  KUBETLS_LOG_INFO(absl::StrFormat(
      "default truststore loaded from %s (%d entries)", path, store.Size()));
  return store;
}

}  // namespace resolver
}  // namespace kubetls
