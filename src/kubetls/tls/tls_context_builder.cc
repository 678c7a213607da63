#include "kubetls/tls/tls_context_builder.h"

#include <openssl/rand.h>
#include <openssl/ssl.h>

#include <boost/asio/post.hpp>
#include <boost/system/system_error.hpp>

#include "absl/strings/str_format.h"
#include "kubetls/error/tls_error.h"
#include "kubetls/log/log_adapter.h"
#include "kubetls/resolver/identity_resolver.h"
#include "kubetls/resolver/trust_resolver.h"

namespace kubetls {
namespace tls {
namespace {

// OpenSSL seeds its DRBG from the OS on first use; fail early if it can't.
void EnsureSecureRandom() {
  if (RAND_status() == 1)
    return;
  if (RAND_poll() != 1 || RAND_status() != 1)
    throw CryptoProviderError("no secure random source available");
}

std::shared_ptr<asio::ssl::context> MakeClientContext() {
  try {
    auto ctx =
        std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client);
    ctx->set_options(asio::ssl::context::default_workarounds |
                     asio::ssl::context::no_sslv2 |
                     asio::ssl::context::no_sslv3);
    if (SSL_CTX_set_min_proto_version(ctx->native_handle(), TLS1_2_VERSION) !=
        1) {
      throw CryptoProviderError("cannot require TLS 1.2 or newer");
    }
    return ctx;
  } catch (const boost::system::system_error& e) {
    throw CryptoProviderError(e.what());
  }
}

}  // namespace

TlsContextBuilder::TlsContextBuilder()
                : defaults_(&resolver::DefaultStoreResolver::Process()) {}

TlsContextBuilder::TlsContextBuilder(resolver::DefaultStoreResolver& defaults)
                : defaults_(&defaults) {}

TlsContext TlsContextBuilder::Build(const config::ClientTlsConfig& cfg) const {
  try {
    auto keystore =
        std::make_shared<keystore::KeyStore>(*defaults_->DefaultKeyStore());
    std::optional<std::string> identity =
        resolver::ResolveClientIdentity(cfg, *keystore);
    auto truststore = std::make_shared<const keystore::KeyStore>(
        resolver::ResolveTrustStore(cfg, *defaults_));

    auto key_manager = std::make_shared<const KeyManager>(
        std::shared_ptr<const keystore::KeyStore>(std::move(keystore)),
        std::move(identity));
    auto trust_manager = std::make_shared<const TrustManager>(truststore);

    EnsureSecureRandom();
    auto ctx = MakeClientContext();
    key_manager->Install(*ctx);
    trust_manager->Install(*ctx);

    KUBETLS_LOG_INFO(absl::StrFormat(
        "TLS client context ready: client identity %s, %d trust anchor(s)",
        key_manager->ChosenAlias().value_or("<none>"),
        trust_manager->AnchorCount()));
    return TlsContext(std::move(ctx), std::move(key_manager),
                      std::move(trust_manager));
  } catch (const std::exception& e) {
    KUBETLS_LOG_ERROR(
        absl::StrFormat("failed to build TLS client context: %s", e.what()));
    throw;
  }
}

std::future<TlsContext> TlsContextBuilder::BuildAsync(
    asio::any_io_executor executor, config::ClientTlsConfig cfg) const {
  auto p   = std::make_shared<std::promise<TlsContext>>();
  auto fut = p->get_future();
  asio::post(executor, [self = *this, cfg = std::move(cfg), p]() {
    try {
      p->set_value(self.Build(cfg));
    } catch (...) {
      p->set_exception(std::current_exception());
    }
  });
  return fut;
}

}  // namespace tls
}  // namespace kubetls
