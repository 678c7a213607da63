#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <future>

#include "kubetls/config/client_tls_config.h"
#include "kubetls/resolver/default_store_resolver.h"
#include "kubetls/tls/tls_context.h"

namespace kubetls {
namespace tls {
namespace asio = boost::asio;

/// Builds client TLS contexts from cluster configuration.
///
/// Building reads files and initializes OpenSSL state, so it may block.
/// Call Build() from a thread that is allowed to block, or use
/// BuildAsync() with a blocking-safe executor (e.g. asio::thread_pool).
class TlsContextBuilder {
 public:
  // Uses the process-wide default stores.
  TlsContextBuilder();
  // `defaults` must outlive the builder and any pending BuildAsync().
  explicit TlsContextBuilder(resolver::DefaultStoreResolver& defaults);

  /// Throws MalformedInputError, IoError or CryptoProviderError; there is
  /// no partially configured result.
  TlsContext Build(const config::ClientTlsConfig& cfg) const;

  /// Runs Build() on `executor`; the future carries the context or the
  /// exception Build() threw.
  std::future<TlsContext> BuildAsync(asio::any_io_executor executor,
                                     config::ClientTlsConfig cfg) const;

 private:
  resolver::DefaultStoreResolver* defaults_;
};

}  // namespace tls
}  // namespace kubetls
