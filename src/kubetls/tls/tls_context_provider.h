#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>

namespace kubetls {
namespace tls {
namespace asio = boost::asio;
// Source of the client context handed to asio::ssl::stream.
class TlsContextProvider {
 public:
  virtual std::shared_ptr<asio::ssl::context> GetContext() const = 0;
  // Whether the context presents a client certificate during handshakes.
  virtual bool OffersClientCertificate() const = 0;
  virtual ~TlsContextProvider() = default;
};
}  // namespace tls
}  // namespace kubetls
