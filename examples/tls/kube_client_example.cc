#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <iostream>
#include <string>

#include "kubetls/error/tls_error.h"
#include "kubetls/tls/tls_context_builder.h"

using namespace kubetls;
namespace asio = boost::asio;

// Usage: kube_client_example <host> <port> <ca-file> [<cert-file> <key-file>]
int main(int argc, char** argv) {
  if (argc != 4 && argc != 6) {
    std::cerr << "usage: " << argv[0]
              << " <host> <port> <ca-file> [<cert-file> <key-file>]\n";
    return 2;
  }
  const std::string host = argv[1];
  const std::string port = argv[2];

  // 1) Describe the cluster credentials the way a kubeconfig would
  config::ClientTlsConfig cfg;
  cfg.ca_cert_file = argv[3];
  if (argc == 6) {
    cfg.client_cert_file = argv[4];
    cfg.client_key_file  = argv[5];
  }

  // 2) Build the context off the caller's thread
  asio::thread_pool blocking_pool(1);
  tls::TlsContextBuilder builder;
  std::shared_ptr<asio::ssl::context> ctx;
  try {
    ctx = builder.BuildAsync(blocking_pool.get_executor(), cfg)
              .get()
              .GetContext();
  } catch (const TlsError& e) {
    std::cerr << "TLS setup failed: " << e.what() << "\n";
    return 1;
  }
  blocking_pool.join();

  // 3) Connect, handshake and ask the API server for its version
  try {
    asio::io_context io;
    asio::ssl::stream<asio::ip::tcp::socket> stream(io, *ctx);
    SSL_set_tlsext_host_name(stream.native_handle(), host.c_str());
    stream.set_verify_callback(asio::ssl::host_name_verification(host));

    asio::ip::tcp::resolver resolver(io);
    asio::connect(stream.next_layer(), resolver.resolve(host, port));
    stream.handshake(asio::ssl::stream_base::client);

    const std::string request = "GET /version HTTP/1.1\r\nHost: " + host +
                                "\r\nConnection: close\r\n\r\n";
    asio::write(stream, asio::buffer(request));

    asio::streambuf response;
    boost::system::error_code ec;
    asio::read(stream, response, ec);
    // Servers often close without close_notify once the body is sent.
    if (ec && ec != asio::error::eof && ec != asio::ssl::error::stream_truncated)
      throw boost::system::system_error(ec);
    std::cout << &response << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Request failed: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
