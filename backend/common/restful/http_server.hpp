#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include "common/config/config.hpp"
#include "common/restful/rest_api_handler_base.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace common {

struct SessionLimits {
  std::chrono::seconds idle_timeout;
  std::uint64_t max_body_bytes;
};

// One keep-alive connection. Requests are answered in order; a response is
// written completely before the next request is read.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler,
              SessionLimits limits, std::atomic<size_t>& open_sessions);
  ~HttpSession();

  void run();

private:
  void readRequest();
  void onRead(beast::error_code ec, std::size_t bytes_transferred);
  void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
  void close();

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  std::shared_ptr<Response> response_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
  SessionLimits limits_;
  std::atomic<size_t>& open_sessions_;
};

// Listens on http.host:http.port. Each accepted connection gets its own
// strand, so the io_context may be run by several threads.
class HttpServer {
public:
  // Throws std::runtime_error if the address is invalid or cannot be bound.
  HttpServer(net::io_context& ioc, const config::HttpConfig& cfg,
             std::shared_ptr<RestApiHandlerBase> api_handler);

  void run();
  // Stops accepting; sessions in progress finish their current response.
  void stop();

  tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }
  size_t openSessions() const { return open_sessions_.load(); }

private:
  void accept();
  void onAccept(beast::error_code ec, tcp::socket socket);

  net::io_context& ioc_;
  tcp::acceptor acceptor_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
  SessionLimits limits_;
  std::atomic<size_t> open_sessions_{0};
};

}
