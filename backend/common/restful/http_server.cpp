#include "http_server.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

namespace common {

HttpServer::HttpServer(net::io_context& ioc, const config::HttpConfig& cfg,
                       std::shared_ptr<RestApiHandlerBase> api_handler)
  : ioc_(ioc),
    acceptor_(net::make_strand(ioc)),
    api_handler_(std::move(api_handler)),
    limits_{cfg.idle_timeout, cfg.max_body_bytes} {

  beast::error_code ec;
  auto address = net::ip::make_address(cfg.host, ec);
  if (ec) {
    throw std::runtime_error("Invalid http.host '" + cfg.host + "': " + ec.message());
  }
  const tcp::endpoint endpoint{address, static_cast<unsigned short>(cfg.port)};

  auto check = [&ec](const char* what) {
    if (ec) {
      throw std::runtime_error(std::string("HTTP listener: ") + what + " failed: " + ec.message());
    }
  };
  acceptor_.open(endpoint.protocol(), ec);
  check("open");
  acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  check("reuse_address");
  acceptor_.bind(endpoint, ec);
  check("bind");
  acceptor_.listen(net::socket_base::max_listen_connections, ec);
  check("listen");
}

void HttpServer::run() {
  accept();
}

void HttpServer::stop() {
  net::post(acceptor_.get_executor(), [this]() {
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) {
      std::cerr << "[HttpServer] closing listener: " << ec.message() << std::endl;
    }
  });
}

void HttpServer::accept() {
  acceptor_.async_accept(net::make_strand(ioc_),
                         beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted) {
    return;
  }
  if (ec) {
    std::cerr << "[HttpServer] accept: " << ec.message() << std::endl;
  } else {
    std::make_shared<HttpSession>(std::move(socket), api_handler_, limits_, open_sessions_)->run();
  }
  accept();
}

HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler,
                         SessionLimits limits, std::atomic<size_t>& open_sessions)
  : stream_(std::move(socket)),
    api_handler_(std::move(api_handler)),
    limits_(limits),
    open_sessions_(open_sessions) {
  open_sessions_.fetch_add(1);
}

HttpSession::~HttpSession() {
  open_sessions_.fetch_sub(1);
}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::readRequest, shared_from_this()));
}

void HttpSession::readRequest() {
  parser_.emplace();
  parser_->body_limit(limits_.max_body_bytes);
  stream_.expires_after(limits_.idle_timeout);

  http::async_read(stream_, buffer_, *parser_,
                   beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t) {
  if (ec == http::error::end_of_stream) {
    return close();
  }
  if (ec == beast::error::timeout) {
    return;
  }
  if (ec == http::error::body_limit) {
    Response res{http::status::payload_too_large, 11};
    res.set(http::field::content_type, "application/json");
    res.body() = R"({"success":false,"error":"Request body too large"})";
    res.prepare_payload();
    res.keep_alive(false);
    response_ = std::make_shared<Response>(std::move(res));
  } else if (ec) {
    std::cerr << "[HttpServer] read: " << ec.message() << std::endl;
    return;
  } else {
    auto request = parser_->release();
    const std::string method(request.method_string());
    const std::string target(request.target());
    response_ = std::make_shared<Response>(api_handler_->handleRequest(std::move(request)));
    if (response_->result_int() >= 500) {
      std::cerr << "[HttpServer] " << method << " " << target << " -> " << response_->result_int() << std::endl;
    }
  }

  // segments can be large; the write gets its own budget
  stream_.expires_after(limits_.idle_timeout);
  http::async_write(stream_, *response_,
                    beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(),
                                              response_->need_eof()));
}

void HttpSession::onWrite(bool close_after, beast::error_code ec, std::size_t) {
  if (ec) {
    if (ec != beast::error::timeout && ec != net::error::broken_pipe && ec != net::error::connection_reset) {
      std::cerr << "[HttpServer] write: " << ec.message() << std::endl;
    }
    return;
  }
  if (close_after) {
    return close();
  }
  response_.reset();
  readRequest();
}

void HttpSession::close() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
