#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

using Request = http::request<http::string_body, http::basic_fields<std::allocator<char>>>;
using Response = http::response<http::string_body>;

// Path split on '/', query string parsed into a map. Percent-decoding is not
// applied; every route this service exposes uses plain ids and names.
struct Target {
  std::vector<std::string> segments;
  std::map<std::string, std::string> query;

  static Target parse(std::string_view target);
};

class RestApiHandlerBase {
public:
  virtual ~RestApiHandlerBase() = default;

  template<class Body, class Allocator>
  Response handleRequest(
    http::request<Body, http::basic_fields<Allocator>>&& req) {

    auto addCorsHeaders = [](auto& res) {
      res.set(http::field::access_control_allow_origin, "*");
      res.set(http::field::access_control_allow_methods, "GET, POST, DELETE, OPTIONS");
      res.set(http::field::access_control_allow_headers, "Content-Type, Authorization, Range");
      res.set(http::field::access_control_expose_headers, "Content-Range, Content-Length, Accept-Ranges");
    };

    if (req.method() == http::verb::options) {
      Response res{http::status::no_content, req.version()};
      addCorsHeaders(res);
      res.prepare_payload();
      return res;
    }

    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();
    try {
      auto response = doHandleRequest(std::move(req));
      response.version(version);
      response.keep_alive(keep_alive);
      addCorsHeaders(response);
      return response;
    } catch (const std::exception& e) {
      auto response = createErrorResponse(http::status::internal_server_error,
                                        "Internal server error: " + std::string(e.what()));
      response.version(version);
      addCorsHeaders(response);
      return response;
    }
  }

protected:
  virtual Response doHandleRequest(Request&& req) = 0;

  Response createJsonResponse(http::status status, const nlohmann::json& json);

  Response createErrorResponse(http::status status, const std::string& message);

  Response createBodyResponse(http::status status, std::string body, const std::string& content_type);

  nlohmann::json parseRequestBody(const std::string& body);

  // access_token cookie first, then "Authorization: Bearer <token>"
  static std::string callerToken(const Request& req);
  static std::optional<std::string> cookieValue(const Request& req, std::string_view name);
};

}
