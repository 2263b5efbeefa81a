#include "rest_api_handler_base.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace common {

Target Target::parse(std::string_view target) {
  Target out;
  std::string_view path = target;
  std::string_view query;
  if (auto pos = target.find('?'); pos != std::string_view::npos) {
    path = target.substr(0, pos);
    query = target.substr(pos + 1);
  }

  size_t start = 0;
  while (start <= path.size()) {
    auto end = path.find('/', start);
    if (end == std::string_view::npos) {
      end = path.size();
    }
    if (end > start) {
      out.segments.emplace_back(path.substr(start, end - start));
    }
    start = end + 1;
  }

  start = 0;
  while (start < query.size()) {
    auto end = query.find('&', start);
    if (end == std::string_view::npos) {
      end = query.size();
    }
    auto pair = query.substr(start, end - start);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      if (eq == std::string_view::npos) {
        out.query.emplace(std::string(pair), "");
      } else {
        out.query.emplace(std::string(pair.substr(0, eq)), std::string(pair.substr(eq + 1)));
      }
    }
    start = end + 1;
  }
  return out;
}

Response RestApiHandlerBase::createJsonResponse(
  http::status status, const nlohmann::json& json) {

  Response res{status, 11};
  res.set(http::field::content_type, "application/json");
  res.body() = json.dump();
  res.prepare_payload();
  return res;
}

Response RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& message) {

  nlohmann::json error_json = {
    {"success", false},
    {"error", message}
  };
  return createJsonResponse(status, error_json);
}

Response RestApiHandlerBase::createBodyResponse(
  http::status status, std::string body, const std::string& content_type) {

  Response res{status, 11};
  res.set(http::field::content_type, content_type);
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

nlohmann::json RestApiHandlerBase::parseRequestBody(const std::string& body) {
  try {
    if (body.empty()) {
        return nlohmann::json::object();
    }
    return nlohmann::json::parse(body);
  } catch (const std::exception& e) {
    throw std::invalid_argument("Invalid JSON in request body: " + std::string(e.what()));
  }
}

std::optional<std::string> RestApiHandlerBase::cookieValue(const Request& req, std::string_view name) {
  auto it = req.find(http::field::cookie);
  if (it == req.end()) {
    return std::nullopt;
  }
  std::string_view cookies{it->value().data(), it->value().size()};
  size_t start = 0;
  while (start < cookies.size()) {
    auto end = cookies.find(';', start);
    if (end == std::string_view::npos) {
      end = cookies.size();
    }
    std::string pair{cookies.substr(start, end - start)};
    boost::algorithm::trim(pair);
    auto eq = pair.find('=');
    if (eq != std::string::npos && std::string_view(pair).substr(0, eq) == name) {
      return pair.substr(eq + 1);
    }
    start = end + 1;
  }
  return std::nullopt;
}

std::string RestApiHandlerBase::callerToken(const Request& req) {
  if (auto cookie = cookieValue(req, "access_token"); cookie && !cookie->empty()) {
    return *cookie;
  }
  auto it = req.find(http::field::authorization);
  if (it != req.end()) {
    std::string value{it->value().data(), it->value().size()};
    if (boost::algorithm::istarts_with(value, "Bearer ")) {
      auto token = value.substr(7);
      boost::algorithm::trim(token);
      return token;
    }
  }
  return {};
}

}
