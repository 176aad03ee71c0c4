#include "rest_api_handler_base.hpp"

namespace common {

void RestApiHandlerBase::addCorsHeaders(Response& res) {
  res.set(http::field::access_control_allow_origin, "*");
  res.set(http::field::access_control_allow_methods, "GET, OPTIONS");
  res.set(http::field::access_control_allow_headers, "Content-Type, Range");
  res.set(http::field::access_control_expose_headers, "Content-Range, Accept-Ranges, Content-Length");
}

RestApiHandlerBase::Response RestApiHandlerBase::createJsonResponse(
  http::status status, const nlohmann::json& json) {

  Response res{status, 11};
  res.set(http::field::content_type, "application/json");
  res.body() = json.dump();
  res.prepare_payload();
  return res;
}

RestApiHandlerBase::Response RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& message) {

  nlohmann::json error_json = {
    {"success", false},
    {"error", message}
  };
  return createJsonResponse(status, error_json);
}

RestApiHandlerBase::Response RestApiHandlerBase::createTextResponse(
  http::status status, const std::string& text) {

  Response res{status, 11};
  res.set(http::field::content_type, "text/plain");
  res.body() = text;
  res.prepare_payload();
  return res;
}

}
