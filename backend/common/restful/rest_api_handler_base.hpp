#pragma once
#include <functional>
#include <memory>
#include <string>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

class RestApiHandlerBase {
public:
  using Response = http::response<http::string_body>;
  // Receives the finished response; may run on any thread.
  using ResponseCallback = std::function<void(Response)>;

  virtual ~RestApiHandlerBase() = default;

  template<class Body, class Allocator>
  void handleRequest(
    http::request<Body, http::basic_fields<Allocator>>&& req,
    ResponseCallback on_response) {

    if (req.method() == http::verb::options) {
      Response res{http::status::ok, req.version()};
      addCorsHeaders(res);
      res.prepare_payload();
      on_response(std::move(res));
      return;
    }

    const auto version = req.version();
    const bool keep_alive = req.keep_alive();
    auto finish = [on_response = std::move(on_response), version, keep_alive](Response response) {
      response.version(version);
      response.keep_alive(keep_alive);
      addCorsHeaders(response);
      on_response(std::move(response));
    };

    try {
      doHandleRequest(std::move(req), finish);
    } catch (const std::exception& e) {
      finish(createErrorResponse(http::status::internal_server_error,
                                 "Internal server error: " + std::string(e.what())));
    }
  }

protected:
  // Must call `on_response` exactly once, unless it throws first.
  virtual void doHandleRequest(
    http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req,
    ResponseCallback on_response) = 0;

  static Response createJsonResponse(http::status status, const nlohmann::json& json);

  static Response createErrorResponse(http::status status, const std::string& message);

  static Response createTextResponse(http::status status, const std::string& text);

private:
  static void addCorsHeaders(Response& res);
};

}
