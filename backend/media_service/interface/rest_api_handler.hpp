#pragma once
#include "application/video_service.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace media_service {

// Routes:
//   GET /video/{video}            full or ranged video bytes
//   GET /frame/{video}?t=<secs>   one JPEG frame
class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(std::shared_ptr<VideoService> video_service);

  static Response buildVideoResponse(VideoDelivery&& delivery);

protected:
  void doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req,
      ResponseCallback on_response) override;

private:
  std::shared_ptr<VideoService> video_service_;

  Response handleGetVideo(const std::string &video_id,
                          std::optional<std::string_view> range);
  // Answers through `on_response` once the extractor is done; never waits for it.
  void handleGetFrame(const std::string &video_id, std::string_view query,
                      ResponseCallback on_response);
};

// Percent-decodes one path segment; nullopt on a malformed escape.
std::optional<std::string> decodePathSegment(std::string_view segment);

// Value of `key` in an URL query string, undecoded.
std::optional<std::string_view> findQueryParam(std::string_view query, std::string_view key);

} // namespace media_service
