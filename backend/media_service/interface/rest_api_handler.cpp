#include "rest_api_handler.hpp"
#include <charconv>
#include <format>
#include <iostream>

namespace media_service {

namespace {

constexpr std::string_view kVideoPrefix = "/video/";
constexpr std::string_view kFramePrefix = "/frame/";

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// "/video/abc.mp4" -> "abc.mp4"; nullopt unless exactly one non-empty segment follows.
std::optional<std::string_view> matchSegment(std::string_view path, std::string_view prefix) {
  if (!path.starts_with(prefix)) {
    return std::nullopt;
  }
  auto segment = path.substr(prefix.size());
  if (segment.empty() || segment.find('/') != std::string_view::npos) {
    return std::nullopt;
  }
  return segment;
}

} // namespace

std::optional<std::string> decodePathSegment(std::string_view segment) {
  std::string decoded;
  decoded.reserve(segment.size());
  for (size_t i = 0; i < segment.size(); ++i) {
    if (segment[i] != '%') {
      decoded.push_back(segment[i]);
      continue;
    }
    if (i + 2 >= segment.size()) {
      return std::nullopt;
    }
    int hi = hexValue(segment[i + 1]);
    int lo = hexValue(segment[i + 2]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<char>(hi * 16 + lo));
    i += 2;
  }
  return decoded;
}

std::optional<std::string_view> findQueryParam(std::string_view query, std::string_view key) {
  while (!query.empty()) {
    auto amp = query.find('&');
    auto pair = query.substr(0, amp);
    auto eq = pair.find('=');
    auto name = pair.substr(0, eq);
    if (name == key) {
      return eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1);
    }
    if (amp == std::string_view::npos) {
      break;
    }
    query.remove_prefix(amp + 1);
  }
  return std::nullopt;
}

RestApiHandler::RestApiHandler(std::shared_ptr<VideoService> video_service)
    : video_service_(std::move(video_service)) {}

void RestApiHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req,
    ResponseCallback on_response) {
  std::string_view target{req.target().data(), req.target().size()};
  std::string_view query;
  if (auto q = target.find('?'); q != std::string_view::npos) {
    query = target.substr(q + 1);
    target = target.substr(0, q);
  }

  auto video_segment = matchSegment(target, kVideoPrefix);
  auto frame_segment = matchSegment(target, kFramePrefix);
  if (!video_segment && !frame_segment) {
    return on_response(createErrorResponse(http::status::not_found, "Endpoint not found"));
  }
  if (req.method() != http::verb::get) {
    auto res = createErrorResponse(http::status::method_not_allowed, "Method not allowed");
    res.set(http::field::allow, "GET, OPTIONS");
    return on_response(std::move(res));
  }

  auto video_id = decodePathSegment(video_segment ? *video_segment : *frame_segment);
  if (!video_id) {
    return on_response(createTextResponse(http::status::not_found, "Video not found"));
  }

  if (video_segment) {
    std::optional<std::string_view> range;
    if (auto it = req.find(http::field::range); it != req.end()) {
      range = std::string_view{it->value().data(), it->value().size()};
    }
    return on_response(handleGetVideo(*video_id, range));
  }
  handleGetFrame(*video_id, query, std::move(on_response));
}

RestApiHandler::Response
RestApiHandler::handleGetVideo(const std::string &video_id,
                               std::optional<std::string_view> range) {
  auto delivery = video_service_->deliverVideo(video_id, range);
  if (!delivery) {
    std::cerr << "Error: Failed to read video `" << video_id << "`: " << delivery.error() << std::endl;
    return createTextResponse(http::status::internal_server_error, "Failed to read video");
  }
  return buildVideoResponse(std::move(*delivery));
}

RestApiHandler::Response
RestApiHandler::buildVideoResponse(VideoDelivery &&delivery) {
  const auto &outcome = delivery.outcome;
  switch (outcome.kind) {
    case DeliveryKind::NotFound:
      return createTextResponse(http::status::not_found, "Video not found");
    case DeliveryKind::NotSatisfiable:
      return createTextResponse(http::status::range_not_satisfiable, "Range Not Satisfiable");
    case DeliveryKind::FullBody: {
      http::response<http::string_body> res{http::status::ok, 11};
      res.set(http::field::accept_ranges, "bytes");
      res.body() = std::move(delivery.body);
      res.prepare_payload();
      return res;
    }
    case DeliveryKind::PartialBody: {
      http::response<http::string_body> res{http::status::partial_content, 11};
      res.set(http::field::content_range,
              std::format("bytes {}-{}/{}", outcome.range.start, outcome.range.end, delivery.size));
      res.set(http::field::accept_ranges, "bytes");
      res.set(http::field::content_type, VIDEO_CONTENT_TYPE);
      res.body() = std::move(delivery.body);
      res.prepare_payload();
      return res;
    }
  }
  return createTextResponse(http::status::internal_server_error, "Failed to read video");
}

void RestApiHandler::handleGetFrame(const std::string &video_id, std::string_view query,
                                    ResponseCallback on_response) {
  auto t = findQueryParam(query, "t");
  if (!t) {
    return on_response(createErrorResponse(http::status::bad_request, "Missing query parameter: t"));
  }

  std::uint32_t seconds = 0;
  auto [ptr, ec] = std::from_chars(t->data(), t->data() + t->size(), seconds);
  if (t->empty() || ec != std::errc{} || ptr != t->data() + t->size()) {
    return on_response(createErrorResponse(http::status::bad_request, "Invalid query parameter: t"));
  }

  video_service_->extractFrameAsync(video_id, seconds,
    [on_response = std::move(on_response)](VideoService::FrameResult frame) {
      if (!frame) {
        if (frame.error() == FrameError::VideoNotFound) {
          return on_response(createTextResponse(http::status::not_found, "Video not found"));
        }
        return on_response(createTextResponse(http::status::internal_server_error,
                                              "Failed to extract frame"));
      }

      Response res{http::status::ok, 11};
      res.set(http::field::content_type, FRAME_CONTENT_TYPE);
      res.body() = std::move(*frame);
      res.prepare_payload();
      on_response(std::move(res));
    });
}

} // namespace media_service
