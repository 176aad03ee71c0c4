#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <expected>
#include <string_view>
#include "common/config/config.hpp"
#include "domain/video.hpp"
#include "domain/video_repository.hpp"
#include "domain/frame_extraction_service.hpp"

namespace media_service {

enum class FrameError {
  VideoNotFound,
  ExtractionFailed
};

class VideoService {
public:
  using FrameResult = std::expected<std::string, FrameError>;
  using FrameCallback = std::function<void(FrameResult)>;

  VideoService(std::shared_ptr<const config::Config> config,
               std::shared_ptr<VideoRepository> repository,
               std::shared_ptr<FrameExtractionService> frame_extractor);

  // Looks the video up, applies the Range header and reads the bytes to send.
  // NotFound and NotSatisfiable are reported through the outcome; the error
  // side is reserved for I/O failures after the video was opened.
  std::expected<VideoDelivery, std::string> deliverVideo(
    const std::string& video_id,
    std::optional<std::string_view> range_header
  );

  // Resolves the video on the calling thread, then queues the extraction.
  // `on_done` runs inline for an unknown video and on an extractor thread
  // otherwise.
  void extractFrameAsync(
    const std::string& video_id,
    std::uint32_t seconds,
    FrameCallback on_done
  );

private:
  std::shared_ptr<const config::Config> config_;
  std::shared_ptr<VideoRepository> repository_;
  std::shared_ptr<FrameExtractionService> frame_extractor_;
};
}
