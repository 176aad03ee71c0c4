#include "video_service.hpp"
#include "range_delivery.hpp"
#include <iostream>

namespace media_service {
VideoService::VideoService(std::shared_ptr<const config::Config> config,
                           std::shared_ptr<VideoRepository> repository,
                           std::shared_ptr<FrameExtractionService> frame_extractor)
  : config_(std::move(config)),
    repository_(std::move(repository)),
    frame_extractor_(std::move(frame_extractor)) {}

std::expected<VideoDelivery, std::string> VideoService::deliverVideo(
  const std::string& video_id,
  std::optional<std::string_view> range_header
) {
  VideoDelivery delivery;

  auto source = repository_->open(video_id);
  if (!source) {
    std::cerr << "Error: Failed to open video `" << video_id << "`: " << source.error() << std::endl;
    delivery.outcome.kind = DeliveryKind::NotFound;
    return delivery;
  }

  auto size = (*source)->size();
  if (!size) {
    return std::unexpected(size.error());
  }
  delivery.size = *size;

  auto candidate = parseRangeHeader(range_header, *size, config_->getRange().chunk_size);
  delivery.outcome = selectDelivery(candidate, *size);

  std::expected<std::string, std::string> body;
  switch (delivery.outcome.kind) {
    case DeliveryKind::FullBody:
      body = (*source)->readExactAt(0, *size);
      break;
    case DeliveryKind::PartialBody:
      body = (*source)->readExactAt(delivery.outcome.range.start, delivery.outcome.range.length());
      break;
    case DeliveryKind::NotSatisfiable:
    case DeliveryKind::NotFound:
      return delivery;
  }

  if (!body) {
    return std::unexpected(body.error());
  }
  delivery.body = std::move(*body);
  return delivery;
}

void VideoService::extractFrameAsync(
  const std::string& video_id,
  std::uint32_t seconds,
  FrameCallback on_done
) {
  auto path = repository_->resolve(video_id);
  if (!path) {
    std::cerr << "Error: Failed to find video `" << video_id << "`: " << path.error() << std::endl;
    on_done(std::unexpected(FrameError::VideoNotFound));
    return;
  }

  frame_extractor_->extractFrameAsync(*path, seconds,
    [on_done = std::move(on_done)](FrameExtractionService::ExtractResult result) {
      if (!result) {
        std::cerr << "Error: Failed to extract frame: " << result.error() << std::endl;
        on_done(std::unexpected(FrameError::ExtractionFailed));
        return;
      }
      on_done(std::move(*result));
    });
}

}
