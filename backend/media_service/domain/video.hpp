#pragma once
#include <cstdint>
#include <string>

namespace media_service {

// Inclusive byte span over a video. Valid when start <= end < size.
struct ByteRange {
  std::uint64_t start{0};
  std::uint64_t end{0};

  std::uint64_t length() const { return end - start + 1; }
  bool operator==(const ByteRange&) const = default;
};

enum class DeliveryKind {
  FullBody,
  PartialBody,
  NotSatisfiable,
  NotFound
};

struct DeliveryOutcome {
  DeliveryKind kind{DeliveryKind::NotFound};
  ByteRange range;  // meaningful for PartialBody only
};

// What the response builder needs: the decision, the total resource size and
// the bytes to send (empty unless FullBody or PartialBody).
struct VideoDelivery {
  DeliveryOutcome outcome;
  std::uint64_t size{0};
  std::string body;
};

#define VIDEO_CONTENT_TYPE "video/mp4"
#define FRAME_CONTENT_TYPE "image/jpeg"

} // namespace media_service
