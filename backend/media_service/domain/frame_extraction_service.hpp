#pragma once
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>

namespace media_service {
class FrameExtractionService {
public:
  using ExtractResult = std::expected<std::string, std::string>;
  using ExtractCallback = std::function<void(ExtractResult)>;

  virtual ~FrameExtractionService() = default;
  // Returns the encoded JPEG bytes of the frame at `seconds`.
  virtual ExtractResult extractFrame(
    const std::filesystem::path& input_path,
    std::uint32_t seconds
  ) = 0;
  // Queues the extraction and returns at once. `on_done` runs on an
  // extractor thread, never on the caller's.
  virtual void extractFrameAsync(
    const std::filesystem::path& input_path,
    std::uint32_t seconds,
    ExtractCallback on_done
  ) = 0;
};
}
