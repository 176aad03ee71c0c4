#pragma once

// project
#include "byte_source.hpp"

// std
#include <memory>
#include <string>
#include <expected>
#include <filesystem>

namespace media_service {

class VideoRepository {
public:
  virtual ~VideoRepository() = default;
  // Error means the video does not exist or cannot be opened.
  virtual std::expected<std::unique_ptr<ByteSource>, std::string> open(const std::string& video_id) = 0;
  virtual std::expected<std::filesystem::path, std::string> resolve(const std::string& video_id) = 0;
};

} // namespace media_service
