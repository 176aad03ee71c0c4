#pragma once
#include "domain/video_repository.hpp"
#include <filesystem>

namespace media_service {
class FilesystemVideoRepository : public VideoRepository {
public:
  explicit FilesystemVideoRepository(std::filesystem::path storage_path);

  std::expected<std::unique_ptr<ByteSource>, std::string> open(const std::string& video_id) override;
  std::expected<std::filesystem::path, std::string> resolve(const std::string& video_id) override;

private:
  std::filesystem::path storage_path_;
};
}
