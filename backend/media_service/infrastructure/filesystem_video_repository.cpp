#include "filesystem_video_repository.hpp"
#include "file_byte_source.hpp"

namespace media_service {
namespace fs = std::filesystem;

namespace {

// A video id names one entry directly inside the storage directory.
bool isPlainFileName(const std::string& video_id) {
  if (video_id.empty() || video_id == "." || video_id == "..") {
    return false;
  }
  return video_id.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

} // namespace

FilesystemVideoRepository::FilesystemVideoRepository(fs::path storage_path)
  : storage_path_(std::move(storage_path)) {}

std::expected<fs::path, std::string> FilesystemVideoRepository::resolve(const std::string& video_id) {
  if (!isPlainFileName(video_id)) {
    return std::unexpected("Invalid video id: " + video_id);
  }

  auto path = storage_path_ / video_id;
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::unexpected("No such video file: " + path.string());
  }
  return path;
}

std::expected<std::unique_ptr<ByteSource>, std::string> FilesystemVideoRepository::open(
  const std::string& video_id) {
  auto path = resolve(video_id);
  if (!path) {
    return std::unexpected(path.error());
  }

  auto source = FileByteSource::open(*path);
  if (!source) {
    return std::unexpected(source.error());
  }
  return std::unique_ptr<ByteSource>(std::move(*source));
}
}
