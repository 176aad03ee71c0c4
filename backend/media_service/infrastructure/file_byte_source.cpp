#include "file_byte_source.hpp"
#include <limits>

namespace media_service {
namespace fs = std::filesystem;

FileByteSource::FileByteSource(PrivateTag, fs::path path, std::ifstream file)
  : path_(std::move(path)), file_(std::move(file)) {}

std::expected<std::unique_ptr<FileByteSource>, std::string> FileByteSource::open(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::unexpected("No such video file: " + path.string());
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected("Failed to open video file: " + path.string());
  }

  return std::make_unique<FileByteSource>(PrivateTag{}, path, std::move(file));
}

std::expected<std::uint64_t, std::string> FileByteSource::size() {
  file_.clear();
  if (!file_.seekg(0, std::ios::end)) {
    return std::unexpected("Failed to seek to end of " + path_.string());
  }
  auto end = file_.tellg();
  if (end < 0) {
    return std::unexpected("Failed to determine size of " + path_.string());
  }
  return static_cast<std::uint64_t>(end);
}

std::expected<std::string, std::string> FileByteSource::readExactAt(std::uint64_t offset,
                                                                    std::uint64_t length) {
  constexpr auto kMaxOffset = static_cast<std::uint64_t>(std::numeric_limits<std::streamoff>::max());
  if (offset > kMaxOffset || length > kMaxOffset) {
    return std::unexpected("Requested span is too large for " + path_.string());
  }

  file_.clear();
  if (!file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg)) {
    return std::unexpected("Failed to seek to " + std::to_string(offset) + " in " + path_.string());
  }

  std::string buffer(static_cast<size_t>(length), '\0');
  file_.read(buffer.data(), static_cast<std::streamsize>(length));
  if (static_cast<std::uint64_t>(file_.gcount()) != length) {
    return std::unexpected("Short read from " + path_.string() + ": wanted " +
                           std::to_string(length) + " bytes, got " +
                           std::to_string(file_.gcount()));
  }
  return buffer;
}
}
