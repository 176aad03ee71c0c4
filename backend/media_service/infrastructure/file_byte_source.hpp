#pragma once
#include "domain/byte_source.hpp"
#include <expected>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace media_service {
class FileByteSource : public ByteSource {
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

public:
  // Fails if `path` is not a regular file or cannot be opened for reading.
  static std::expected<std::unique_ptr<FileByteSource>, std::string> open(
    const std::filesystem::path& path);

  std::expected<std::uint64_t, std::string> size() override;
  std::expected<std::string, std::string> readExactAt(
    std::uint64_t offset,
    std::uint64_t length
  ) override;

  // Reachable only through open().
  FileByteSource(PrivateTag, std::filesystem::path path, std::ifstream file);

private:

  std::filesystem::path path_;
  std::ifstream file_;
};
}
