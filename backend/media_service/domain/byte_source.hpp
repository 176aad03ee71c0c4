#pragma once
#include <cstdint>
#include <string>
#include <expected>

namespace media_service {

// Seekable, readable view of one video. Opened per request, never shared.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Total length in bytes, found by seeking to the end.
  virtual std::expected<std::uint64_t, std::string> size() = 0;

  // Seeks to `offset` and reads exactly `length` bytes, or fails.
  virtual std::expected<std::string, std::string> readExactAt(
    std::uint64_t offset,
    std::uint64_t length
  ) = 0;
};

}
