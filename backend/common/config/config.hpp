#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <chrono>
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace config {

struct StreamingConfig {
  std::string host;
  int port;
  int threads;
  std::chrono::seconds read_timeout;
};

struct RangeConfig {
  std::uint64_t chunk_size;
};

struct FrameExtractorConfig {
  std::string ffmpeg_command;
  size_t max_concurrent;
};

class Config {
public:
  // Built-in defaults, also what gets written when no config file exists.
  Config();

  static std::expected<Config, std::string> fromJson(const nlohmann::json& j);

  // Reads `path`; if it does not exist, persists the defaults there and
  // returns them. A failed write is reported but not fatal.
  static std::expected<Config, std::string> loadOrCreate(const std::filesystem::path& path);

  nlohmann::json toJson() const;

  // Getters
  const StreamingConfig& getStreaming() const { return streaming_; }
  const RangeConfig& getRange() const { return range_; }
  const FrameExtractorConfig& getFrameExtractor() const { return frame_extractor_; }
  const std::string& getStoragePath() const { return storage_path_; }
  std::string getStreamingIpPort() const { return streaming_.host+":"+std::to_string(streaming_.port);}

private:
  StreamingConfig streaming_;
  RangeConfig range_;
  FrameExtractorConfig frame_extractor_;
  std::string storage_path_;
};

} // namespace config
