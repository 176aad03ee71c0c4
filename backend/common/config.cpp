#include "common/config/config.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <limits>

namespace config {

namespace {

// Missing keys keep their default; present keys must have the right type.
template <typename T>
std::expected<T, std::string> readKey(const nlohmann::json& j, const char* key, T fallback) {
  auto it = j.find(key);
  if (it == j.end()) {
    return fallback;
  }
  try {
    return it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(std::string("invalid value for '") + key + "': " + e.what());
  }
}

std::expected<std::int64_t, std::string> readInteger(const nlohmann::json& j, const char* key,
                                                     std::int64_t fallback, std::int64_t min,
                                                     std::int64_t max) {
  auto it = j.find(key);
  if (it == j.end()) {
    return fallback;
  }
  if (!it->is_number_integer()) {
    return std::unexpected(std::string("invalid value for '") + key + "': expected an integer");
  }
  if (it->is_number_unsigned()) {
    auto value = it->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(max)) {
      return std::unexpected(std::string("'") + key + "' is out of range");
    }
    return static_cast<std::int64_t>(value);
  }
  auto value = it->get<std::int64_t>();
  if (value < min || value > max) {
    return std::unexpected(std::string("'") + key + "' is out of range");
  }
  return value;
}

} // namespace

Config::Config() {
  streaming_ = {
    .host = "0.0.0.0",
    .port = 3000,
    .threads = 4,
    .read_timeout = std::chrono::seconds(30)
  };

  range_ = {
    .chunk_size = 65536
  };

  frame_extractor_ = {
    .ffmpeg_command = "ffmpeg",
    .max_concurrent = 4
  };

  storage_path_ = "videos/";
}

std::expected<Config, std::string> Config::fromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    return std::unexpected("configuration root must be an object");
  }

  Config cfg;
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kIntMax = std::numeric_limits<int>::max();

  auto storage_path = readKey<std::string>(j, "storage_path", cfg.storage_path_);
  if (!storage_path) return std::unexpected(storage_path.error());
  if (storage_path->empty()) return std::unexpected("'storage_path' must not be empty");

  auto host = readKey<std::string>(j, "host", cfg.streaming_.host);
  if (!host) return std::unexpected(host.error());

  auto port = readInteger(j, "port", cfg.streaming_.port, 1, 65535);
  if (!port) return std::unexpected(port.error());

  auto chunk_size = readInteger(j, "chunk_size", static_cast<std::int64_t>(cfg.range_.chunk_size), 1, kMax);
  if (!chunk_size) return std::unexpected(chunk_size.error());

  auto ffmpeg_command = readKey<std::string>(j, "ffmpeg_command", cfg.frame_extractor_.ffmpeg_command);
  if (!ffmpeg_command) return std::unexpected(ffmpeg_command.error());
  if (ffmpeg_command->empty()) return std::unexpected("'ffmpeg_command' must not be empty");

  auto threads = readInteger(j, "http_threads", cfg.streaming_.threads, 1, kIntMax);
  if (!threads) return std::unexpected(threads.error());

  auto read_timeout = readInteger(j, "read_timeout_seconds", cfg.streaming_.read_timeout.count(), 1, kIntMax);
  if (!read_timeout) return std::unexpected(read_timeout.error());

  auto max_concurrent = readInteger(j, "max_concurrent_extractions",
                                    static_cast<std::int64_t>(cfg.frame_extractor_.max_concurrent), 1, kIntMax);
  if (!max_concurrent) return std::unexpected(max_concurrent.error());

  cfg.storage_path_ = std::move(*storage_path);
  cfg.streaming_.host = std::move(*host);
  cfg.streaming_.port = static_cast<int>(*port);
  cfg.streaming_.threads = static_cast<int>(*threads);
  cfg.streaming_.read_timeout = std::chrono::seconds(*read_timeout);
  cfg.range_.chunk_size = static_cast<std::uint64_t>(*chunk_size);
  cfg.frame_extractor_.ffmpeg_command = std::move(*ffmpeg_command);
  cfg.frame_extractor_.max_concurrent = static_cast<size_t>(*max_concurrent);
  return cfg;
}

nlohmann::json Config::toJson() const {
  return {
    {"storage_path", storage_path_},
    {"host", streaming_.host},
    {"port", streaming_.port},
    {"chunk_size", range_.chunk_size},
    {"ffmpeg_command", frame_extractor_.ffmpeg_command},
    {"http_threads", streaming_.threads},
    {"read_timeout_seconds", streaming_.read_timeout.count()},
    {"max_concurrent_extractions", frame_extractor_.max_concurrent}
  };
}

std::expected<Config, std::string> Config::loadOrCreate(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config defaults;
    std::ofstream out(path);
    if (!(out << defaults.toJson().dump(2) << '\n')) {
      std::cerr << "Error: Failed to write default configuration to " << path.string() << std::endl;
    }
    return defaults;
  }

  std::ifstream file(path);
  if (!file) {
    return std::unexpected("Failed to read configuration: cannot open " + path.string());
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(file);
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected("Failed to parse configuration: " + std::string(e.what()));
  }

  auto cfg = fromJson(j);
  if (!cfg) {
    return std::unexpected("Failed to parse configuration: " + cfg.error());
  }
  return cfg;
}

}
