// subprocess_frame_extractor.hpp
#pragma once

#include "domain/frame_extraction_service.hpp"
#include "common/config/config.hpp"

#include <functional>
#include <future>
#include <string>
#include <expected>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <vector>

namespace media_service {

// Runs the configured ffmpeg-compatible command once per frame request.
// Jobs queue up behind a fixed number of workers, so no more than
// `max_concurrent` external processes run at the same time.
class SubprocessFrameExtractor : public FrameExtractionService {
public:
  explicit SubprocessFrameExtractor(const config::FrameExtractorConfig& cfg);
  ~SubprocessFrameExtractor();

  ExtractResult extractFrame(
    const std::filesystem::path& input_path,
    std::uint32_t seconds
  ) override;

  void extractFrameAsync(
    const std::filesystem::path& input_path,
    std::uint32_t seconds,
    ExtractCallback on_done
  ) override;

  void waitForAll();

  std::vector<std::string> buildFFmpegArgs(const std::filesystem::path& input_path,
                                           std::uint32_t seconds) const;

private:
  ExtractResult executeExtract(const std::vector<std::string>& args);
  std::string resolveCommand() const;

  std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::condition_variable idle_;
  std::queue<std::function<void()>> tasks_;
  std::vector<std::future<void>> workers_;
  size_t active_{0};
  bool stop_;
  const size_t max_threads_;
  const std::string command_;
  const std::string executable_;
};

} // namespace media_service
