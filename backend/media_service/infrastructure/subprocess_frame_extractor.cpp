// subprocess_frame_extractor.cpp
#include "subprocess_frame_extractor.hpp"
#include <iostream>
#include <iterator>
#include <boost/process.hpp>

namespace media_service {
namespace bp = boost::process;

SubprocessFrameExtractor::SubprocessFrameExtractor(const config::FrameExtractorConfig& cfg)
    : stop_(false), max_threads_(cfg.max_concurrent), command_(cfg.ffmpeg_command),
      executable_(resolveCommand()) {
  if (executable_.empty()) {
    std::cerr << "Warning: frame extractor '" << command_ << "' not found in PATH" << std::endl;
  }

  for (size_t i = 0; i < max_threads_; ++i) {
    workers_.emplace_back(std::async(std::launch::async, [this] {
      while (true) {
        std::function<void()> task;

        {
          std::unique_lock<std::mutex> lock(queue_mutex_);
          condition_.wait(lock, [this] {
            return stop_ || !tasks_.empty();
          });

          if (stop_ && tasks_.empty()) return;

          task = std::move(tasks_.front());
          tasks_.pop();
          ++active_;
        }

        try {
          task();
        } catch (const std::exception& e) {
          std::cerr << "Error: frame extraction callback failed: " << e.what() << std::endl;
        }

        {
          std::unique_lock<std::mutex> lock(queue_mutex_);
          --active_;
        }
        idle_.notify_all();
      }
    }));
  }
}

SubprocessFrameExtractor::~SubprocessFrameExtractor() {
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    stop_ = true;
  }

  condition_.notify_all();

  for (auto& worker : workers_) {
    if (worker.valid()) {
      worker.wait();
    }
  }
}

std::string SubprocessFrameExtractor::resolveCommand() const {
  if (command_.find('/') != std::string::npos) {
    return command_;
  }
  return bp::search_path(command_).string();
}

std::vector<std::string> SubprocessFrameExtractor::buildFFmpegArgs(
    const std::filesystem::path& input_path, std::uint32_t seconds) const {
  return {
    "-ss", std::to_string(seconds),
    "-i", input_path.string(),
    "-vframes", "1",
    "-f", "image2pipe",
    "-vcodec", "mjpeg",
    "-"
  };
}

FrameExtractionService::ExtractResult SubprocessFrameExtractor::executeExtract(
    const std::vector<std::string>& args) {
  if (executable_.empty()) {
    return std::unexpected("'" + command_ + "' is not installed or not found in PATH");
  }

  try {
    bp::ipstream output;
    bp::child child(bp::exe = executable_, bp::args = args,
                    bp::std_in < bp::null,
                    bp::std_out > output,
                    bp::std_err > bp::null);

    std::string image{std::istreambuf_iterator<char>(output), std::istreambuf_iterator<char>()};
    child.wait();

    if (child.exit_code() != 0) {
      return std::unexpected(command_ + " exited with code: " + std::to_string(child.exit_code()));
    }
    if (image.empty()) {
      return std::unexpected(command_ + " produced no image data");
    }
    return image;
  } catch (const bp::process_error& e) {
    return std::unexpected("Failed to run " + command_ + ": " + e.what());
  }
}

FrameExtractionService::ExtractResult SubprocessFrameExtractor::extractFrame(
    const std::filesystem::path& input_path,
    std::uint32_t seconds) {
  return executeExtract(buildFFmpegArgs(input_path, seconds));
}

void SubprocessFrameExtractor::extractFrameAsync(
    const std::filesystem::path& input_path,
    std::uint32_t seconds,
    ExtractCallback on_done) {

  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    tasks_.push([this, input_path, seconds, on_done = std::move(on_done)]() {
      on_done(this->extractFrame(input_path, seconds));
    });
  }

  condition_.notify_one();
}

void SubprocessFrameExtractor::waitForAll() {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  idle_.wait(lock, [this]() { return tasks_.empty() && active_ == 0; });
}

} // namespace media_service
