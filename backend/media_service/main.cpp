#include "application/video_service.hpp"
#include "infrastructure/filesystem_video_repository.hpp"
#include "infrastructure/subprocess_frame_extractor.hpp"
#include "interface/rest_api_handler.hpp"
#include "common/config/config.hpp"
#include "common/restful/http_server.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>
#include <boost/asio.hpp>

int main(int argc, char** argv) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "config.json";
    auto loaded = config::Config::loadOrCreate(config_path);
    if (!loaded) {
      std::cerr << "Error: " << loaded.error() << std::endl;
      return 1;
    }
    auto cfg = std::make_shared<const config::Config>(std::move(*loaded));
    std::cout << "Serving videos from " << cfg->getStoragePath() << std::endl;

    // Declared before the services: pending frame callbacks post onto it
    // while the extractor drains its queue on destruction.
    const auto& streaming_config = cfg->getStreaming();
    boost::asio::io_context ioc{streaming_config.threads};

    std::shared_ptr<media_service::VideoRepository> repository =
      std::make_shared<media_service::FilesystemVideoRepository>(cfg->getStoragePath());

    std::shared_ptr<media_service::FrameExtractionService> frame_extractor =
      std::make_shared<media_service::SubprocessFrameExtractor>(cfg->getFrameExtractor());

    auto video_service = std::make_shared<media_service::VideoService>(
      cfg, repository, frame_extractor
    );

    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(streaming_config.host),
      static_cast<unsigned short>(streaming_config.port)
    };

    auto api_handler = std::make_shared<media_service::RestApiHandler>(video_service);
    common::HttpServer http_server{ioc, http_endpoint, api_handler, streaming_config.read_timeout};

    std::cout << "Server listening on " << cfg->getStreamingIpPort() << std::endl;

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc, &http_server](const boost::system::error_code&, int) {
      std::cout << "Shutting down" << std::endl;
      http_server.stop();
      ioc.stop();
    });

    http_server.run();

    std::vector<std::thread> workers;
    workers.reserve(streaming_config.threads - 1);
    for (int i = 1; i < streaming_config.threads; ++i) {
      workers.emplace_back([&ioc]() { ioc.run(); });
    }
    ioc.run();

    for (auto& worker : workers) {
      if (worker.joinable()) {
        worker.join();
      }
    }

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
