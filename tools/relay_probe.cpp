/**
 * @file relay_probe.cpp
 * @brief Diagnostic: probe a URL and show where it would be stored
 *
 * @details Runs only the metadata probe and path resolution of the streaming
 *          pipeline. Nothing is downloaded or uploaded.
 *
 * @note Usage: relay_probe <url> [path_template]
 */

#include <chrono>
#include <cstdio>
#include <string>

#include <fmt/core.h>

#include "media_relay/config.hpp"
#include "media_relay/deletion_scheduler.hpp"
#include "media_relay/errors.hpp"
#include "media_relay/file_manager.hpp"
#include "media_relay/logging.hpp"
#include "media_relay/pipeline.hpp"

using namespace media_relay;

int main(int argc, char *argv[]) {
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    LOG_WARN("Usage: ./relay_probe <url> [path_template]");
    return 1;
  }

  try {
    DeletionScheduler scheduler;
    FileManager files(Config::storage_dir(), scheduler,
                      std::chrono::hours(1), Config::rclone_remote());

    PipelineRequest request;
    request.request_id = "probe";
    request.source_url = argv[1];
    request.format_selector = Config::ytdlp_format();
    request.destination_template =
        argc > 2 ? std::string(argv[2]) : Config::path_template();
    if (!Config::cookies_file().empty())
      request.cookies_file = Config::cookies_file();

    PipelineOptions options;
    options.extractor_bin = Config::ytdlp_bin();
    options.metadata_timeout =
        std::chrono::seconds(Config::metadata_timeout_sec());

    StreamingPipeline pipeline(request, options, files);
    Metadata metadata = pipeline.extract_metadata();
    std::string destination =
        files.render(request.destination_template, metadata);

    nlohmann::json out = {
        {"metadata", metadata_summary(metadata)},
        {"template", request.destination_template},
        {"destination", destination},
    };
    fmt::print("{}\n", out.dump(2));
    return 0;

  } catch (const RelayError &e) {
    LOG_ERROR("{}: {}", error_kind_name(e.kind()), e.what());
    if (!e.details().empty())
      LOG_ERROR("{}", e.details());
    return 1;
  } catch (const std::exception &e) {
    LOG_ERROR("Fatal: {}", e.what());
    return 1;
  }
}
