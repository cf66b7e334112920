/**
 * @file main.cpp
 * @brief Entry point for the media_relay application
 *
 * @details Composition root that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Wiring of the single DeletionScheduler, FileManager and
 *            QueueManager instances
 *
 *          - One streaming job per URL, results printed as JSON lines
 *
 * @note Usage: media_relay [--linger] <url>...
 *       With --linger the process stays up until every scheduled deletion has
 *       fired; otherwise pending deletions are dropped at exit.
 */

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "media_relay/config.hpp"
#include "media_relay/deletion_scheduler.hpp"
#include "media_relay/errors.hpp"
#include "media_relay/file_manager.hpp"
#include "media_relay/logging.hpp"
#include "media_relay/pipeline.hpp"
#include "media_relay/queue_manager.hpp"
#include "media_relay/system.hpp"

using namespace media_relay;

namespace {

/// Upper bound for a remote deletefile call
constexpr std::chrono::seconds REMOTE_DELETE_TIMEOUT{60};

PipelineOptions pipeline_options() {
  PipelineOptions options;
  options.extractor_bin = Config::ytdlp_bin();
  options.uploader_bin = Config::rclone_bin();
  options.remote = Config::rclone_remote();
  options.metadata_timeout = std::chrono::seconds(Config::metadata_timeout_sec());
  return options;
}

PipelineRequest pipeline_request(const std::string &request_id,
                                 const std::string &url) {
  PipelineRequest request;
  request.request_id = request_id;
  request.source_url = url;
  request.format_selector = Config::ytdlp_format();
  request.destination_template = Config::path_template();
  request.timeout = std::chrono::seconds(Config::default_timeout_sec());
  request.stall_timeout = std::chrono::seconds(Config::progress_timeout_sec());
  request.max_content_length = Config::max_content_length();
  if (!Config::cookies_file().empty())
    request.cookies_file = Config::cookies_file();
  return request;
}

nlohmann::json error_json(const std::string &job_id, const RelayError &e) {
  nlohmann::json out = {
      {"job_id", job_id},
      {"error", e.what()},
      {"kind", error_kind_name(e.kind())},
      {"status", e.http_status()},
  };
  if (!e.details().empty())
    out["details"] = e.details();
  return out;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  bool linger = false;
  std::vector<std::string> urls;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--linger")
      linger = true;
    else
      urls.push_back(std::move(arg));
  }

  if (urls.empty()) {
    LOG_WARN("Usage: ./media_relay [--linger] <url>...");
    return 1;
  }

  try {
    LOG_PHASE("Media Relay");

    // **---- WIRING ----**

    const std::string remote = Config::rclone_remote();
    Deleter deleter = remote.empty()
                          ? local_file_deleter()
                          : make_remote_deleter(Config::rclone_bin(), remote,
                                                REMOTE_DELETE_TIMEOUT);
    DeletionScheduler scheduler(std::move(deleter));

    auto retention = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::duration<double, std::ratio<3600>>(
            Config::file_retention_hours()));
    FileManager files(Config::storage_dir(), scheduler, retention, remote);

    if (remote.empty()) {
      StorageStats stats = files.storage_stats();
      LOG_INFO("Storage {}: {} files, {}", stats.storage_dir,
               stats.total_files, format_bytes(stats.total_bytes));
    } else {
      LOG_INFO("Uploading to remote '{}'", remote);
    }

    QueueOptions queue_options;
    queue_options.workers = resolve_worker_count(Config::workers());
    queue_options.max_concurrent = Config::max_concurrent_downloads();
    queue_options.default_job_timeout =
        std::chrono::seconds(Config::job_timeout_sec());
    QueueManager queue(queue_options);
    queue.start();

    const PipelineOptions options = pipeline_options();

    // **---- SUBMISSION ----**

    std::vector<std::shared_ptr<JobHandle>> jobs;
    for (size_t i = 0; i < urls.size(); ++i) {
      const std::string job_id = fmt::format("job-{}-{}", i + 1, random_hex(3));
      PipelineRequest request = pipeline_request(job_id, urls[i]);

      JobTask task = [request, options, &files](JobContext &context) {
        StreamingPipeline pipeline(request, options, files, {},
                                   context.token());
        PipelineResult result = pipeline.execute();

        ScheduledDeletion deletion = files.schedule_deletion(result.object_path);
        nlohmann::json out = result.to_json();
        out["job_id"] = context.job_id();
        out["deletion_task_id"] = deletion.task_id;
        out["deletion_time"] = std::chrono::duration_cast<std::chrono::seconds>(
                                   deletion.fire_time.time_since_epoch())
                                   .count();
        return out;
      };

      /// More URLs than the queue admits: wait for the oldest job to drain
      while (true) {
        try {
          jobs.push_back(queue.submit(job_id, task));
          break;
        } catch (const QueueFull &e) {
          LOG_DEBUG("{}; waiting for a job to finish", e.what());
          for (const auto &job : jobs) {
            if (job->wait(std::chrono::milliseconds(0)))
              continue;
            job->wait(std::chrono::seconds(1));
            break;
          }
        }
      }
    }

    // **---- RESULTS ----**

    const auto wait_limit =
        queue_options.default_job_timeout + std::chrono::minutes(1);
    int failures = 0;
    for (const auto &job : jobs) {
      if (!job->wait(std::chrono::duration_cast<std::chrono::milliseconds>(
              wait_limit))) {
        LOG_ERROR("Job {} did not finish in time", job->job_id());
        ++failures;
        continue;
      }
      try {
        fmt::print("{}\n", job->take_result().dump());
      } catch (const RelayError &e) {
        fmt::print("{}\n", error_json(job->job_id(), e).dump());
        ++failures;
      } catch (const std::exception &e) {
        nlohmann::json out = {{"job_id", job->job_id()},
                              {"error", e.what()},
                              {"status", 500}};
        fmt::print("{}\n", out.dump());
        ++failures;
      }
    }

    queue.shutdown(true);

    if (failures == 0)
      LOG_SUCCESS("All {} jobs completed", jobs.size());
    else
      LOG_ERROR("{} of {} jobs failed", failures, jobs.size());

    // **---- EXPIRY ----**

    if (linger) {
      while (scheduler.pending_count() > 0) {
        LOG_INFO("Waiting for {} scheduled deletion(s)...",
                 scheduler.pending_count());
        std::this_thread::sleep_for(std::chrono::seconds(30));
      }
    }
    scheduler.shutdown();

    TimingCollector::print_summary();
    return failures == 0 ? 0 : 1;

  } catch (const RelayError &e) {
    LOG_ERROR("{}: {}", error_kind_name(e.kind()), e.what());
    return 1;
  } catch (const std::exception &e) {
    LOG_ERROR("Fatal: {}", e.what());
    return 1;
  }
}
