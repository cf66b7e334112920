/**
 * @file types.cpp
 * @brief Job state names and JSON views of status snapshots
 */

#include "media_relay/types.hpp"

namespace media_relay {

const char *job_state_name(JobState state) {
  switch (state) {
  case JobState::Pending:
    return "pending";
  case JobState::Running:
    return "running";
  case JobState::Completed:
    return "completed";
  case JobState::Failed:
    return "failed";
  case JobState::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

nlohmann::json to_json(const JobStatusInfo &info) {
  nlohmann::json j = {
      {"job_id", info.job_id},
      {"state", job_state_name(info.state)},
      {"running", info.running},
      {"done", info.done},
      {"cancelled", info.cancelled},
  };
  if (info.success)
    j["success"] = *info.success;
  if (info.error)
    j["error"] = *info.error;
  if (info.error_kind)
    j["error_kind"] = *info.error_kind;
  return j;
}

nlohmann::json to_json(const QueueStats &stats) {
  return {
      {"started", stats.started},
      {"max_workers", stats.max_workers},
      {"max_concurrent_downloads", stats.max_concurrent},
      {"active_jobs", stats.active},
      {"running_jobs", stats.running},
      {"completed_jobs", stats.completed},
      {"total_submitted", stats.total_submitted},
      {"total_succeeded", stats.total_succeeded},
      {"total_failed", stats.total_failed},
      {"shutdown_pending", stats.shutdown_pending},
  };
}

} // namespace media_relay
