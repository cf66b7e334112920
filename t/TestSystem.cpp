#include "media_relay/system.hpp"
#include "media_relay/types.hpp"

#include <gtest/gtest.h>

#include <regex>
#include <set>

using namespace media_relay;

TEST(System, ParseSizeUnits) {
  EXPECT_EQ(parse_size("17"), 17u);
  EXPECT_EQ(parse_size("17 B"), 17u);
  EXPECT_EQ(parse_size("17.00B"), 17u);
  EXPECT_EQ(parse_size("2.000 KiB"), 2048u);
  EXPECT_EQ(parse_size("~1.50MiB"), 1572864u);
  EXPECT_EQ(parse_size("~ 5.00GiB"), 5ULL * 1024 * 1024 * 1024);
  EXPECT_EQ(parse_size("1 TiB"), 1ULL << 40);
  EXPECT_EQ(parse_size("3kB"), 3000u);
  EXPECT_EQ(parse_size("1.2 MB"), 1200000u);
  EXPECT_EQ(parse_size("4 GB"), 4000000000u);
}

TEST(System, ParseSizeRejectsNonSizes) {
  EXPECT_FALSE(parse_size("").has_value());
  EXPECT_FALSE(parse_size("Unknown").has_value());
  EXPECT_FALSE(parse_size("~").has_value());
  EXPECT_FALSE(parse_size("12 parsecs").has_value());
}

TEST(System, FormatBytes) {
  EXPECT_EQ(format_bytes(0), "0 B");
  EXPECT_EQ(format_bytes(1023), "1023 B");
  EXPECT_EQ(format_bytes(1024), "1.0 KiB");
  EXPECT_EQ(format_bytes(1536 * 1024), "1.5 MiB");
  EXPECT_EQ(format_bytes(10ULL * 1024 * 1024 * 1024), "10.0 GiB");
}

TEST(System, FormatTime) {
  EXPECT_EQ(format_time(0), "00:00:00");
  EXPECT_EQ(format_time(61.9), "00:01:01");
  EXPECT_EQ(format_time(7322), "02:02:02");
}

TEST(System, RandomHex) {
  std::string hex = random_hex(4);
  EXPECT_TRUE(std::regex_match(hex, std::regex("[0-9a-f]{8}")));
  EXPECT_EQ(random_hex(0), "");
}

TEST(System, UuidsAreVersionFourAndDistinct) {
  const std::regex v4(
      "[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}");
  std::set<std::string> seen;
  for (int i = 0; i < 100; ++i) {
    std::string id = make_uuid();
    EXPECT_TRUE(std::regex_match(id, v4)) << id;
    seen.insert(id);
  }
  EXPECT_EQ(seen.size(), 100u);
}

TEST(System, WorkerCount) {
  EXPECT_EQ(resolve_worker_count(3), 3);
  EXPECT_GE(resolve_worker_count(0), 2);
  EXPECT_GE(detect_cpu_limit(), 1);
}

TEST(Types, JobStateNames) {
  EXPECT_STREQ(job_state_name(JobState::Pending), "pending");
  EXPECT_STREQ(job_state_name(JobState::Cancelled), "cancelled");
  EXPECT_FALSE(is_terminal(JobState::Running));
  EXPECT_TRUE(is_terminal(JobState::Failed));
}

TEST(Types, StatusJson) {
  JobStatusInfo info;
  info.job_id = "job-1";
  info.state = JobState::Failed;
  info.done = true;
  info.success = false;
  info.error = "boom";
  info.error_kind = "UploadFailed";

  nlohmann::json j = to_json(info);
  EXPECT_EQ(j["state"], "failed");
  EXPECT_EQ(j["success"], false);
  EXPECT_EQ(j["error_kind"], "UploadFailed");

  JobStatusInfo pending;
  pending.job_id = "job-2";
  EXPECT_FALSE(to_json(pending).contains("success"));
}
