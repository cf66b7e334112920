#include "media_relay/errors.hpp"

#include <gtest/gtest.h>

#include <cerrno>

using namespace media_relay;
using namespace std::chrono_literals;

TEST(Errors, StatusMapping) {
  EXPECT_EQ(http_status(ErrorKind::PipelineTimeout), 408);
  EXPECT_EQ(http_status(ErrorKind::ProgressTimeout), 408);
  EXPECT_EQ(http_status(ErrorKind::JobTimeout), 408);
  EXPECT_EQ(http_status(ErrorKind::QueueFull), 503);
  EXPECT_EQ(http_status(ErrorKind::SchedulerShutdown), 503);
  EXPECT_EQ(http_status(ErrorKind::JobCancelled), 499);
  EXPECT_EQ(http_status(ErrorKind::ContentTooLarge), 413);
  EXPECT_EQ(http_status(ErrorKind::MetadataError), 422);
  EXPECT_EQ(http_status(ErrorKind::ExtractionFailed), 500);
  EXPECT_EQ(http_status(ErrorKind::StorageError), 500);
}

TEST(Errors, KindNames) {
  EXPECT_STREQ(error_kind_name(ErrorKind::ProgressTimeout), "ProgressTimeout");
  EXPECT_STREQ(error_kind_name(ErrorKind::QueueFull), "QueueFull");
  EXPECT_STREQ(error_kind_name(ErrorKind::SpawnError), "SpawnError");
}

TEST(Errors, ProcessFailureKeepsExitCodeAndStderr) {
  UploadFailed e(7, "NOTICE: quota exceeded");
  EXPECT_EQ(e.kind(), ErrorKind::UploadFailed);
  EXPECT_EQ(e.exit_code(), 7);
  EXPECT_EQ(e.details(), "NOTICE: quota exceeded");
  EXPECT_STREQ(e.what(), "upload process failed (exit 7)");

  /// Catchable through the common bases
  try {
    throw ExtractionFailed(1, "tail");
  } catch (const ProcessFailed &p) {
    EXPECT_EQ(p.kind(), ErrorKind::ExtractionFailed);
  }
}

TEST(Errors, TimeoutMessages) {
  EXPECT_STREQ(PipelineTimeout(1500ms).what(),
               "pipeline timed out after 1.5s");
  EXPECT_STREQ(ProgressTimeout(std::chrono::minutes(5)).what(),
               "no progress for 300.0s");
}

TEST(Errors, Messages) {
  EXPECT_STREQ(ContentTooLarge(2048, 1024).what(),
               "content size 2048 exceeds limit 1024");
  EXPECT_STREQ(QueueFull(20).what(), "queue is full (20 active jobs)");

  SpawnError spawn("yt-dlp", ENOENT);
  EXPECT_NE(std::string(spawn.what()).find("yt-dlp"), std::string::npos);

  StorageError storage("Path traversal detected", "../x");
  EXPECT_EQ(storage.details(), "../x");
  EXPECT_EQ(storage.http_status(), 500);
}
