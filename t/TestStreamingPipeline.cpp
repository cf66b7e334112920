#include "media_relay/errors.hpp"
#include "media_relay/file_manager.hpp"
#include "media_relay/pipeline.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

using namespace media_relay;
using namespace media_relay::test;
using namespace std::chrono_literals;

namespace {

const std::string DEFAULT_METADATA =
    R"({"id":"abc123","title":"Test Video","ext":"mp4","uploader":"Tester"})";

const std::string MEDIA = "hello media bytes";

/// Writes the payload and reports completion on stderr
const std::string STREAM_OK = "printf '%s' '" + MEDIA + "'\n"
                              "echo '[download] 100.0% of 17.00B' >&2";

/// Reads stdin into the target and prints an rclone-style summary
const std::string UPLOAD_OK =
    "cat > \"$2\"\n"
    "echo 'Transferred:   \t   17 B / 17 B, 100%, 0 B/s, ETA -' >&2";

const std::string PROGRESS_FOREVER =
    "while true; do echo '[download]  10.0% of ~1.00MiB' >&2; sleep 0.05; "
    "done";

bool contains(const std::vector<std::string> &args, const std::string &arg) {
  return std::find(args.begin(), args.end(), arg) != args.end();
}

} // namespace

/**
 * @brief Fake extraction and upload tools under a temporary directory.
 * @note Every fake appends its PID to a file so tests can check that no
 *       child outlives the pipeline.
 */
class PipelineTest : public ::testing::Test {
protected:
  TempDir dir;
  DeletionScheduler scheduler;
  FileManager files{dir / "storage", scheduler, std::chrono::hours(1)};
  PipelineOptions options;
  PipelineRequest request;

  void SetUp() override {
    options.metadata_timeout = 5s;
    options.poll_interval = 20ms;
    options.terminate_grace = 500ms;

    request.request_id = "req-1";
    request.source_url = "https://example.com/watch?v=abc123";
    request.timeout = 10s;
    request.stall_timeout = 5s;

    set_extractor(STREAM_OK);
    set_uploader(UPLOAD_OK);
  }

  /// Probe mode (--dump-json) runs probe_body, streaming mode runs body
  void set_extractor(const std::string &body,
                     const std::string &probe_body = "echo '" +
                                                     DEFAULT_METADATA + "'") {
    fs::path script = write_script(
        dir / "fake-extractor",
        "echo $$ >> '" + (dir / "extractor.pids").string() + "'\n"
        "for arg in \"$@\"; do\n"
        "  if [ \"$arg\" = \"--dump-json\" ]; then\n" +
            probe_body + "\n  exit 0\n  fi\ndone\n" + body);
    options.extractor_bin = script.string();
  }

  void set_uploader(const std::string &body) {
    fs::path script = write_script(
        dir / "fake-uploader",
        "echo $$ >> '" + (dir / "uploader.pids").string() + "'\n"
        "echo \"$@\" > '" + (dir / "uploader.args").string() + "'\n" + body);
    options.uploader_bin = script.string();
  }

  PipelineResult run(CancellationToken token = {}) {
    StreamingPipeline pipeline(request, options, files, {}, std::move(token));
    return pipeline.execute();
  }

  /// Number of times the fake extractor was started (probe included)
  size_t extractor_runs() { return read_pids(dir / "extractor.pids").size(); }

  void expect_no_survivors() {
    for (const char *name : {"extractor.pids", "uploader.pids"})
      for (pid_t pid : read_pids(dir / name))
        EXPECT_FALSE(process_alive(pid)) << name << " pid " << pid;
  }

  fs::path stored(const std::string &relative) {
    return files.storage_root() / relative;
  }
};

// **---- Success ----**

TEST_F(PipelineTest, StreamsIntoStorage) {
  PipelineResult result = run();

  EXPECT_EQ(result.object_path, "videos/Test_Video-abc123.mp4");
  EXPECT_EQ(result.upload_target, stored(result.object_path).string());
  EXPECT_EQ(result.bytes_transferred, MEDIA.size());
  EXPECT_EQ(result.metadata["id"], "abc123");
  EXPECT_EQ(read_file(stored(result.object_path)), MEDIA);

  nlohmann::json json = result.to_json();
  EXPECT_EQ(json["object_path"], "videos/Test_Video-abc123.mp4");
  EXPECT_EQ(json["metadata"]["title"], "Test Video");

  EXPECT_EQ(extractor_runs(), 2u);
  expect_no_survivors();
}

TEST_F(PipelineTest, BytesFallBackToStoredSize) {
  set_uploader("cat > \"$2\"");
  PipelineResult result = run();
  EXPECT_EQ(result.bytes_transferred, MEDIA.size());
}

TEST_F(PipelineTest, RemoteTargetIsPassedToUploader) {
  options.remote = "archive";
  set_uploader("cat > /dev/null\n"
               "echo 'Transferred:   2.000 KiB / 2.000 KiB, 100%' >&2");

  PipelineResult result = run();
  EXPECT_EQ(result.upload_target, "archive:videos/Test_Video-abc123.mp4");
  EXPECT_EQ(result.bytes_transferred, 2048u);

  std::string args = read_file(dir / "uploader.args");
  EXPECT_EQ(args.rfind("rcat archive:videos/Test_Video-abc123.mp4 ", 0), 0u)
      << args;
  EXPECT_NE(args.find("Content-Type: video/mp4"), std::string::npos);
  EXPECT_FALSE(fs::exists(stored("videos/Test_Video-abc123.mp4")));
}

// **---- Process failures ----**

TEST_F(PipelineTest, ExtractionFailureCarriesStderrAndStopsUploader) {
  set_extractor("sleep 0.2\n"
                "echo 'ERROR: [youtube] abc123: Video unavailable' >&2\n"
                "exit 1");
  set_uploader("cat > /dev/null\nexec sleep 30");

  try {
    run();
    FAIL() << "expected ExtractionFailed";
  } catch (const ExtractionFailed &e) {
    EXPECT_EQ(e.exit_code(), 1);
    EXPECT_NE(e.details().find("Video unavailable"), std::string::npos);
    EXPECT_EQ(e.http_status(), 500);
  }

  std::vector<pid_t> uploaders = read_pids(dir / "uploader.pids");
  ASSERT_EQ(uploaders.size(), 1u);
  EXPECT_FALSE(process_alive(uploaders[0]));
  expect_no_survivors();
}

TEST_F(PipelineTest, UploadFailureStopsExtractor) {
  set_extractor(PROGRESS_FOREVER);
  set_uploader("echo 'Failed to copy: access denied' >&2\nexit 3");

  try {
    run();
    FAIL() << "expected UploadFailed";
  } catch (const UploadFailed &e) {
    EXPECT_EQ(e.exit_code(), 3);
    EXPECT_NE(e.details().find("access denied"), std::string::npos);
  }
  expect_no_survivors();
}

// **---- Timeouts ----**

TEST_F(PipelineTest, SilentExtractorHitsStallTimeout) {
  set_extractor("exec sleep 30");
  request.stall_timeout = 300ms;

  auto start = Clock::now();
  EXPECT_THROW(run(), ProgressTimeout);
  EXPECT_LT(Clock::now() - start, 5s);

  EXPECT_FALSE(fs::exists(stored("videos/Test_Video-abc123.mp4")));
  expect_no_survivors();
}

TEST_F(PipelineTest, SteadyProgressStillHitsTotalTimeout) {
  set_extractor(PROGRESS_FOREVER);
  request.timeout = 400ms;

  auto start = Clock::now();
  try {
    run();
    FAIL() << "expected PipelineTimeout";
  } catch (const PipelineTimeout &e) {
    EXPECT_EQ(e.http_status(), 408);
  }
  EXPECT_LT(Clock::now() - start, 5s);
  expect_no_survivors();
}

TEST_F(PipelineTest, AdvertisedSizeAboveLimitAborts) {
  set_extractor("echo '[download]   1.0% of ~ 5.00GiB at 1.00MiB/s' >&2\n"
                "exec sleep 30");
  request.max_content_length = 1LL << 30;

  EXPECT_THROW(run(), ContentTooLarge);
  expect_no_survivors();
}

TEST_F(PipelineTest, UnlimitedContentLengthIgnoresAdvertisedSize) {
  set_extractor("echo '[download]   1.0% of ~ 5.00GiB at 1.00MiB/s' >&2\n" +
                STREAM_OK);
  request.max_content_length = 0;

  EXPECT_EQ(run().bytes_transferred, MEDIA.size());
}

// **---- Cancellation ----**

TEST_F(PipelineTest, CancellationStopsBothProcesses) {
  set_extractor("exec sleep 30");

  CancellationToken token;
  std::thread canceller([token]() mutable {
    std::this_thread::sleep_for(300ms);
    token.request_cancel();
  });

  EXPECT_THROW(run(token), JobCancelled);
  canceller.join();
  expect_no_survivors();
}

TEST_F(PipelineTest, ExpiredDeadlineStopsPipeline) {
  set_extractor("exec sleep 30");

  CancellationToken token;
  token.set_deadline(Clock::now() + 300ms);
  EXPECT_THROW(run(token), JobTimeout);
  expect_no_survivors();
}

// **---- Metadata ----**

TEST_F(PipelineTest, MetadataFailureSpawnsNothing) {
  set_extractor(STREAM_OK, "echo 'ERROR: Unsupported URL' >&2\n  exit 1");

  try {
    run();
    FAIL() << "expected MetadataError";
  } catch (const MetadataError &e) {
    EXPECT_NE(e.details().find("Unsupported URL"), std::string::npos);
    EXPECT_EQ(e.http_status(), 422);
  }
  EXPECT_EQ(extractor_runs(), 1u);
  EXPECT_FALSE(fs::exists(dir / "uploader.pids"));
}

TEST_F(PipelineTest, MetadataTimeout) {
  set_extractor(STREAM_OK, "exec sleep 30");
  options.metadata_timeout = 200ms;

  StreamingPipeline pipeline(request, options, files);
  EXPECT_THROW(pipeline.extract_metadata(), MetadataError);
  expect_no_survivors();
}

TEST_F(PipelineTest, PlaylistRecordsAreSkipped) {
  set_extractor(STREAM_OK,
                "echo '{\"_type\":\"playlist\",\"title\":\"List\"}'\n"
                "echo 'not json'\n"
                "echo '{\"id\":\"e1\",\"title\":\"Entry\"}'");

  StreamingPipeline pipeline(request, options, files);
  Metadata metadata = pipeline.extract_metadata();
  EXPECT_EQ(metadata["title"], "Entry");
}

TEST_F(PipelineTest, OutputWithoutRecordIsMetadataError) {
  set_extractor(STREAM_OK, "echo 'not json at all'");

  StreamingPipeline pipeline(request, options, files);
  EXPECT_THROW(pipeline.extract_metadata(), MetadataError);
}

TEST_F(PipelineTest, MissingExtractorIsSpawnError) {
  options.extractor_bin = (dir / "does-not-exist").string();
  EXPECT_THROW(run(), SpawnError);
}

// **---- Path resolution ----**

TEST_F(PipelineTest, TraversalTemplateIsRejectedBeforeSpawning) {
  request.destination_template = "../../{id}.{ext}";

  EXPECT_THROW(run(), StorageError);
  EXPECT_EQ(extractor_runs(), 1u);
  EXPECT_FALSE(fs::exists(dir / "uploader.pids"));
}

TEST_F(PipelineTest, RemoteTraversalTemplateIsRejectedBeforeSpawning) {
  options.remote = "archive";
  request.destination_template = "videos/../../{id}.{ext}";

  try {
    run();
    FAIL() << "expected StorageError";
  } catch (const StorageError &e) {
    EXPECT_STREQ(e.what(), "Path traversal detected");
  }
  EXPECT_EQ(extractor_runs(), 1u);
  EXPECT_FALSE(fs::exists(dir / "uploader.pids"));
  EXPECT_FALSE(fs::exists(dir / "uploader.args"));
}

TEST_F(PipelineTest, CustomTemplateCreatesDirectories) {
  request.destination_template = "{uploader}/{id}/{safe_title}.{ext}";
  PipelineResult result = run();

  EXPECT_EQ(result.object_path, "Tester/abc123/Test_Video.mp4");
  EXPECT_EQ(read_file(stored(result.object_path)), MEDIA);
}

// **---- Command lines ----**

TEST_F(PipelineTest, ExtractCommand) {
  request.max_content_length = 1024;
  request.cookies_file = "/secrets/cookies.txt";
  StreamingPipeline pipeline(request, options, files);

  std::vector<std::string> cmd = pipeline.extract_command();
  EXPECT_EQ(cmd.front(), options.extractor_bin);
  EXPECT_EQ(cmd.back(), request.source_url);
  EXPECT_TRUE(contains(cmd, "--no-part"));
  EXPECT_TRUE(contains(cmd, "--no-playlist"));
  EXPECT_TRUE(contains(cmd, "1024"));
  EXPECT_TRUE(contains(cmd, "/secrets/cookies.txt"));

  auto output = std::find(cmd.begin(), cmd.end(), "--output");
  ASSERT_NE(output, cmd.end());
  EXPECT_EQ(*(output + 1), "-");

  std::vector<std::string> probe = pipeline.probe_command();
  EXPECT_TRUE(contains(probe, "--dump-json"));
  EXPECT_TRUE(contains(probe, "/secrets/cookies.txt"));
}

TEST_F(PipelineTest, UnlimitedRequestOmitsMaxFilesize) {
  request.max_content_length = 0;
  StreamingPipeline pipeline(request, options, files);
  EXPECT_FALSE(contains(pipeline.extract_command(), "--max-filesize"));
}

TEST_F(PipelineTest, UploadCommandHeaders) {
  request.headers = {{"Cache-Control", "no-store"}};
  StreamingPipeline pipeline(request, options, files);

  std::vector<std::string> cmd = pipeline.upload_command("r:a.webm", "webm");
  ASSERT_GE(cmd.size(), 3u);
  EXPECT_EQ(cmd[1], "rcat");
  EXPECT_EQ(cmd[2], "r:a.webm");
  EXPECT_TRUE(contains(cmd, "Cache-Control: no-store"));
  EXPECT_TRUE(contains(cmd, "Content-Type: video/webm"));

  request.headers = {{"content-type", "application/x-custom"}};
  StreamingPipeline custom(request, options, files);
  std::vector<std::string> custom_cmd = custom.upload_command("r:a", "webm");
  EXPECT_TRUE(contains(custom_cmd, "content-type: application/x-custom"));
  EXPECT_FALSE(contains(custom_cmd, "Content-Type: video/webm"));
}

TEST(ContentType, GuessedFromExtension) {
  EXPECT_EQ(content_type_for("mp4"), "video/mp4");
  EXPECT_EQ(content_type_for("MKV"), "video/x-matroska");
  EXPECT_EQ(content_type_for("m4a"), "audio/mp4");
  EXPECT_EQ(content_type_for("xyz"), "application/octet-stream");
}
