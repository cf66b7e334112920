#include "media_relay/errors.hpp"
#include "media_relay/file_manager.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

#include <regex>

using namespace media_relay;
using namespace media_relay::test;
using namespace std::chrono_literals;

namespace {

/// Storage root below a temporary directory, with its own scheduler
struct Storage {
  TempDir dir;
  DeletionScheduler scheduler;
  FileManager files{dir / "storage", scheduler, std::chrono::hours(1)};

  fs::path root() const { return files.storage_root(); }
};

Metadata sample_metadata() {
  return {
      {"id", "dQw4w9WgXcQ"},
      {"title", "Never Gonna: Give/You Up?"},
      {"ext", "webm"},
      {"uploader", "Rick Astley"},
      {"uploader_id", "@RickAstleyYT"},
      {"upload_date", "20091025"},
      {"playlist", "80s Hits"},
      {"playlist_index", 7},
  };
}

} // namespace

// **---- sanitize_filename ----**

TEST(FileManager, SanitizeReplacesForbiddenCharacters) {
  EXPECT_EQ(FileManager::sanitize_filename("a<b>c:d\"e/f\\g|h?i*j"),
            "a_b_c_d_e_f_g_h_i_j");
  EXPECT_EQ(FileManager::sanitize_filename("tab\there\nnewline"),
            "tab_here_newline");
}

TEST(FileManager, SanitizeCollapsesAndStrips) {
  EXPECT_EQ(FileManager::sanitize_filename("  many   spaces __ here  "),
            "many_spaces_here");
  EXPECT_EQ(FileManager::sanitize_filename("..hidden."), "hidden");
  EXPECT_EQ(FileManager::sanitize_filename("___"), "unknown");
  EXPECT_EQ(FileManager::sanitize_filename(""), "unknown");
}

TEST(FileManager, SanitizeTruncatesOnCharacterBoundary) {
  std::string ascii(300, 'x');
  EXPECT_EQ(FileManager::sanitize_filename(ascii).size(), 200u);

  /// 'é' is two bytes; byte 200 would split one
  std::string accented = "a";
  for (int i = 0; i < 150; ++i)
    accented += "\xC3\xA9";
  std::string safe = FileManager::sanitize_filename(accented);
  EXPECT_EQ(safe.size(), 199u);
  EXPECT_NE(static_cast<unsigned char>(safe.back()), 0xC3);
}

// **---- expand_path_template ----**

TEST(FileManager, ExpandsMetadataTokens) {
  Storage storage;
  Metadata md = sample_metadata();

  EXPECT_EQ(storage.files.expand_path_template("videos/{safe_title}-{id}.{ext}",
                                               md),
            "videos/Never_Gonna_Give_You_Up-dQw4w9WgXcQ.webm");
  EXPECT_EQ(storage.files.expand_path_template("{uploader}/{upload_date}", md),
            "Rick_Astley/2009-10-25");
  EXPECT_EQ(storage.files.expand_path_template(
                "{playlist}/{playlist_index:03d}-{playlist_index}", md),
            "80s_Hits/007-7");
  EXPECT_EQ(storage.files.expand_path_template("{channel}/{channel_id}", md),
            "Rick_Astley/@RickAstleyYT");
}

TEST(FileManager, MissingFieldsFallBack) {
  Storage storage;
  Metadata md = {{"title", "Clip"}};

  EXPECT_EQ(storage.files.expand_path_template("{uploader}/{id}.{ext}", md),
            "unknown/unknown.mp4");
  EXPECT_EQ(storage.files.expand_path_template("{playlist_index:03d}", md),
            "000");

  /// Unusable upload_date falls back to today, formatted as a date
  md["upload_date"] = "sometime";
  std::string date = storage.files.expand_path_template("{upload_date}", md);
  EXPECT_TRUE(std::regex_match(date, std::regex(R"(\d{4}-\d{2}-\d{2})")));
  EXPECT_EQ(date, storage.files.expand_path_template("{date}", md));
}

TEST(FileManager, UnknownTokensAreKeptVerbatim) {
  Storage storage;
  EXPECT_EQ(storage.files.expand_path_template("a/{nope}/{id}", {{"id", "x"}}),
            "a/{nope}/x");
  EXPECT_EQ(storage.files.expand_path_template("open{brace", {}), "open{brace");
}

TEST(FileManager, SubstitutedValuesAreNotRescanned) {
  Storage storage;
  Metadata md = {{"title", "{id}"}, {"id", "real"}};
  EXPECT_EQ(storage.files.expand_path_template("{title}-{id}", md),
            "{id}-real");
}

TEST(FileManager, RandomTokenIsEightHexDigits) {
  Storage storage;
  std::string value = storage.files.expand_path_template("{random}", {});
  EXPECT_TRUE(std::regex_match(value, std::regex("[0-9a-f]{8}")));
}

TEST(FileManager, NormalizesSlashes) {
  Storage storage;
  Metadata md = {{"uploader", ""}, {"id", "x"}};
  EXPECT_EQ(storage.files.expand_path_template("//a///{id}//", md), "a/x");
}

TEST(FileManager, EmptyRenderingIsAnError) {
  Storage storage;
  EXPECT_THROW(storage.files.expand_path_template("///", {}),
               PathResolutionError);
}

// **---- validate_path ----**

TEST(FileManager, ValidatesPathsInsideRoot) {
  Storage storage;
  fs::path resolved = storage.files.validate_path("videos/a.mp4");
  EXPECT_EQ(resolved, storage.root() / "videos" / "a.mp4");
  EXPECT_EQ(storage.files.relative_path(resolved), "videos/a.mp4");
}

TEST(FileManager, RejectsTraversal) {
  Storage storage;
  EXPECT_THROW(storage.files.validate_path("../escape.mp4"), StorageError);
  EXPECT_THROW(storage.files.validate_path("videos/../../escape.mp4"),
               StorageError);
  EXPECT_THROW(storage.files.validate_path("/etc/passwd"), StorageError);

  try {
    storage.files.validate_path("../escape.mp4");
  } catch (const StorageError &e) {
    EXPECT_STREQ(e.what(), "Path traversal detected");
  }
}

TEST(FileManager, ConfinesObjectPathsLexically) {
  EXPECT_EQ(confine_object_path("videos/clip.mp4"), "videos/clip.mp4");
  EXPECT_EQ(confine_object_path("videos/./old/../clip.mp4"), "videos/clip.mp4");

  EXPECT_THROW(confine_object_path("../../x.mp4"), StorageError);
  EXPECT_THROW(confine_object_path("videos/../../x.mp4"), StorageError);
  EXPECT_THROW(confine_object_path("/etc/passwd"), StorageError);
  EXPECT_THROW(confine_object_path("videos/.."), StorageError);
  EXPECT_THROW(confine_object_path(".."), StorageError);
}

TEST(FileManager, RejectsSiblingWithCommonPrefix) {
  Storage storage;
  fs::path sibling = storage.root().string() + "-other/file.mp4";
  EXPECT_THROW(storage.files.validate_path(sibling), StorageError);
}

TEST(FileManager, RejectsSymlinks) {
  Storage storage;
  write_file(storage.dir / "outside.mp4", "secret");
  fs::create_symlink(storage.dir / "outside.mp4", storage.root() / "link.mp4");

  try {
    storage.files.validate_path("link.mp4");
    FAIL() << "expected StorageError";
  } catch (const StorageError &e) {
    EXPECT_STREQ(e.what(), "Symlinks not allowed for security");
    EXPECT_EQ(e.kind(), ErrorKind::StorageError);
  }
}

// **---- Deletion ----**

TEST(FileManager, DeleteFile) {
  Storage storage;
  write_file(storage.root() / "a.mp4", "media");

  EXPECT_TRUE(storage.files.delete_file("a.mp4"));
  EXPECT_FALSE(fs::exists(storage.root() / "a.mp4"));
  EXPECT_FALSE(storage.files.delete_file("a.mp4"));

  fs::create_directories(storage.root() / "dir");
  EXPECT_THROW(storage.files.delete_file("dir"), StorageError);
  EXPECT_THROW(storage.files.delete_file("../outside.mp4"), StorageError);
}

TEST(FileManager, ScheduleDeletionRemovesFileAfterDelay) {
  Storage storage;
  fs::create_directories(storage.root() / "videos");
  const fs::path file = storage.root() / "videos" / "clip.mp4";
  write_file(file, "media");

  ScheduledDeletion receipt =
      storage.files.schedule_deletion("videos/clip.mp4", 0ms);
  EXPECT_FALSE(receipt.task_id.empty());
  EXPECT_TRUE(wait_until([&] { return !fs::exists(file); }, 2s));
}

TEST(FileManager, ScheduleDeletionDefaultsToRetention) {
  Storage storage;
  write_file(storage.root() / "kept.mp4", "media");

  auto before = std::chrono::system_clock::now();
  ScheduledDeletion receipt = storage.files.schedule_deletion("kept.mp4");
  EXPECT_GE(receipt.fire_time, before + std::chrono::hours(1));

  EXPECT_TRUE(storage.files.cancel_deletion(receipt.task_id));
  EXPECT_FALSE(storage.files.cancel_deletion(receipt.task_id));
  EXPECT_TRUE(fs::exists(storage.root() / "kept.mp4"));
}

TEST(FileManager, ScheduleDeletionRejectsTraversal) {
  Storage storage;
  EXPECT_THROW(storage.files.schedule_deletion("../../etc/passwd", 0ms),
               StorageError);
  EXPECT_EQ(storage.scheduler.pending_count(), 0);
}

TEST(FileManager, RemoteTargetsAreRelativeObjectPaths) {
  TempDir dir;
  std::vector<std::string> targets;
  std::mutex mutex;
  DeletionScheduler scheduler([&](const std::string &target) {
    std::lock_guard<std::mutex> lock(mutex);
    targets.push_back(target);
    return DeletionOutcome::Deleted;
  });
  FileManager files(dir / "storage", scheduler, std::chrono::hours(1),
                    "s3remote");

  files.schedule_deletion("videos/clip.mp4", 0ms);
  ASSERT_TRUE(wait_until([&] { return scheduler.executed_count() == 1; }, 2s));

  std::lock_guard<std::mutex> lock(mutex);
  EXPECT_EQ(targets, std::vector<std::string>{"videos/clip.mp4"});
}

// **---- Housekeeping ----**

TEST(FileManager, StorageStats) {
  Storage storage;
  fs::create_directories(storage.root() / "nested");
  write_file(storage.root() / "one.mp4", "12345");
  write_file(storage.root() / "nested" / "two.mp4", "1234567890");

  StorageStats stats = storage.files.storage_stats();
  EXPECT_EQ(stats.total_files, 2u);
  EXPECT_EQ(stats.total_bytes, 15u);
  EXPECT_EQ(stats.storage_dir, storage.root().string());

  nlohmann::json json = to_json(stats);
  EXPECT_EQ(json["total_files"], 2);
  EXPECT_EQ(json["total_size_bytes"], 15);
}

TEST(FileManager, CleanupOldFiles) {
  Storage storage;
  const fs::path old_file = storage.root() / "old.mp4";
  const fs::path new_file = storage.root() / "new.mp4";
  write_file(old_file, "old");
  write_file(new_file, "new");
  fs::last_write_time(old_file, fs::file_time_type::clock::now() -
                                    std::chrono::hours(48));

  EXPECT_EQ(storage.files.cleanup_old_files(std::chrono::hours(24)), 1);
  EXPECT_FALSE(fs::exists(old_file));
  EXPECT_TRUE(fs::exists(new_file));
}

// **---- Remote deleter ----**

TEST(FileManager, RemoteDeleterMapsToolOutcomes) {
  TempDir dir;
  const fs::path args = dir / "args.txt";
  fs::path tool = write_script(
      dir / "fake-uploader",
      "echo \"$@\" > '" + args.string() + "'\n"
      "case \"$2\" in\n"
      "  *missing*) echo 'ERROR : object not found' >&2; exit 4;;\n"
      "  *broken*) echo 'permission denied' >&2; exit 1;;\n"
      "esac\n"
      "exit 0");

  Deleter deleter = make_remote_deleter(tool.string(), "remote", 5s);

  EXPECT_EQ(deleter("videos/a.mp4"), DeletionOutcome::Deleted);
  EXPECT_EQ(read_file(args), "deletefile remote:videos/a.mp4\n");

  EXPECT_EQ(deleter("videos/missing.mp4"), DeletionOutcome::AlreadyGone);
  EXPECT_THROW(deleter("videos/broken.mp4"), StorageError);
}
