// Repository: MediaRelay
// Component: yt-dlp acquirer tests
// Copyright (c) 2025 MediaRelay
//
// A tiny shell script stands in for yt-dlp: it writes to the -o path and
// exits with a scripted code.

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "fixtures/FakeMediaProbe.h"
#include "fixtures/FakeTranscoder.h"
#include "mediarelay/acquisition/YtDlpAcquirer.hpp"
#include "support/DeterministicTimeSource.hpp"
#include "support/TempTree.hpp"

namespace mediarelay::acquisition {
namespace {

using tests::fixtures::FakeMediaProbe;
using tests::fixtures::FakeTranscoder;

// bytes == 0 writes nothing.
std::string WriteFakeDownloader(const TempTree& tree, const std::string& name, int bytes,
                                int exit_code) {
  const std::string path = tree.Path(name);
  {
    std::ofstream out(path);
    out << "#!/bin/sh\n"
        << "out=\"\"\n"
        << "while [ $# -gt 0 ]; do\n"
        << "  if [ \"$1\" = \"-o\" ]; then out=\"$2\"; fi\n"
        << "  shift\n"
        << "done\n";
    if (bytes > 0) out << "head -c " << bytes << " /dev/zero > \"$out\"\n";
    out << "echo '[download] 100% of 1.00MiB'\n"
        << "exit " << exit_code << "\n";
  }
  std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace);
  return path;
}

class YtDlpAcquirerTest : public ::testing::Test {
 protected:
  YtDlpAcquirerTest()
      : tree_("ytdlp"),
        clock_(kBaseMtimeMs),
        engine_(MakeRecoveryConfig(), transcoder_, probe_, clock_) {}

  config::RecoveryConfig MakeRecoveryConfig() {
    config::RecoveryConfig c;
    c.quarantine_dir = tree_.Path("quarantine");
    return c;
  }

  AcquirerOptions Options(const std::string& bin) {
    AcquirerOptions o;
    o.ytdlp_bin = bin;
    o.download_dir = tree_.Path("download");
    o.partial_suffix = ".part";
    return o;
  }

  std::vector<std::string> FilesUnder(const std::string& dir) {
    std::vector<std::string> out;
    std::error_code ec;
    for (auto& e : std::filesystem::recursive_directory_iterator(dir, ec)) {
      if (e.is_regular_file()) out.push_back(e.path().filename().string());
    }
    std::sort(out.begin(), out.end());
    return out;
  }

  TempTree tree_;
  DeterministicTimeSource clock_;
  FakeTranscoder transcoder_;
  FakeMediaProbe probe_;
  recovery::RecoveryEngine engine_;
  std::atomic<bool> interrupt_{false};
};

TEST_F(YtDlpAcquirerTest, BuildArgsWritesToTargetWithExtrasBeforeLocator) {
  AcquirerOptions o = Options("yt-dlp");
  o.extra_args = {"--cookies", "c.txt"};
  YtDlpAcquirer acquirer(o, engine_);
  AcquisitionJob job = MakeJob("https://h/alice/", o.download_dir, "20250101-000000");

  auto args = acquirer.BuildArgs(job);

  ASSERT_GE(args.size(), 4u);
  EXPECT_EQ(args.front(), "yt-dlp");
  EXPECT_EQ(args.back(), "https://h/alice/");
  auto o_flag = std::find(args.begin(), args.end(), "-o");
  ASSERT_NE(o_flag, args.end());
  EXPECT_EQ(*(o_flag + 1), job.target_path);
  EXPECT_NE(std::find(args.begin(), args.end(), "--no-part"), args.end());
  EXPECT_EQ(args[args.size() - 3], "--cookies");
  EXPECT_EQ(args[args.size() - 2], "c.txt");
}

TEST_F(YtDlpAcquirerTest, PrepareCreatesEmptyMarkerAndAvoidsCollisions) {
  YtDlpAcquirer acquirer(Options("yt-dlp"), engine_);

  AcquisitionJob first = acquirer.Prepare("https://h/alice/");
  AcquisitionJob second = acquirer.Prepare("https://h/alice/");

  EXPECT_TRUE(TempTree::Exists(first.partial_path));
  EXPECT_EQ(TempTree::SizeOf(first.partial_path), 0u);
  EXPECT_NE(first.target_path, second.target_path);
  EXPECT_EQ(std::filesystem::path(first.target_path).parent_path(),
            std::filesystem::path(tree_.Path("download/alice")));
}

TEST_F(YtDlpAcquirerTest, CleanDownloadIsDoneAndMarkerRemoved) {
  YtDlpAcquirer acquirer(Options(WriteFakeDownloader(tree_, "ok.sh", 2048, 0)), engine_);

  EXPECT_EQ(acquirer.Acquire("https://h/alice/", interrupt_), JobStatus::kDone);

  auto files = FilesUnder(tree_.Path("download/alice"));
  ASSERT_EQ(files.size(), 1u);
  EXPECT_NE(files[0].find("_alice.mp4"), std::string::npos);
  EXPECT_EQ(files[0].find(".part"), std::string::npos);
  EXPECT_TRUE(transcoder_.requests().empty()) << "no recovery for a clean download";
}

TEST_F(YtDlpAcquirerTest, FailedDownloadWithDataIsRecovered) {
  YtDlpAcquirer acquirer(Options(WriteFakeDownloader(tree_, "cut.sh", 2048, 1)), engine_);

  EXPECT_EQ(acquirer.Acquire("https://h/bob/", interrupt_), JobStatus::kDone);

  auto files = FilesUnder(tree_.Path("download/bob"));
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].find(".part"), std::string::npos);
  ASSERT_FALSE(transcoder_.requests().empty());
  EXPECT_EQ(transcoder_.requests()[0].mode, media::TranscodeMode::kRemuxCopy);
}

TEST_F(YtDlpAcquirerTest, FailedDownloadWithoutDataIsErrorAndLeavesNothing) {
  YtDlpAcquirer acquirer(Options(WriteFakeDownloader(tree_, "none.sh", 0, 1)), engine_);

  EXPECT_EQ(acquirer.Acquire("https://h/carol/", interrupt_), JobStatus::kError);
  EXPECT_TRUE(FilesUnder(tree_.Path("download/carol")).empty());
}

TEST_F(YtDlpAcquirerTest, UnlaunchableBinaryIsError) {
  YtDlpAcquirer acquirer(Options(tree_.Path("missing-yt-dlp")), engine_);
  EXPECT_EQ(acquirer.Acquire("https://h/dave/", interrupt_), JobStatus::kError);
}

}  // namespace
}  // namespace mediarelay::acquisition
