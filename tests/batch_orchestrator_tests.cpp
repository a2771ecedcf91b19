#include <gtest/gtest.h>

#include <cstdio>
#include <set>
#include <string>
#include <vector>

#include "../libniclean/include/batch_orchestrator.hpp"
#include "../libniclean/include/events.hpp"
#include "../libniclean/include/file_utils.hpp"
#include "../libniclean/include/niclean_errors.hpp"
#include "test_helpers.hpp"

using namespace niclean;

class BatchOrchestratorTest : public TempDirTest {
 protected:
  [[nodiscard]] BatchOptions options() const {
    BatchOptions o;
    o.input_root = input_dir;
    o.tool_timeout = std::chrono::seconds(10);
    return o;
  }

  [[nodiscard]] fs::path default_output() const { return input_dir / "NiClean_cleaned"; }

  static std::set<std::string> names_in(const fs::path& dir) {
    std::set<std::string> out;
    for (const auto& e : fs::directory_iterator(dir)) out.insert(e.path().filename().string());
    return out;
  }

  [[nodiscard]] bool has_leftover_temporaries() const {
    std::error_code ec;
    if (!fs::exists(default_output(), ec)) return false;
    for (const auto& e : fs::directory_iterator(default_output())) {
      if (is_temp_file(e.path())) return true;
    }
    return false;
  }

  static std::vector<std::string> destination_names(const BatchReport& report) {
    std::vector<std::string> out;
    for (const auto& r : report.results) out.push_back(r.destination.filename().string());
    return out;
  }

  EventBus bus;
};

TEST_F(BatchOrchestratorTest, IPhoneScenarioWithoutVideoTool) {
  write_file(input_dir / "a.jpg", "JPEG-A");
  write_file(input_dir / "b.png", "PNG-B");
  write_file(input_dir / "c.mp4", "MP4-C");
  install_fake_exiftool();

  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  const auto report = orchestrator.run(options());

  ASSERT_EQ(report.results.size(), 3u);
  EXPECT_EQ(destination_names(report), (std::vector<std::string>{"IMG_0001.JPG", "IMG_0002.JPG", "VID_0001.MOV"}));
  EXPECT_EQ(report.results[0].outcome, Outcome::CopiedAndStripped);
  EXPECT_EQ(report.results[1].outcome, Outcome::CopiedAndStripped);
  EXPECT_EQ(report.results[2].outcome, Outcome::CopiedStripSkipped);
  EXPECT_EQ(report.results[2].reason, Reason::ToolUnavailable);
  EXPECT_FALSE(report.cancelled);
  EXPECT_EQ(orchestrator.state(), BatchState::Done);

  EXPECT_EQ(names_in(default_output()), (std::set<std::string>{"IMG_0001.JPG", "IMG_0002.JPG", "VID_0001.MOV"}));
  EXPECT_EQ(read_file(default_output() / "VID_0001.MOV"), "MP4-C");

  // sources untouched
  EXPECT_EQ(read_file(input_dir / "a.jpg"), "JPEG-A");
  EXPECT_EQ(read_file(input_dir / "b.png"), "PNG-B");
  EXPECT_EQ(read_file(input_dir / "c.mp4"), "MP4-C");

  const auto counts = report.counts();
  EXPECT_EQ(counts.stripped, 2u);
  EXPECT_EQ(counts.strip_skipped, 1u);
  EXPECT_EQ(counts.total(), 3u);
}

TEST_F(BatchOrchestratorTest, DryRunCreatesNothingAndKeepsNames) {
  write_file(input_dir / "a.jpg", "JPEG-A");
  write_file(input_dir / "b.png", "PNG-B");
  write_file(input_dir / "c.mp4", "MP4-C");
  install_fake_exiftool();

  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  auto o = options();
  o.dry_run = true;
  const auto report = orchestrator.run(o);

  EXPECT_FALSE(fs::exists(default_output()));
  EXPECT_TRUE(report.dry_run);
  EXPECT_EQ(destination_names(report), (std::vector<std::string>{"IMG_0001.JPG", "IMG_0002.JPG", "VID_0001.MOV"}));
  for (const auto& r : report.results) {
    EXPECT_EQ(r.outcome, Outcome::SkippedDryRun);
  }
  EXPECT_EQ(report.counts().dry_run, 3u);
}

TEST_F(BatchOrchestratorTest, UnsupportedFilesDoNotConsumeNumbers) {
  write_file(input_dir / "a.jpg", "A");
  write_file(input_dir / "b.txt", "plain text\n");
  write_file(input_dir / "c.jpg", "C");

  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  const auto report = orchestrator.run(options());

  ASSERT_EQ(report.results.size(), 3u);
  EXPECT_EQ(report.results[0].destination.filename(), "IMG_0001.JPG");
  EXPECT_EQ(report.results[1].outcome, Outcome::SkippedUnsupported);
  EXPECT_EQ(report.results[1].reason, Reason::NotMedia);
  EXPECT_TRUE(report.results[1].destination.empty());
  EXPECT_EQ(report.results[2].destination.filename(), "IMG_0002.JPG");
  EXPECT_EQ(names_in(default_output()), (std::set<std::string>{"IMG_0001.JPG", "IMG_0002.JPG"}));
}

TEST_F(BatchOrchestratorTest, AndroidNamesFromEmbeddedCaptureTime) {
  // the fake exiftool reports the file content as the capture time
  write_file(input_dir / "a.jpg", "2024:01:31 23:59:58\n");
  write_file(input_dir / "b.jpg", "2024:01:31 23:59:59\n");
  write_file(input_dir / "c.jpg", "2024:01:31 23:59:59\n");
  write_file(input_dir / "d.mov", "2024:02:01 08:00:00\n");
  install_fake_exiftool();
  install_fake_ffmpeg();

  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  auto o = options();
  o.preset = Preset::Android;
  const auto report = orchestrator.run(o);

  EXPECT_EQ(destination_names(report),
            (std::vector<std::string>{"IMG_20240131_235958.JPG", "IMG_20240131_235959.JPG",
                                      "IMG_20240131_235959_1.JPG", "VID_20240201_080000.MP4"}));
  EXPECT_EQ(read_file(default_output() / "VID_20240201_080000.MP4"), "remuxed");
}

TEST_F(BatchOrchestratorTest, AndroidFallsBackToModificationTime) {
  const auto a = write_file(input_dir / "a.jpg", "A");
  const auto b = write_file(input_dir / "b.jpg", "B");
  set_mtime(a, local_time(2022, 3, 4, 5, 6, 7));
  set_mtime(b, local_time(2022, 3, 4, 5, 6, 7));

  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  auto o = options();
  o.preset = Preset::Android;
  const auto report = orchestrator.run(o);

  EXPECT_EQ(destination_names(report),
            (std::vector<std::string>{"IMG_20220304_050607.JPG", "IMG_20220304_050607_1.JPG"}));
}

TEST_F(BatchOrchestratorTest, RecursiveRunSkipsOutputFolderAndJunk) {
  write_file(input_dir / "a.jpg", "A");
  write_file(input_dir / "sub" / "b.jpg", "B");
  write_file(input_dir / ".DS_Store", "junk");
  write_file(input_dir / "._a.jpg", "appledouble");
  write_file(input_dir / "desktop.ini", "junk");
  write_file(input_dir / ".niclean-0123456789abcdef-old.jpg", "leftover");
  // output of an earlier run
  write_file(default_output() / "IMG_0001.JPG", "previous");

  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  auto o = options();
  o.recursive = true;
  const auto report = orchestrator.run(o);

  ASSERT_EQ(report.results.size(), 2u);
  EXPECT_EQ(report.results[0].source.filename(), "a.jpg");
  EXPECT_EQ(report.results[1].source.filename(), "b.jpg");
  EXPECT_EQ(destination_names(report), (std::vector<std::string>{"IMG_0002.JPG", "IMG_0003.JPG"}));
  EXPECT_EQ(read_file(default_output() / "IMG_0001.JPG"), "previous");
}

TEST_F(BatchOrchestratorTest, NonRecursiveRunIgnoresSubfolders) {
  write_file(input_dir / "a.jpg", "A");
  write_file(input_dir / "sub" / "b.jpg", "B");

  const auto files = BatchOrchestrator::enumerate(input_dir, default_output(), false, WalkOrder::Name);
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].filename(), "a.jpg");
}

TEST_F(BatchOrchestratorTest, ModifiedTimeOrder) {
  const auto z = write_file(input_dir / "z.jpg", "Z");
  const auto a = write_file(input_dir / "a.jpg", "A");
  const auto m = write_file(input_dir / "M.jpg", "M");
  set_mtime(z, local_time(2020, 1, 1, 0, 0, 0));
  set_mtime(a, local_time(2021, 1, 1, 0, 0, 0));
  set_mtime(m, local_time(2021, 1, 1, 0, 0, 0));

  const auto files = BatchOrchestrator::enumerate(input_dir, default_output(), false, WalkOrder::ModifiedTime);
  ASSERT_EQ(files.size(), 3u);
  EXPECT_EQ(files[0].filename(), "z.jpg");
  EXPECT_EQ(files[1].filename(), "a.jpg");
  EXPECT_EQ(files[2].filename(), "M.jpg");
}

TEST_F(BatchOrchestratorTest, ExplicitOutputFolderIsCreated) {
  write_file(input_dir / "a.jpg", "A");
  const auto out = test_dir / "elsewhere" / "clean";

  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  const auto report = orchestrator.run(input_dir, out, Preset::IPhone, false, false);

  EXPECT_EQ(report.output_root, out);
  EXPECT_EQ(names_in(out), (std::set<std::string>{"IMG_0001.JPG"}));
}

TEST_F(BatchOrchestratorTest, ToolTimeoutFailsOneFileAndContinues) {
  write_file(input_dir / "a.jpg", "A");
  write_file(input_dir / "b.mp4", "B");
  write_script(tools_dir / "exiftool",
               "if [ \"$1\" = \"-ver\" ]; then echo 12.76; exit 0; fi\n"
               "exec sleep 30\n");

  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  auto o = options();
  o.tool_timeout = std::chrono::milliseconds(300);
  const auto report = orchestrator.run(o);

  ASSERT_EQ(report.results.size(), 2u);
  EXPECT_EQ(report.results[0].outcome, Outcome::Failed);
  EXPECT_EQ(report.results[0].reason, Reason::ToolTimeout);
  EXPECT_EQ(report.results[1].outcome, Outcome::CopiedStripSkipped);
  EXPECT_EQ(names_in(default_output()), (std::set<std::string>{"VID_0001.MOV"}));
}

TEST_F(BatchOrchestratorTest, WorkerPoolKeepsEnumerationOrder) {
  for (int i = 0; i < 12; ++i) {
    write_file(input_dir / ("f" + std::to_string(10 + i) + (i % 3 ? ".jpg" : ".mp4")), "x");
  }
  install_fake_exiftool();
  install_fake_ffmpeg();

  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  auto o = options();
  o.threads = 4;
  const auto report = orchestrator.run(o);

  ASSERT_EQ(report.results.size(), 12u);
  int images = 0;
  int videos = 0;
  for (std::size_t i = 0; i < report.results.size(); ++i) {
    const auto& r = report.results[i];
    EXPECT_EQ(r.source.filename(), "f" + std::to_string(10 + i) + (i % 3 ? ".jpg" : ".mp4"));
    EXPECT_EQ(r.outcome, Outcome::CopiedAndStripped);
    char expected[32];
    if (r.kind == MediaKind::Image) {
      std::snprintf(expected, sizeof(expected), "IMG_%04d.JPG", ++images);
    } else {
      std::snprintf(expected, sizeof(expected), "VID_%04d.MOV", ++videos);
    }
    EXPECT_EQ(r.destination.filename().string(), expected);
  }
  EXPECT_EQ(names_in(default_output()).size(), 12u);
}

TEST_F(BatchOrchestratorTest, StopRequestYieldsPartialReport) {
  write_file(input_dir / "a.jpg", "A");
  write_file(input_dir / "b.jpg", "B");
  write_file(input_dir / "c.jpg", "C");

  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  bus.subscribe<FileSanitizedEvent>([&](const FileSanitizedEvent&) { orchestrator.request_stop(); });
  const auto report = orchestrator.run(options());

  EXPECT_TRUE(report.cancelled);
  ASSERT_EQ(report.results.size(), 1u);
  EXPECT_EQ(report.results[0].destination.filename(), "IMG_0001.JPG");
  EXPECT_FALSE(has_leftover_temporaries());
}

TEST_F(BatchOrchestratorTest, StopFromWorkerDropsQueuedFiles) {
  for (int i = 0; i < 6; ++i) write_file(input_dir / ("f" + std::to_string(i) + ".jpg"), "X");

  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  bus.subscribe<FileSanitizeStartEvent>([&](const FileSanitizeStartEvent&) { orchestrator.request_stop(); });
  auto o = options();
  o.threads = 2;
  const auto report = orchestrator.run(o);

  // only files already picked up by the two workers get through
  EXPECT_TRUE(report.cancelled);
  EXPECT_GE(report.results.size(), 1u);
  EXPECT_LE(report.results.size(), 2u);
  EXPECT_FALSE(has_leftover_temporaries());
}

TEST_F(BatchOrchestratorTest, StopRequestOnlyAffectsTheRunningBatch) {
  write_file(input_dir / "a.jpg", "A");
  write_file(input_dir / "b.jpg", "B");

  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  bool stop_next = true;
  bus.subscribe<FileSanitizedEvent>([&](const FileSanitizedEvent&) {
    if (stop_next) {
      stop_next = false;
      orchestrator.request_stop();
    }
  });

  const auto first = orchestrator.run(options());
  EXPECT_TRUE(first.cancelled);
  ASSERT_EQ(first.results.size(), 1u);

  const auto second = orchestrator.run(options());
  EXPECT_FALSE(second.cancelled);
  EXPECT_FALSE(orchestrator.is_stopped());
  EXPECT_EQ(destination_names(second), (std::vector<std::string>{"IMG_0002.JPG", "IMG_0003.JPG"}));
}

TEST_F(BatchOrchestratorTest, StopBeforeRunIsCleared) {
  write_file(input_dir / "a.jpg", "A");

  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  orchestrator.request_stop();
  const auto report = orchestrator.run(options());

  EXPECT_FALSE(report.cancelled);
  EXPECT_EQ(report.results.size(), 1u);
}

TEST_F(BatchOrchestratorTest, OutputFolderAboveInputKeepsInputFiles) {
  write_file(input_dir / "a.jpg", "A");
  write_file(input_dir / "sub" / "b.jpg", "B");

  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  auto o = options();
  o.output_root = test_dir;
  o.recursive = true;
  const auto report = orchestrator.run(o);

  EXPECT_EQ(destination_names(report), (std::vector<std::string>{"IMG_0001.JPG", "IMG_0002.JPG"}));
  EXPECT_EQ(read_file(test_dir / "IMG_0001.JPG"), "A");
  EXPECT_EQ(read_file(test_dir / "IMG_0002.JPG"), "B");
}

TEST_F(BatchOrchestratorTest, PublishesLifecycleEvents) {
  write_file(input_dir / "a.jpg", "A");
  write_file(input_dir / "b.txt", "text\n");

  std::size_t announced = 0;
  std::size_t sanitized = 0;
  std::size_t skipped = 0;
  bool completed = false;
  bus.subscribe<BatchStartEvent>([&](const BatchStartEvent& e) { announced = e.total_files; });
  bus.subscribe<FileSanitizedEvent>([&](const FileSanitizedEvent&) { ++sanitized; });
  bus.subscribe<FileSkippedEvent>([&](const FileSkippedEvent&) { ++skipped; });
  bus.subscribe<BatchCompleteEvent>([&](const BatchCompleteEvent& e) { completed = !e.cancelled; });

  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  (void)orchestrator.run(options());

  EXPECT_EQ(announced, 2u);
  EXPECT_EQ(sanitized, 1u);
  EXPECT_EQ(skipped, 1u);
  EXPECT_TRUE(completed);
}

TEST_F(BatchOrchestratorTest, MissingInputIsASetupError) {
  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  auto o = options();
  o.input_root = test_dir / "nope";

  try {
    (void)orchestrator.run(o);
    FAIL() << "expected SetupError";
  } catch (const SetupError& e) {
    EXPECT_EQ(e.kind(), SetupErrorKind::InputMissing);
    EXPECT_EQ(exit_code_for(e.kind()), kExitSetup);
  }
}

TEST_F(BatchOrchestratorTest, OutputEqualToInputIsRejected) {
  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  auto o = options();
  o.output_root = input_dir / "." / "";

  try {
    (void)orchestrator.run(o);
    FAIL() << "expected SetupError";
  } catch (const SetupError& e) {
    EXPECT_EQ(e.kind(), SetupErrorKind::OutputInvalid);
  }
}

TEST_F(BatchOrchestratorTest, OutputThatIsAFileIsRejected) {
  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  auto o = options();
  o.output_root = write_file(test_dir / "occupied", "file");

  try {
    (void)orchestrator.run(o);
    FAIL() << "expected SetupError";
  } catch (const SetupError& e) {
    EXPECT_EQ(e.kind(), SetupErrorKind::OutputInvalid);
  }
}

TEST_F(BatchOrchestratorTest, StrictToolsRefusesToRunWithoutTools) {
  write_file(input_dir / "a.jpg", "A");
  install_fake_exiftool();

  const auto resolver = isolated_resolver();
  BatchOrchestrator orchestrator(resolver, bus);
  auto o = options();
  o.strict_tools = true;

  try {
    (void)orchestrator.run(o);
    FAIL() << "expected SetupError";
  } catch (const SetupError& e) {
    EXPECT_EQ(e.kind(), SetupErrorKind::ToolsMissing);
    EXPECT_EQ(exit_code_for(e.kind()), kExitToolsMissing);
  }
  EXPECT_FALSE(fs::exists(default_output()));
}
