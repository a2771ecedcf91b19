#ifndef NICLEAN_TEST_HELPERS_HPP
#define NICLEAN_TEST_HELPERS_HPP

#include <gtest/gtest.h>

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <sys/time.h>
#include <vector>

#include "../libniclean/include/capability_resolver.hpp"
#include "../libniclean/include/random_utils.hpp"

namespace fs = std::filesystem;

// Fixture owning a fresh temporary folder per test; removed in TearDown.
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir = fs::temp_directory_path() / ("niclean_test_" + RandomUtils::random_suffix());
    fs::create_directories(test_dir);
    input_dir = test_dir / "input";
    tools_dir = test_dir / "tools";
    fs::create_directories(input_dir);
    fs::create_directories(tools_dir);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir, ec);
  }

  // Writes a file (creating parent folders) and returns its path.
  static fs::path write_file(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    return path;
  }

  static std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  }

  // Writes an executable /bin/sh script.
  static fs::path write_script(const fs::path& path, const std::string& body) {
    write_file(path, "#!/bin/sh\n" + body);
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                    fs::perm_options::replace);
    return path;
  }

  // Sets access and modification time to a whole number of seconds.
  static void set_mtime(const fs::path& path, const std::time_t t) {
    timeval tv[2]{};
    tv[0].tv_sec = t;
    tv[1].tv_sec = t;
    ASSERT_EQ(::utimes(path.c_str(), tv), 0);
  }

  static std::time_t local_time(int y, int mo, int d, int h, int mi, int s) {
    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = s;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
  }

  // Fake exiftool: answers -ver, replaces the copy with "stripped" on -all=,
  // and prints the file content as capture time on -s3.
  fs::path install_fake_exiftool() {
    return write_script(tools_dir / "exiftool",
                        "for last; do :; done\n"
                        "case \"$1\" in\n"
                        "  -ver) echo 12.76; exit 0 ;;\n"
                        "  -all=) printf stripped > \"$last\"; exit 0 ;;\n"
                        "  -s3) cat \"$last\"; exit 0 ;;\n"
                        "esac\n"
                        "exit 1\n");
  }

  // Fake ffmpeg: answers -version and writes "remuxed" to the last argument.
  fs::path install_fake_ffmpeg() {
    return write_script(tools_dir / "ffmpeg",
                        "for last; do :; done\n"
                        "if [ \"$1\" = \"-version\" ]; then echo 'ffmpeg version 6.1'; exit 0; fi\n"
                        "printf remuxed > \"$last\"\n"
                        "exit 0\n");
  }

  // Resolver that only looks in tools_dir, never on the real $PATH.
  [[nodiscard]] niclean::CapabilityResolver isolated_resolver() const {
    std::vector<std::unique_ptr<niclean::IToolLocator>> locators;
    locators.push_back(std::make_unique<niclean::BundledToolLocator>(tools_dir));
    locators.push_back(std::make_unique<niclean::SearchPathLocator>(""));
    return niclean::CapabilityResolver(std::move(locators), std::chrono::seconds(10));
  }

  fs::path test_dir;
  fs::path input_dir;
  fs::path tools_dir;
};

#endif  // NICLEAN_TEST_HELPERS_HPP
