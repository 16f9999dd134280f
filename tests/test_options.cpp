#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>

#include "options.hpp"
#include "temp_dir.hpp"

using namespace pasture;
using pasture::testing::TempDir;

TEST(OptionsTest, DefaultsToWorkingDirectory) {
    const char* argv[] = {"pasture_server"};
    auto options = parse_command_line(1, argv);
    EXPECT_EQ(options.root_dir, std::filesystem::current_path());
    EXPECT_EQ(options.port, 5500);
    EXPECT_GE(options.worker_threads, 1);
    EXPECT_EQ(options.max_request_size, 1024u * 1024u);
    EXPECT_EQ(options.max_header_size, 8u * 1024u);
    EXPECT_TRUE(options.ignored_args.empty());
}

TEST(OptionsTest, FirstArgumentIsRoot) {
    TempDir dir;
    auto root = dir.path().string();
    const char* argv[] = {"pasture_server", root.c_str(), "--verbose", "x"};
    auto options = parse_command_line(4, argv);
    EXPECT_EQ(options.root_dir, dir.path());
    ASSERT_EQ(options.ignored_args.size(), 2u);
    EXPECT_EQ(options.ignored_args[0], "--verbose");
    EXPECT_EQ(options.ignored_args[1], "x");
}

TEST(OptionsTest, RootMustBeADirectory) {
    TempDir dir;
    auto file = dir.write_file("plain.txt", "x").string();
    auto missing = (dir.path() / "missing").string();

    const char* file_argv[] = {"pasture_server", file.c_str()};
    EXPECT_THROW(parse_command_line(2, file_argv), std::invalid_argument);

    const char* missing_argv[] = {"pasture_server", missing.c_str()};
    EXPECT_THROW(parse_command_line(2, missing_argv), std::invalid_argument);
}
