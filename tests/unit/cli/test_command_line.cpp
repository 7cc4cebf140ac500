/**
 * @file test_command_line.cpp
 * @brief Unit tests for argument parsing and the shared tool front end
 */

#include <gtest/gtest.h>

#include <kcenon/file_move/cli/command_line.h>

#include "test_helpers.h"

#include <cstdlib>
#include <initializer_list>
#include <string>
#include <vector>

namespace kcenon::file_move::test {

using namespace kcenon::file_move::cli;

namespace {

/**
 * @brief Owns a mutable argv for getopt
 */
class argv_builder {
public:
    argv_builder(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    [[nodiscard]] auto argc() const -> int { return static_cast<int>(storage_.size()); }
    [[nodiscard]] auto argv() -> char** { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

}  // namespace

// =============================================================================
// parse_command_line
// =============================================================================

class ParseCommandLineTest : public ::testing::Test {
protected:
    void SetUp() override { ::unsetenv("MODE_DRY_RUN"); }
    void TearDown() override { ::unsetenv("MODE_DRY_RUN"); }

    static auto parse(std::initializer_list<std::string> args,
                      transfer_mode mode = transfer_mode::move) -> result<cli_options> {
        argv_builder builder(args);
        return parse_command_line(mode, builder.argc(), builder.argv());
    }
};

TEST_F(ParseCommandLineTest, SourcesAndDestination) {
    auto opts = parse({"mvx", "a.txt", "b.txt", "dest/"});

    ASSERT_TRUE(opts.has_value()) << opts.error().message;
    EXPECT_EQ(opts.value().mode, transfer_mode::move);
    ASSERT_EQ(opts.value().sources.size(), 2u);
    EXPECT_EQ(opts.value().sources[0], "a.txt");
    EXPECT_EQ(opts.value().sources[1], "b.txt");
    EXPECT_EQ(opts.value().destination, "dest/");
    EXPECT_FALSE(opts.value().force);
    EXPECT_FALSE(opts.value().dry_run);
}

TEST_F(ParseCommandLineTest, Flags) {
    auto opts = parse({"cpx", "-f", "--dry-run", "-vv", "--log-json", "a", "b"},
                      transfer_mode::copy);

    ASSERT_TRUE(opts.has_value()) << opts.error().message;
    EXPECT_EQ(opts.value().mode, transfer_mode::copy);
    EXPECT_TRUE(opts.value().force);
    EXPECT_TRUE(opts.value().dry_run);
    EXPECT_TRUE(opts.value().log_json);
    EXPECT_EQ(opts.value().verbose, 2);
}

TEST_F(ParseCommandLineTest, OptionsAfterPositionals) {
    auto opts = parse({"mvx", "a", "b", "--force"});

    ASSERT_TRUE(opts.has_value()) << opts.error().message;
    EXPECT_TRUE(opts.value().force);
    EXPECT_EQ(opts.value().destination, "b");
}

TEST_F(ParseCommandLineTest, DoubleDashEndsOptions) {
    auto opts = parse({"mvx", "--", "-weird", "dest"});

    ASSERT_TRUE(opts.has_value()) << opts.error().message;
    ASSERT_EQ(opts.value().sources.size(), 1u);
    EXPECT_EQ(opts.value().sources[0], "-weird");
}

TEST_F(ParseCommandLineTest, TooFewPositionals) {
    auto opts = parse({"mvx", "only-one"});

    ASSERT_FALSE(opts.has_value());
    EXPECT_EQ(opts.error().code, error_code::invalid_configuration);
    EXPECT_NE(opts.error().message.find("<SRC>"), std::string::npos);
}

TEST_F(ParseCommandLineTest, UnknownShortOption) {
    auto opts = parse({"mvx", "-x", "a", "b"});

    ASSERT_FALSE(opts.has_value());
    EXPECT_EQ(opts.error().code, error_code::invalid_configuration);
    EXPECT_EQ(opts.error().message, "unexpected argument '-x'");
}

TEST_F(ParseCommandLineTest, UnknownLongOption) {
    auto opts = parse({"mvx", "--frobnicate", "a", "b"});

    ASSERT_FALSE(opts.has_value());
    EXPECT_NE(opts.error().message.find("--frobnicate"), std::string::npos);
}

TEST_F(ParseCommandLineTest, HelpSkipsPositionalChecks) {
    auto opts = parse({"mvx", "--help"});

    ASSERT_TRUE(opts.has_value());
    EXPECT_TRUE(opts.value().show_help);
}

TEST_F(ParseCommandLineTest, VersionSkipsPositionalChecks) {
    auto opts = parse({"mvx", "-V"});

    ASSERT_TRUE(opts.has_value());
    EXPECT_TRUE(opts.value().show_version);
}

TEST_F(ParseCommandLineTest, DryRunFromEnvironment) {
    ::setenv("MODE_DRY_RUN", "true", 1);

    auto opts = parse({"mvx", "a", "b"});

    ASSERT_TRUE(opts.has_value());
    EXPECT_TRUE(opts.value().dry_run);
}

TEST_F(ParseCommandLineTest, DryRunEnvironmentCanBeFalse) {
    ::setenv("MODE_DRY_RUN", "0", 1);

    auto opts = parse({"mvx", "a", "b"});

    ASSERT_TRUE(opts.has_value());
    EXPECT_FALSE(opts.value().dry_run);
}

TEST_F(ParseCommandLineTest, ParsingTwiceInOneProcess) {
    auto first = parse({"mvx", "-f", "a", "b"});
    auto second = parse({"mvx", "c", "d"});

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(first.value().force);
    EXPECT_FALSE(second.value().force);
    EXPECT_EQ(second.value().sources[0], "c");
}

// =============================================================================
// Verbosity
// =============================================================================

TEST(CliOptionsTest, LevelFollowsVerbosity) {
    cli_options opts;
    EXPECT_EQ(opts.level(), log_level::info);
    EXPECT_TRUE(opts.show_progress());

    opts.verbose = 1;
    EXPECT_EQ(opts.level(), log_level::debug);
    opts.verbose = 5;
    EXPECT_EQ(opts.level(), log_level::trace);
    EXPECT_TRUE(opts.show_progress());

    opts.verbose = 0;
    opts.quiet = 1;
    EXPECT_EQ(opts.level(), log_level::warn);
    EXPECT_FALSE(opts.show_progress());
    opts.quiet = 2;
    EXPECT_EQ(opts.level(), log_level::error);
    opts.quiet = 3;
    EXPECT_EQ(opts.level(), log_level::off);
}

TEST(EnvFlagTest, Values) {
    EXPECT_FALSE(env_flag_enabled(nullptr));
    EXPECT_FALSE(env_flag_enabled(""));
    EXPECT_FALSE(env_flag_enabled("0"));
    EXPECT_FALSE(env_flag_enabled("FALSE"));
    EXPECT_FALSE(env_flag_enabled("No"));
    EXPECT_FALSE(env_flag_enabled("off"));
    EXPECT_TRUE(env_flag_enabled("1"));
    EXPECT_TRUE(env_flag_enabled("yes"));
    EXPECT_TRUE(env_flag_enabled("TRUE"));
}

TEST(UsageTest, NamesProgramAndOptions) {
    auto text = usage("cpx", transfer_mode::copy);

    EXPECT_EQ(text.rfind("Usage: cpx [OPTIONS] <SRC>... <DEST>", 0), 0u);
    EXPECT_NE(text.find("--force"), std::string::npos);
    EXPECT_NE(text.find("MODE_DRY_RUN"), std::string::npos);
}

// =============================================================================
// run_cli
// =============================================================================

class RunCliTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        ::unsetenv("MODE_DRY_RUN");
    }

    void TearDown() override {
        get_logger().enable_json_output(false);
        TempDirTest::TearDown();
    }

    static auto run(transfer_mode mode, std::initializer_list<std::string> args) -> int {
        argv_builder builder(args);
        return run_cli(mode, builder.argc(), builder.argv());
    }
};

TEST_F(RunCliTest, MovesFile) {
    auto src = write_file("a.txt", "data");

    EXPECT_EQ(run(transfer_mode::move, {"mvx", "-q", src.string(), path("b.txt").string()}),
              exit_success);

    EXPECT_FALSE(std::filesystem::exists(src));
    EXPECT_EQ(read_file(path("b.txt")), "data");
}

TEST_F(RunCliTest, CopiesIntoDirectory) {
    auto src = write_file("a.txt", "data");
    auto dest = make_dir("out");

    EXPECT_EQ(run(transfer_mode::copy, {"cpx", "-q", src.string(), dest.string()}),
              exit_success);

    EXPECT_EQ(read_file(dest / "a.txt"), "data");
    EXPECT_TRUE(std::filesystem::exists(src));
}

TEST_F(RunCliTest, TransferErrorExitsWithOne) {
    testing::internal::CaptureStderr();
    int code = run(transfer_mode::move, {"mvx", path("ghost").string(), path("x").string()});
    auto err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, exit_failure);
    EXPECT_NE(err.find("✗ Source"), std::string::npos);
    EXPECT_NE(err.find("does not exist"), std::string::npos);
}

TEST_F(RunCliTest, ConflictWithoutForceExitsWithOne) {
    auto src = write_file("a.txt", "new");
    auto dest = write_file("b.txt", "old");

    testing::internal::CaptureStderr();
    int code = run(transfer_mode::copy, {"cpx", src.string(), dest.string()});
    auto err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, exit_failure);
    EXPECT_NE(err.find("already exists"), std::string::npos);
    EXPECT_EQ(read_file(dest), "old");
}

TEST_F(RunCliTest, UsageErrorExitsWithTwo) {
    testing::internal::CaptureStderr();
    int code = run(transfer_mode::move, {"mvx", "lonely"});
    auto err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, exit_usage);
    EXPECT_NE(err.find("Usage: mvx"), std::string::npos);
}

TEST_F(RunCliTest, HelpAndVersion) {
    testing::internal::CaptureStdout();
    int help = run(transfer_mode::copy, {"cpx", "--help"});
    auto help_text = testing::internal::GetCapturedStdout();

    testing::internal::CaptureStdout();
    int version = run(transfer_mode::copy, {"cpx", "--version"});
    auto version_text = testing::internal::GetCapturedStdout();

    EXPECT_EQ(help, exit_success);
    EXPECT_NE(help_text.find("Usage: cpx"), std::string::npos);
    EXPECT_EQ(version, exit_success);
    EXPECT_EQ(version_text, "cpx 0.3.0\n");
}

TEST_F(RunCliTest, DryRunLeavesFilesAlone) {
    auto src = write_file("a.txt", "data");

    testing::internal::CaptureStderr();
    int code = run(transfer_mode::move, {"mvx", "-n", src.string(), path("b.txt").string()});
    auto err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, exit_success);
    EXPECT_TRUE(std::filesystem::exists(src));
    EXPECT_FALSE(std::filesystem::exists(path("b.txt")));
    EXPECT_NE(err.find("Would move"), std::string::npos);
    EXPECT_NE(err.find("dry run: 1 source would be moved"), std::string::npos);
}

TEST_F(RunCliTest, JsonLogLines) {
    auto src = write_file("a.txt", "data");

    testing::internal::CaptureStderr();
    int code = run(transfer_mode::copy,
                   {"cpx", "--log-json", src.string(), path("b.txt").string()});
    auto err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, exit_success);
    EXPECT_NE(err.find("\"message\":\"1 source copied\""), std::string::npos);
}

}  // namespace kcenon::file_move::test
