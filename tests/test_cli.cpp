#include <gtest/gtest.h>

#include "core/cli.hpp"

#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

// ── Subcommand dispatch tests ───────────────────────────────

TEST(CLIDispatch, NoArgs_ReturnsTUI) {
    char* argv[] = { (char*)"chi-watchdog" };
    EXPECT_EQ(CLI::run(1, argv), -1);
}

TEST(CLIDispatch, Help_ReturnsZero) {
    char* argv[] = { (char*)"chi-watchdog", (char*)"help" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, HelpFlag_ReturnsZero) {
    char* argv[] = { (char*)"chi-watchdog", (char*)"--help" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, HelpShort_ReturnsZero) {
    char* argv[] = { (char*)"chi-watchdog", (char*)"-h" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, Version_ReturnsZero) {
    char* argv[] = { (char*)"chi-watchdog", (char*)"version" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, VersionFlag_ReturnsZero) {
    char* argv[] = { (char*)"chi-watchdog", (char*)"--version" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, UnknownCommand_ReturnsError) {
    char* argv[] = { (char*)"chi-watchdog", (char*)"foobar" };
    EXPECT_EQ(CLI::run(2, argv), 1);
}

TEST(CLIDispatch, RunWithoutJob_ReturnsError) {
    char* argv[] = { (char*)"chi-watchdog", (char*)"run" };
    EXPECT_EQ(CLI::run(2, argv), 1);
}

// ── Config-backed subcommands ───────────────────────────────

class CLIConfigTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string config_file;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("chi-watchdog-test-cli-" + std::to_string(getpid()));
        fs::create_directories(test_dir);
        config_file = test_dir + "/config.yaml";
        setenv("CHI_WATCHDOG_CONFIG", config_file.c_str(), 1);

        std::ofstream out(config_file);
        out << "logging:\n"
               "  level: \"off\"\n"
               "jobs:\n"
               "  - id: ok\n"
               "    title: Succeeds\n"
               "    commands: [\"echo one\", \"echo two\"]\n"
               "  - id: fails\n"
               "    commands: [\"false\"]\n"
               "  - id: chain\n"
               "    sequential: true\n"
               "    stop_on_failure: true\n"
               "    commands: [\"false\", \"echo never\"]\n";
    }

    void TearDown() override {
        unsetenv("CHI_WATCHDOG_CONFIG");
        fs::remove_all(test_dir);
    }

    int run(std::vector<const char*> args) {
        std::vector<char*> argv;
        argv.push_back((char*)"chi-watchdog");
        for (auto a : args) argv.push_back((char*)a);
        return CLI::run(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(CLIConfigTest, List) {
    EXPECT_EQ(run({"list"}), 0);
}

TEST_F(CLIConfigTest, ListJson) {
    testing::internal::CaptureStdout();
    int rc = run({"list", "--json"});
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(rc, 0);
    EXPECT_NE(out.find("\"id\": \"ok\""), std::string::npos);
    EXPECT_NE(out.find("\"mode\": \"sequential\""), std::string::npos);
}

TEST_F(CLIConfigTest, CheckValid) {
    EXPECT_EQ(run({"check"}), 0);
}

TEST_F(CLIConfigTest, CheckInvalid) {
    std::ofstream out(config_file);
    out << "jobs:\n  - id: dup\n    commands: [\"true\"]\n  - id: dup\n    commands: [\"true\"]\n";
    out.close();
    EXPECT_EQ(run({"check"}), 1);
}

TEST_F(CLIConfigTest, MissingConfig) {
    fs::remove(config_file);
    EXPECT_EQ(run({"list"}), 1);
    EXPECT_EQ(run({"check"}), 1);
}

TEST_F(CLIConfigTest, RunUnknownJob) {
    EXPECT_EQ(run({"run", "nope"}), 1);
}

TEST_F(CLIConfigTest, RunSucceeds) {
    testing::internal::CaptureStdout();
    int rc = run({"run", "ok"});
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(rc, 0);
    EXPECT_NE(out.find("[0] one"), std::string::npos);
    EXPECT_NE(out.find("[1] two"), std::string::npos);
    EXPECT_NE(out.find("[0] [done]"), std::string::npos);
}

TEST_F(CLIConfigTest, RunFailureExitCode) {
    EXPECT_EQ(run({"run", "fails"}), 1);
}

TEST_F(CLIConfigTest, RunSequentialAbort) {
    testing::internal::CaptureStdout();
    int rc = run({"run", "chain"});
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(rc, 1);
    EXPECT_NE(out.find("[1] [aborted by stop_on_failure]"), std::string::npos);
    EXPECT_EQ(out.find("[1] never"), std::string::npos);
}
