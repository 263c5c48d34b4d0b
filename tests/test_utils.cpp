/**
 * @file test_utils.cpp
 * @brief String, hash, URL and process helpers
 */

#include <gtest/gtest.h>

#include "cerberus/utils/command_runner.hpp"
#include "cerberus/utils/hash_utils.hpp"
#include "cerberus/utils/net_utils.hpp"
#include "cerberus/utils/string_utils.hpp"
#include "test_helpers.hpp"

#include <fstream>
#include <regex>
#include <set>
#include <thread>

using namespace cerberus::utils;

// ============================================================================
// StringUtils
// ============================================================================

TEST(StringUtilsTest, TrimAndCase) {
    EXPECT_EQ(StringUtils::Trim("  \tabc \n"), "abc");
    EXPECT_EQ(StringUtils::Trim("   "), "");
    EXPECT_EQ(StringUtils::ToLower("No Space Left"), "no space left");
    EXPECT_TRUE(StringUtils::ContainsIgnoreCase("Error: Port Is Already Allocated", "port is already"));
}

TEST(StringUtilsTest, SplitKeepsEmptyFields) {
    EXPECT_EQ(StringUtils::Split("a,,b", ','), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_EQ(StringUtils::SplitLines("one\n\ntwo\n"), (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(StringUtils::Join({"docker", "rm", "-f"}, " "), "docker rm -f");
}

TEST(StringUtilsTest, TailLines) {
    const std::string log = "l1\nl2\nl3\nl4\n";
    EXPECT_EQ(StringUtils::TailLines(log, 2), "l3\nl4\n");
    EXPECT_EQ(StringUtils::TailLines(log, 10), log);
    EXPECT_EQ(StringUtils::TailLines(log, 0), "");
}

// ============================================================================
// HashUtils
// ============================================================================

TEST(HashUtilsTest, Sha256KnownVector) {
    EXPECT_EQ(HashUtils::ComputeSHA256("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashUtilsTest, UuidFormat) {
    static const std::regex kUuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        auto id = HashUtils::GenerateUuid();
        EXPECT_TRUE(std::regex_match(id, kUuid)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 50u);
}

TEST(HashUtilsTest, CanaryTokensAreUnique) {
    auto a = HashUtils::GenerateCanaryToken("web-101", "alice", std::nullopt);
    auto b = HashUtils::GenerateCanaryToken("web-101", "alice", std::nullopt);
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
    EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
}

// ============================================================================
// NetUtils
// ============================================================================

TEST(NetUtilsTest, ParseUrl) {
    auto plain = NetUtils::ParseUrl("http://challenges.local:31337/health");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->scheme, "http");
    EXPECT_EQ(plain->host, "challenges.local");
    EXPECT_EQ(plain->port, 31337);
    EXPECT_EQ(plain->path, "/health");

    auto tls = NetUtils::ParseUrl("https://example.org");
    ASSERT_TRUE(tls.has_value());
    EXPECT_EQ(tls->port, 443);
    EXPECT_EQ(tls->path, "/");

    auto v6 = NetUtils::ParseUrl("http://[::1]:8080/x");
    ASSERT_TRUE(v6.has_value());
    EXPECT_EQ(v6->host, "::1");
    EXPECT_EQ(v6->port, 8080);

    EXPECT_FALSE(NetUtils::ParseUrl("ssh://root@10.0.0.1:22").has_value());
    EXPECT_FALSE(NetUtils::ParseUrl("http://host:notaport/").has_value());
}

// ============================================================================
// ProcessRunner
// ============================================================================

TEST(ProcessRunnerTest, CapturesOutputAndExitCode) {
    ProcessRunner runner;

    CommandSpec spec;
    spec.argv = {"sh", "-c", "echo out; echo err >&2; exit 3"};
    auto result = runner.Run(spec);

    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
    EXPECT_FALSE(result.Ok());
    EXPECT_EQ(result.ErrorText(), "err");
}

TEST(ProcessRunnerTest, PassesEnvironmentAndWorkingDirectory) {
    cerberus::test::TempDir dir;
    ProcessRunner runner;

    CommandSpec spec;
    spec.argv = {"sh", "-c", "printf '%s ' \"$CERBERUS_PROBE\"; pwd"};
    spec.env["CERBERUS_PROBE"] = "hello";
    spec.working_directory = dir.Path().string();
    auto result = runner.Run(spec);

    ASSERT_TRUE(result.Ok()) << result.ErrorText();
    EXPECT_EQ(StringUtils::Trim(result.stdout_text),
              "hello " + std::filesystem::canonical(dir.Path()).string());
}

TEST(ProcessRunnerTest, TimeoutKillsProcess) {
    ProcessRunner runner;

    CommandSpec spec;
    spec.argv = {"sleep", "5"};
    spec.timeout = std::chrono::milliseconds(200);

    const auto start = std::chrono::steady_clock::now();
    auto result = runner.Run(spec);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, 124);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(ProcessRunnerTest, MissingBinaryReports127) {
    ProcessRunner runner;

    CommandSpec spec;
    spec.argv = {"cerberus-no-such-binary-xyz"};
    auto result = runner.Run(spec);
    EXPECT_EQ(result.exit_code, 127);
}

TEST(ProcessRunnerTest, BackgroundProcessLifecycle) {
    cerberus::test::TempDir dir;
    ProcessRunner runner;

    CommandSpec spec;
    spec.argv = {"sh", "-c", "echo started; exec sleep 30"};
    spec.output_file = (dir.Path() / "out.log").string();

    long pid = runner.StartBackground(spec);
    ASSERT_GT(pid, 0);
    EXPECT_TRUE(runner.IsRunning(pid));

    const auto log_path = dir.Path() / "out.log";
    auto logged = [&log_path] {
        std::error_code ec;
        auto size = std::filesystem::file_size(log_path, ec);
        return !ec && size > 0;
    };
    for (int i = 0; i < 100 && !logged(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    runner.Terminate(pid, std::chrono::milliseconds(500));
    EXPECT_FALSE(runner.IsRunning(pid));

    std::ifstream log(log_path);
    std::string first;
    std::getline(log, first);
    EXPECT_EQ(first, "started");
}
