#include "process/process.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace chessan;
using namespace std::chrono_literals;

TEST(ResolveExecutableTest, AcceptsExecutableFile) {
    auto resolved = process::resolve_executable(test::stub_engine_path().string());
    ASSERT_TRUE(resolved.has_value());
    EXPECT_TRUE(resolved->is_absolute());
}

TEST(ResolveExecutableTest, FindsBareCommandOnPath) {
    auto resolved = process::resolve_executable("sh");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->filename(), "sh");
}

TEST(ResolveExecutableTest, RejectsInvalidValues) {
    test::TempDir dir;
    auto plain_file = dir.path() / "engine.txt";
    std::ofstream(plain_file) << "not an engine";
    chmod(plain_file.c_str(), 0644);

    EXPECT_FALSE(process::resolve_executable("").has_value());
    EXPECT_FALSE(process::resolve_executable((dir.path() / "missing").string()).has_value());
    EXPECT_FALSE(process::resolve_executable(plain_file.string()).has_value());
    EXPECT_FALSE(process::resolve_executable(dir.path().string()).has_value());
    EXPECT_FALSE(process::resolve_executable("chessan-no-such-engine-xyz").has_value());
}

TEST(ProcessTest, LaunchingMissingBinaryThrows) {
    EXPECT_THROW(process::Process("/nonexistent/chessan/engine", {}), std::runtime_error);
}

TEST(ProcessTest, ExchangesLines) {
    process::Process cat("/bin/cat", {});
    ASSERT_TRUE(cat.is_running());
    EXPECT_GT(cat.pid(), 0);

    ASSERT_TRUE(cat.write_line("hello engine"));
    EXPECT_EQ(cat.read_line(2s), "hello engine");

    EXPECT_FALSE(cat.read_line(50ms).has_value());
    EXPECT_FALSE(cat.at_eof());

    cat.terminate();
    EXPECT_FALSE(cat.is_running());
}

TEST(ProcessTest, ReportsEndOfOutput) {
    process::Process shell("/bin/sh", {"-c", "echo one; printf 'two\\r\\n'; printf three"});
    EXPECT_EQ(shell.read_line(2s), "one");
    EXPECT_EQ(shell.read_line(2s), "two");
    EXPECT_EQ(shell.read_line(2s), "three");
    EXPECT_FALSE(shell.read_line(2s).has_value());
    EXPECT_TRUE(shell.at_eof());
    EXPECT_TRUE(shell.wait_for_exit(2s));
    EXPECT_FALSE(shell.is_running());
}

TEST(ProcessTest, WriteToExitedProcessFails) {
    process::Process shell("/bin/sh", {"-c", "exit 0"});
    ASSERT_TRUE(shell.wait_for_exit(2s));
    bool written = true;
    for (int i = 0; i < 3 && written; ++i) {
        written = shell.write_line("isready");
    }
    EXPECT_FALSE(written);
}
