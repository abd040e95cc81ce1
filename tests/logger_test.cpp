#include "core/logger.hpp"
#include "uci/uci_client.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace chessan;
using namespace std::chrono_literals;

namespace {

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

bool contains_line_ending_with(const std::vector<std::string>& lines, const std::string& suffix) {
    for (const auto& line : lines) {
        if (line.size() >= suffix.size() &&
            line.compare(line.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST(LoggerTest, ClosedLoggerIgnoresWrites) {
    core::Logger logger;
    EXPECT_FALSE(logger.is_enabled());
    EXPECT_NO_THROW(logger.write("app", "nothing happens"));
}

TEST(LoggerTest, WritesTimestampedTaggedLines) {
    test::TempDir dir;
    auto path = dir.path() / "engine.log";
    {
        core::Logger logger;
        ASSERT_TRUE(logger.open(path));
        EXPECT_TRUE(logger.is_enabled());
        logger.write(">", "isready");
        logger.write("<", "readyok");
    }

    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 2u);
    // HH:MM:SS.mmm
    EXPECT_EQ(lines[0].size(), std::string("00:00:00.000 [>] isready").size());
    EXPECT_EQ(lines[0][2], ':');
    EXPECT_EQ(lines[0][8], '.');
    EXPECT_EQ(lines[0].substr(12), " [>] isready");
    EXPECT_EQ(lines[1].substr(12), " [<] readyok");
}

TEST(LoggerTest, OpenTruncatesPreviousLog) {
    test::TempDir dir;
    auto path = dir.path() / "engine.log";
    std::ofstream(path) << "stale line\n";

    core::Logger logger;
    ASSERT_TRUE(logger.open(path));
    logger.write("app", "fresh");
    logger.close();

    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_TRUE(contains_line_ending_with(lines, "[app] fresh"));
}

TEST(LoggerTest, RecordsEngineTraffic) {
    test::TempDir dir;
    auto path = dir.path() / "engine.log";
    core::Logger logger;
    ASSERT_TRUE(logger.open(path));
    {
        uci::UciClient client(
            std::make_unique<process::Process>(test::stub_engine_path(),
                                               std::vector<std::string>{"--name", "Logged"}),
            &logger);
        client.handshake(3s);
        client.quit(500ms);
    }
    logger.close();

    auto lines = read_lines(path);
    EXPECT_TRUE(contains_line_ending_with(lines, "[>] uci"));
    EXPECT_TRUE(contains_line_ending_with(lines, "[<] id name Logged"));
    EXPECT_TRUE(contains_line_ending_with(lines, "[<] uciok"));
    EXPECT_TRUE(contains_line_ending_with(lines, "[<] readyok"));
    EXPECT_TRUE(contains_line_ending_with(lines, "[>] quit"));
}
