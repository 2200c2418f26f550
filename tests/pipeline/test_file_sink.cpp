#include <atomic>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <thread>
#include "../core/test_base.hpp"
#include "quote_ngin/actor/supervisor.hpp"
#include "quote_ngin/core/time_utils.hpp"
#include "quote_ngin/pipeline/file_sink.hpp"

using namespace quote_ngin;
using namespace quote_ngin::testing;

namespace {

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream file(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

class FileSinkTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        dir_ = std::filesystem::temp_directory_path() / "quote_ngin_file_sink_test";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
        TestBase::TearDown();
    }

    std::unique_ptr<Supervisor<FileSink>> make_sink(const std::string& directory) {
        return std::make_unique<Supervisor<FileSink>>(
            "file_sink", bus_, [directory]() { return std::make_unique<FileSink>(directory); });
    }

    std::string sink_path(Supervisor<FileSink>& sink) {
        auto path = sink.call<std::string>([](FileSink& s) { return s.path(); },
                                           std::chrono::milliseconds(1000));
        return path.is_ok() ? path.value() : "";
    }

    MessageBus bus_;
    std::filesystem::path dir_;
};

TEST_F(FileSinkTest, WritesHeaderThenOneRowPerRecord) {
    auto sink = make_sink(dir_.string());
    ASSERT_TRUE(sink->start().is_ok());

    std::string path = sink_path(*sink);
    ASSERT_FALSE(path.empty());
    EXPECT_EQ(std::filesystem::path(path).parent_path().string(), dir_.string());
    EXPECT_EQ(std::filesystem::path(path).extension().string(), ".csv");

    // Header is on disk before any record arrives
    EXPECT_EQ(read_lines(path), (std::vector<std::string>{CSV_HEADER}));

    PerformanceIndicators indicators;
    indicators.symbol = "AAPL";
    indicators.timestamp = core::from_unix_seconds(1709251200);
    indicators.price = 9.0;
    indicators.pct_change = -0.1;
    indicators.period_min = 9.0;
    indicators.period_max = 12.0;
    ASSERT_TRUE(bus_.publish(indicators).is_ok());

    // Rows are flushed as they are written
    ASSERT_TRUE(wait_until([&path]() { return read_lines(path).size() == 2; }));
    auto rows = sink->call<size_t>([](FileSink& s) { return s.rows_written(); },
                                   std::chrono::milliseconds(1000));
    ASSERT_TRUE(rows.is_ok());
    EXPECT_EQ(rows.value(), 1u);

    sink->stop();
    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], CSV_HEADER);
    EXPECT_EQ(lines[1], "2024-03-01T00:00:00+00:00,AAPL,$9.00,-10.00%,$9.00,$12.00,$0.00");
}

TEST_F(FileSinkTest, NeverOverwritesAnExistingLog) {
    std::filesystem::create_directories(dir_);
    auto now = core::to_unix_seconds(std::chrono::system_clock::now());
    // Occupy the next few seconds so the sink cannot dodge the clash
    for (int64_t s = now; s < now + 3; ++s) {
        std::ofstream(dir_ / (std::to_string(s) + ".csv")) << "keep me\n";
    }

    auto sink = make_sink(dir_.string());
    ASSERT_TRUE(sink->start().is_ok());
    std::string path = sink_path(*sink);
    sink->stop();

    EXPECT_NE(path.find("_1.csv"), std::string::npos) << path;
    EXPECT_EQ(read_lines(path), (std::vector<std::string>{CSV_HEADER}));
    EXPECT_EQ(read_lines((dir_ / (std::to_string(now) + ".csv")).string()),
              (std::vector<std::string>{"keep me"}));
}

TEST_F(FileSinkTest, ConcurrentSinksGetDistinctFiles) {
    constexpr int kSinks = 6;
    std::filesystem::create_directories(dir_);
    std::vector<std::unique_ptr<Supervisor<FileSink>>> sinks;
    std::string directory = dir_.string();
    for (int i = 0; i < kSinks; ++i) {
        sinks.push_back(std::make_unique<Supervisor<FileSink>>(
            "file_sink_" + std::to_string(i), bus_,
            [directory]() { return std::make_unique<FileSink>(directory); }));
    }

    std::vector<std::thread> starters;
    std::atomic<int> started{0};
    for (auto& sink : sinks) {
        starters.emplace_back([&sink, &started]() {
            if (sink->start().is_ok()) {
                started++;
            }
        });
    }
    for (auto& starter : starters) {
        starter.join();
    }
    ASSERT_EQ(started.load(), kSinks);

    std::set<std::string> paths;
    for (auto& sink : sinks) {
        paths.insert(sink_path(*sink));
    }
    for (auto& sink : sinks) {
        sink->stop();
    }

    EXPECT_EQ(paths.size(), static_cast<size_t>(kSinks));
    for (const auto& path : paths) {
        EXPECT_EQ(read_lines(path), (std::vector<std::string>{CSV_HEADER})) << path;
    }
}

TEST_F(FileSinkTest, CreatesMissingDirectories) {
    auto nested = dir_ / "a" / "b";
    auto sink = make_sink(nested.string());
    ASSERT_TRUE(sink->start().is_ok());
    std::string path = sink_path(*sink);
    sink->stop();

    EXPECT_TRUE(std::filesystem::is_directory(nested));
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(FileSinkTest, UnusableDirectoryFailsToStart) {
    std::filesystem::create_directories(dir_);
    auto blocker = dir_ / "not_a_directory";
    std::ofstream(blocker) << "x";

    auto sink = make_sink(blocker.string());
    auto started = sink->start();
    ASSERT_TRUE(started.is_error());
    EXPECT_EQ(started.error()->code(), ErrorCode::FILE_IO_ERROR);
    EXPECT_EQ(bus_.subscriber_count<PerformanceIndicators>(), 0u);
}
