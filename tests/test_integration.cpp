// Boost before anything that defines the logging macros
#include "quote_ngin/app/pipeline.hpp"
#include <filesystem>
#include <fstream>
#include "core/test_base.hpp"
#include "mocks/mock_quote_provider.hpp"
#include "quote_ngin/core/time_utils.hpp"
#include "quote_ngin/data/http_client.hpp"

using namespace quote_ngin;
using namespace quote_ngin::testing;
using ::testing::_;
using ::testing::Invoke;

class IntegrationTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        output_dir_ = std::filesystem::temp_directory_path() / "quote_ngin_integration_test";
        std::filesystem::remove_all(output_dir_);

        ON_CALL(*provider_, fetch(_, _, _, _))
            .WillByDefault(Invoke([](const std::string& symbol, const Timestamp&,
                                     const Timestamp&, std::chrono::milliseconds)
                                      -> Result<std::vector<QuotePoint>> {
                if (symbol != "AAPL") {
                    return make_error<std::vector<QuotePoint>>(ErrorCode::API_ERROR,
                                                               "No data found");
                }
                // Deliberately out of order
                return std::vector<QuotePoint>{
                    {core::from_unix_seconds(1709337600), 12.0},
                    {core::from_unix_seconds(1709251200), 10.0},
                    {core::from_unix_seconds(1709424000), 9.0}};
            }));

        config_.symbols = {"AAPL", "NOPE"};
        config_.from = "2024-01-01T00:00:00Z";
        config_.interval_seconds = 3600;
        config_.output_directory = output_dir_.string();
        config_.http_port = 0;
        config_.downloader_workers = 2;
    }

    void TearDown() override {
        std::filesystem::remove_all(output_dir_);
        TestBase::TearDown();
    }

    std::vector<std::string> csv_lines() const {
        std::vector<std::string> lines;
        for (const auto& entry : std::filesystem::directory_iterator(output_dir_)) {
            std::ifstream file(entry.path());
            std::string line;
            while (std::getline(file, line)) {
                lines.push_back(line);
            }
        }
        return lines;
    }

    std::filesystem::path output_dir_;
    std::shared_ptr<::testing::NiceMock<MockQuoteProvider>> provider_ =
        std::make_shared<::testing::NiceMock<MockQuoteProvider>>();
    AppConfig config_;
};

TEST_F(IntegrationTest, QuotesFlowFromProviderToSinksAndHttp) {
    Pipeline pipeline(config_, provider_);
    auto started = pipeline.start();
    ASSERT_TRUE(started.is_ok()) << started.error()->to_string();
    ASSERT_NE(pipeline.http_port(), 0);

    // The first tick fires at startup
    ASSERT_TRUE(wait_until([&pipeline]() {
        auto tail = pipeline.tail(10);
        return tail.is_ok() && !tail.value().empty();
    }));

    auto tail = pipeline.tail(10);
    ASSERT_TRUE(tail.is_ok());
    // NOPE failed upstream and produced no record
    ASSERT_EQ(tail.value().size(), 1u);
    const auto& record = tail.value()[0];
    EXPECT_EQ(record.symbol, "AAPL");
    EXPECT_EQ(core::to_unix_seconds(record.timestamp), 1709424000);
    EXPECT_DOUBLE_EQ(record.price, 9.0);
    EXPECT_DOUBLE_EQ(record.pct_change, -0.1);
    EXPECT_DOUBLE_EQ(record.period_min, 9.0);
    EXPECT_DOUBLE_EQ(record.period_max, 12.0);
    EXPECT_DOUBLE_EQ(record.last_sma, 0.0);

    HttpClient client("http://127.0.0.1:" + std::to_string(pipeline.http_port()));
    auto response = client.get("/tail/1", std::chrono::milliseconds(3000));
    ASSERT_TRUE(response.is_ok()) << response.error()->what();
    EXPECT_EQ(response.value().status, 200);
    auto body = nlohmann::json::parse(response.value().body);
    ASSERT_EQ(body.size(), 1u);
    EXPECT_EQ(body[0]["symbol"].get<std::string>(), "AAPL");
    EXPECT_DOUBLE_EQ(body[0]["price"].get<double>(), 9.0);

    ASSERT_TRUE(wait_until([this]() { return csv_lines().size() >= 2; }));
    pipeline.stop();
    EXPECT_FALSE(pipeline.is_running());

    auto lines = csv_lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], CSV_HEADER);
    EXPECT_EQ(lines[1], "2024-03-03T00:00:00+00:00,AAPL,$9.00,-10.00%,$9.00,$12.00,$0.00");
}

TEST_F(IntegrationTest, EveryComponentReportsRunning) {
    Pipeline pipeline(config_, provider_);
    ASSERT_TRUE(pipeline.start().is_ok());

    auto components = pipeline.states()->get_all_components();
    // Two sinks, the processor, two downloaders and the scheduler
    EXPECT_EQ(components.size(), 6u);
    for (const auto& id : components) {
        EXPECT_TRUE(wait_until([&pipeline, &id]() {
            auto info = pipeline.states()->get_state(id);
            return info.is_ok() && info.value().state == ComponentState::RUNNING;
        })) << id;
    }

    EXPECT_TRUE(pipeline.states()->is_healthy());
    pipeline.log_status();
    pipeline.stop();
    EXPECT_FALSE(pipeline.states()->is_healthy());

    for (const auto& id : components) {
        auto info = pipeline.states()->get_state(id);
        ASSERT_TRUE(info.is_ok());
        EXPECT_EQ(info.value().state, ComponentState::STOPPED) << id;
    }
}

TEST_F(IntegrationTest, InvalidConfigurationFailsBeforeStarting) {
    config_.from = "last tuesday";
    Pipeline pipeline(config_, provider_);

    auto started = pipeline.start();
    ASSERT_TRUE(started.is_error());
    EXPECT_EQ(started.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(pipeline.is_running());
    EXPECT_TRUE(pipeline.states()->get_all_components().empty());
}

TEST_F(IntegrationTest, UnwritableOutputStopsStartedComponents) {
    std::filesystem::create_directories(output_dir_);
    auto blocker = output_dir_ / "file";
    std::ofstream(blocker) << "x";
    config_.output_directory = blocker.string();

    Pipeline pipeline(config_, provider_);
    auto started = pipeline.start();
    ASSERT_TRUE(started.is_error());
    EXPECT_EQ(started.error()->code(), ErrorCode::FILE_IO_ERROR);
    EXPECT_FALSE(pipeline.is_running());

    // A stopped pipeline stays stopped
    auto restarted = pipeline.start();
    ASSERT_TRUE(restarted.is_error());
    EXPECT_EQ(restarted.error()->code(), ErrorCode::BUS_CLOSED);
}
