#include <gtest/gtest.h>
#include "tools/MarketDataTools.h"
#include "FakeBackend.h"

class MarketDataToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        silenceLogger();
        auto owned = std::make_unique<FakeBackend>();
        backend = owned.get();
        lifecycle = std::make_unique<ServiceLifecycle>(std::move(owned));
        tools = std::make_unique<MarketDataTools>(*lifecycle);
    }

    FakeBackend* backend = nullptr;
    std::unique_ptr<ServiceLifecycle> lifecycle;
    std::unique_ptr<MarketDataTools> tools;
};

TEST_F(MarketDataToolsTest, TradingDatesKeepsLastThirtyInOrder) {
    for (long long d = 20240101; d < 20240141; ++d) {
        backend->tradingDates.emplace_back(d);
    }

    auto result = tools->getTradingDates("SH");
    ASSERT_TRUE(result.isOk());
    const auto& dates = result.value();
    ASSERT_EQ(dates.size(), MarketDataTools::kMaxTradingDates);
    // 40 个中保留最后 30 个: 20240111 .. 20240140
    EXPECT_EQ(dates.front(), "2024-01-11");
    EXPECT_EQ(dates.back(), "2024-01-40");
    EXPECT_EQ(lifecycle->getState(), ServiceLifecycle::State::Ready);
}

TEST_F(MarketDataToolsTest, TradingDatesShortAndEmpty) {
    backend->tradingDates = {std::string("2023-01-01"), 20230102LL};
    auto result = tools->getTradingDates("SZ");
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value(), nlohmann::json({"2023-01-01", "2023-01-02"}));

    backend->tradingDates.clear();
    result = tools->getTradingDates("SZ");
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value(), nlohmann::json::array({"未找到交易日期数据"}));
}

TEST_F(MarketDataToolsTest, StockListCappedAtFifty) {
    backend->stocks.clear();
    for (int i = 0; i < 80; ++i) {
        backend->stocks.push_back(std::to_string(600000 + i) + ".SH");
    }

    auto result = tools->getStockList("沪深A股");
    ASSERT_TRUE(result.isOk());
    ASSERT_EQ(result.value().size(), MarketDataTools::kMaxStocks);
    EXPECT_EQ(result.value()[0], "600000.SH");
    EXPECT_EQ(result.value()[49], "600049.SH");
}

TEST_F(MarketDataToolsTest, StockListEmptyAndFailure) {
    backend->stocks.clear();
    auto empty = tools->getStockList("创业板");
    ASSERT_TRUE(empty.isOk());
    EXPECT_EQ(empty.value(), nlohmann::json::array({"未找到板块 创业板 的股票列表"}));

    // 内部接口保留空列表
    auto raw = tools->listStocks("创业板");
    ASSERT_TRUE(raw.isOk());
    EXPECT_TRUE(raw.value().empty());

    backend->failStockList = true;
    auto failed = tools->getStockList("创业板");
    ASSERT_FALSE(failed.isOk());
    EXPECT_EQ(failed.error().kind, ErrorKind::Backend);
    EXPECT_EQ(failed.error().message, "sector lookup failed");
}

TEST_F(MarketDataToolsTest, InstrumentDetail) {
    auto missing = tools->getInstrumentDetail("600519", false);
    ASSERT_TRUE(missing.isOk());
    EXPECT_EQ(missing.value()["message"], "未找到股票代码 600519 的详细信息");
    // 代码原样传递
    EXPECT_EQ(backend->lastDetailCode, "600519");

    backend->instrumentDetail = nlohmann::json{{"InstrumentName", "贵州茅台"}, {"Ext", {1, 2}}};
    auto found = tools->getInstrumentDetail("600519.SH", true);
    ASSERT_TRUE(found.isOk());
    EXPECT_TRUE(backend->lastFullDetail);
    EXPECT_EQ(found.value()["InstrumentName"], "贵州茅台");
    EXPECT_EQ(found.value()["Ext"], "[1,2]");
}

TEST_F(MarketDataToolsTest, HistoryDoesNotFilterCodes) {
    MarketDataRequest req = MarketDataRequest::fromArguments({
        {"codes", "000001.SZ,BAD"},
        {"start_date", "20240101"},
        {"end_date", "20240131"},
        {"fields", "close"}
    });

    auto result = tools->getHistoryMarketData(req);
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(backend->lastQuery.codes, (std::vector<std::string>{"000001.SZ", "BAD"}));
    EXPECT_EQ(backend->lastQuery.fields, std::vector<std::string>{"close"});
    EXPECT_EQ(backend->lastQuery.startTime, "20240101");
    EXPECT_EQ(backend->lastQuery.endTime, "20240131");
    EXPECT_EQ(backend->lastQuery.count, -1);
    EXPECT_EQ(backend->lastQuery.dividendType, "none");
    EXPECT_TRUE(backend->lastQuery.fillData);
    EXPECT_EQ(result.value()["BAD"]["close"], nlohmann::json({1.0, 2.0}));
}

TEST_F(MarketDataToolsTest, LatestFiltersCodesAndFixesFields) {
    MarketDataRequest req = MarketDataRequest::fromArguments({
        {"codes", "000001.SZ,BAD"},
        {"fields", "amount"}
    });

    auto result = tools->getLatestMarketData(req);
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(backend->lastQuery.codes, std::vector<std::string>{"000001.SZ"});
    EXPECT_EQ(backend->lastQuery.fields, defaultMarketFields());
    EXPECT_EQ(backend->lastQuery.count, 1);
    EXPECT_FALSE(result.value().contains("BAD"));
}

TEST_F(MarketDataToolsTest, LatestRejectsAllMalformedCodes) {
    int callsBefore = backend->backendCalls;
    auto result = tools->getLatestMarketData(MarketDataRequest::fromArguments({{"codes", "BAD,X.Y"}}));
    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().kind, ErrorKind::Validation);
    EXPECT_EQ(result.error().toJson(), nlohmann::json({{"error", "未提供有效的股票代码"}}));
    EXPECT_EQ(backend->backendCalls, callsBefore);
}

TEST_F(MarketDataToolsTest, FullFiltersCodesWithoutCount) {
    auto result = tools->getFullMarketData(MarketDataRequest::fromArguments({{"codes", "600519.SH, 12"}}));
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(backend->lastQuery.codes, std::vector<std::string>{"600519.SH"});
    EXPECT_EQ(backend->lastQuery.fields, defaultMarketFields());
    EXPECT_EQ(backend->lastQuery.count, -1);
}

TEST_F(MarketDataToolsTest, MarketDataFailureMessages) {
    MarketDataRequest req = MarketDataRequest::fromArguments({{"codes", "000001.SZ"}});

    backend->returnNoMarketData = true;
    auto none = tools->getHistoryMarketData(req);
    ASSERT_FALSE(none.isOk());
    EXPECT_EQ(none.error().message, "获取历史行情数据失败");

    backend->returnNoMarketData = false;
    backend->failMarketData = true;
    auto latest = tools->getLatestMarketData(req);
    ASSERT_FALSE(latest.isOk());
    EXPECT_EQ(latest.error().message, "获取最新行情数据失败: bridge timeout");

    auto full = tools->getFullMarketData(req);
    ASSERT_FALSE(full.isOk());
    EXPECT_EQ(full.error().message, "获取历史+最新行情数据失败: bridge timeout");
}

TEST(MarketDataRequestTest, DefaultsAndCodeShape) {
    auto req = MarketDataRequest::fromArguments({{"codes", "000001.SZ"}});
    EXPECT_EQ(req.period, "1d");
    EXPECT_EQ(req.fields, defaultMarketFields());
    EXPECT_TRUE(req.startDate.empty());

    EXPECT_TRUE(looksLikeInstrumentCode("000001.SZ"));
    EXPECT_TRUE(looksLikeInstrumentCode("1234.X"));
    EXPECT_FALSE(looksLikeInstrumentCode("000001"));
    EXPECT_FALSE(looksLikeInstrumentCode("A.B"));
}
