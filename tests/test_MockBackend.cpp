#include <gtest/gtest.h>
#include "backend/MockBackend.h"
#include "FakeBackend.h"

class MockBackendTest : public ::testing::Test {
protected:
    void SetUp() override { silenceLogger(); }

    MockBackend backend;
};

TEST_F(MockBackendTest, SampleData) {
    auto dates = backend.getTradingDates("SH");
    ASSERT_EQ(dates.size(), 3u);
    EXPECT_EQ(std::get<std::string>(dates.front()), "2023-01-01");
    EXPECT_EQ(std::get<std::string>(dates.back()), "2023-01-03");

    auto stocks = backend.getStockListInSector("沪深A股");
    EXPECT_EQ(stocks, (std::vector<std::string>{"000001.SZ", "600519.SH", "300059.SZ"}));

    auto detail = backend.getInstrumentDetail("600519.SH", false);
    ASSERT_TRUE(detail.has_value());
    EXPECT_EQ((*detail)["code"], "600519.SH");
    EXPECT_EQ((*detail)["name"], "模拟股票");
    EXPECT_EQ((*detail)["price"], 100.0);
}

TEST_F(MockBackendTest, MarketDataSeries) {
    MarketDataQuery query;
    query.codes = {"000001.SZ"};
    query.fields = {"close", "volume", "amount"};

    auto frame = backend.getMarketData(query);
    ASSERT_TRUE(frame.has_value());
    const auto& series = frame->at("000001.SZ");
    EXPECT_EQ(series.at("close"), nlohmann::json({100.0, 101.0, 102.0}));
    EXPECT_EQ(series.at("volume"), nlohmann::json({10000, 12000, 15000}));
    EXPECT_EQ(series.at("amount"), nlohmann::json({0.0, 0.0, 0.0}));
}

TEST_F(MockBackendTest, OnlyPrimaryPanelCapability) {
    EXPECT_TRUE(backend.supports(Capability::ApplyUiPanelControl));
    EXPECT_FALSE(backend.supports(Capability::StartXtdata));
    EXPECT_FALSE(backend.supports(Capability::RefreshUi));
    EXPECT_EQ(backend.listCapabilities(), std::vector<std::string>{"apply_ui_panel_control"});

    EXPECT_EQ(backend.invokePanelMethod(Capability::ApplyUiPanelControl, {}), true);
    EXPECT_THROW(backend.invokePanelMethod(Capability::ShowPanel, {}), BackendError);
    EXPECT_THROW(backend.refreshUi(), BackendError);
}
