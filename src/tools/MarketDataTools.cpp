#include "tools/MarketDataTools.h"
#include "tools/ResultNormalizer.h"
#include "tools/ToolArguments.h"
#include "utils/Logger.h"

MarketDataRequest MarketDataRequest::fromArguments(const nlohmann::json& args) {
    MarketDataRequest req;
    req.codes = ToolArguments::splitCsv(ToolArguments::getString(args, "codes"));
    req.period = ToolArguments::getString(args, "period", "1d");
    req.startDate = ToolArguments::getString(args, "start_date");
    req.endDate = ToolArguments::getString(args, "end_date");
    req.fields = ToolArguments::splitCsv(ToolArguments::getString(args, "fields"));
    if (req.fields.empty()) {
        req.fields = defaultMarketFields();
    }
    return req;
}

const std::vector<std::string>& defaultMarketFields() {
    static const std::vector<std::string> fields = {"open", "high", "low", "close", "volume"};
    return fields;
}

bool looksLikeInstrumentCode(const std::string& code) {
    return code.find('.') != std::string::npos && code.size() >= 6;
}

MarketDataTools::MarketDataTools(ServiceLifecycle& lifecycle) : lifecycle(lifecycle) {}

IBackend& MarketDataTools::backend() {
    lifecycle.ensureReady();
    return lifecycle.backend();
}

Result<nlohmann::json> MarketDataTools::getTradingDates(const std::string& market) {
    auto& log = Logger::getInstance();
    try {
        log.info("调用xtdata.get_trading_dates(" + market + ")");
        auto dates = backend().getTradingDates(market);
        if (dates.empty()) {
            return Result<nlohmann::json>::ok(nlohmann::json::array({"未找到交易日期数据"}));
        }

        size_t begin = dates.size() > kMaxTradingDates ? dates.size() - kMaxTradingDates : 0;
        nlohmann::json formatted = nlohmann::json::array();
        for (size_t i = begin; i < dates.size(); ++i) {
            formatted.push_back(ResultNormalizer::formatTradingDate(dates[i]));
        }
        return Result<nlohmann::json>::ok(formatted);
    } catch (const std::exception& e) {
        log.error(std::string("获取交易日期出错: ") + e.what());
        return Result<nlohmann::json>::fail(ErrorKind::Backend, e.what());
    }
}

Result<std::vector<std::string>> MarketDataTools::listStocks(const std::string& sector) {
    auto& log = Logger::getInstance();
    try {
        log.info("调用xtdata.get_stock_list_in_sector(" + sector + ")");
        auto stocks = backend().getStockListInSector(sector);
        if (stocks.size() > kMaxStocks) {
            stocks.resize(kMaxStocks);
        }
        return Result<std::vector<std::string>>::ok(std::move(stocks));
    } catch (const std::exception& e) {
        log.error(std::string("获取股票列表出错: ") + e.what());
        return Result<std::vector<std::string>>::fail(ErrorKind::Backend, e.what());
    }
}

Result<nlohmann::json> MarketDataTools::getStockList(const std::string& sector) {
    auto stocks = listStocks(sector);
    if (!stocks) {
        return Result<nlohmann::json>::fail(stocks.error());
    }
    if (stocks.value().empty()) {
        return Result<nlohmann::json>::ok(nlohmann::json::array({"未找到板块 " + sector + " 的股票列表"}));
    }
    return Result<nlohmann::json>::ok(stocks.value());
}

Result<nlohmann::json> MarketDataTools::getInstrumentDetail(const std::string& code, bool fullDetail) {
    auto& log = Logger::getInstance();
    try {
        log.info("调用xtdata.get_instrument_detail(" + code + ", " + (fullDetail ? "True" : "False") + ")");
        // 代码原样传递,不补全交易所后缀
        auto detail = backend().getInstrumentDetail(code, fullDetail);
        if (!detail) {
            return Result<nlohmann::json>::ok({{"message", "未找到股票代码 " + code + " 的详细信息"}});
        }
        return Result<nlohmann::json>::ok(ResultNormalizer::normalizeInstrumentDetail(*detail));
    } catch (const std::exception& e) {
        log.error(std::string("获取股票详情出错: ") + e.what());
        return Result<nlohmann::json>::fail(ErrorKind::Backend, e.what());
    }
}

Result<nlohmann::json> MarketDataTools::queryMarketData(const MarketDataQuery& query, const std::string& label) {
    auto& log = Logger::getInstance();
    try {
        log.info("获取" + label + ": 股票=[" + ToolArguments::join(query.codes) + "], 周期=" + query.period +
                 ", 字段=[" + ToolArguments::join(query.fields) + "], 开始日期=" + query.startTime +
                 ", 结束日期=" + query.endTime + ", count=" + std::to_string(query.count));
        auto data = backend().getMarketData(query);
        if (!data) {
            return Result<nlohmann::json>::fail(ErrorKind::Backend, "获取" + label + "失败");
        }
        return Result<nlohmann::json>::ok(ResultNormalizer::normalizeMarketData(*data));
    } catch (const std::exception& e) {
        log.error("获取" + label + "出错: " + e.what());
        return Result<nlohmann::json>::fail(ErrorKind::Backend, "获取" + label + "失败: " + e.what());
    }
}

Result<nlohmann::json> MarketDataTools::getHistoryMarketData(const MarketDataRequest& request) {
    lifecycle.ensureReady();
    if (request.codes.empty()) {
        return Result<nlohmann::json>::fail(ErrorKind::Validation, "未提供有效的股票代码");
    }

    // TODO: 与 latest/full 统一代码形态过滤,需先确认调用方不依赖无后缀代码
    MarketDataQuery query;
    query.fields = request.fields.empty() ? defaultMarketFields() : request.fields;
    query.codes = request.codes;
    query.period = request.period;
    query.startTime = request.startDate;
    query.endTime = request.endDate;
    return queryMarketData(query, "历史行情数据");
}

Result<nlohmann::json> MarketDataTools::getLatestMarketData(const MarketDataRequest& request) {
    lifecycle.ensureReady();
    std::vector<std::string> validCodes;
    for (const auto& code : request.codes) {
        if (looksLikeInstrumentCode(code)) validCodes.push_back(code);
    }
    if (validCodes.empty()) {
        return Result<nlohmann::json>::fail(ErrorKind::Validation, "未提供有效的股票代码");
    }

    MarketDataQuery query;
    query.fields = defaultMarketFields();
    query.codes = validCodes;
    query.period = request.period;
    query.count = 1;
    return queryMarketData(query, "最新行情数据");
}

Result<nlohmann::json> MarketDataTools::getFullMarketData(const MarketDataRequest& request) {
    lifecycle.ensureReady();
    std::vector<std::string> validCodes;
    for (const auto& code : request.codes) {
        if (looksLikeInstrumentCode(code)) validCodes.push_back(code);
    }
    if (validCodes.empty()) {
        return Result<nlohmann::json>::fail(ErrorKind::Validation, "未提供有效的股票代码");
    }

    MarketDataQuery query;
    query.fields = request.fields.empty() ? defaultMarketFields() : request.fields;
    query.codes = validCodes;
    query.period = request.period;
    query.startTime = request.startDate;
    query.endTime = request.endDate;
    query.count = -1;
    return queryMarketData(query, "历史+最新行情数据");
}
