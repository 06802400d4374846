#include "tools/ToolRegistry.h"

namespace {

const char* kCodesDescription = "股票代码列表，用逗号分隔，例如 \"000001.SZ,600519.SH\"";
const char* kPeriodDescription = "周期，例如 \"1d\", \"1m\", \"5m\" 等";

ParamSpec stringParam(const std::string& key, const std::string& description, const std::string& def) {
    return {key, "string", description, false, nlohmann::json(def), false};
}

ParamSpec requiredString(const std::string& key, const std::string& description) {
    return {key, "string", description, true, std::nullopt, false};
}

std::vector<ParamSpec> marketDataRangeParams() {
    return {
        requiredString("codes", kCodesDescription),
        stringParam("period", kPeriodDescription, "1d"),
        stringParam("start_date", "开始日期，格式为 \"YYYYMMDD\"", ""),
        stringParam("end_date", "结束日期，格式为 \"YYYYMMDD\"，为空表示当前日期", ""),
        stringParam("fields", "字段列表，用逗号分隔，为空表示所有字段", "")
    };
}

std::vector<ToolSpec> buildCatalog() {
    std::vector<ToolSpec> tools;

    tools.push_back({"get_trading_dates", "获取指定市场的交易日期列表", {
        stringParam("market", "市场代码，例如 SH 表示上海市场", "SH")
    }});

    tools.push_back({"get_stock_list", "获取指定板块的股票列表", {
        stringParam("sector", "板块名称，例如 沪深A股", "沪深A股")
    }});

    tools.push_back({"get_instrument_detail", "获取指定股票的详细信息", {
        requiredString("code", "股票代码，例如 000001.SZ"),
        {"iscomplete", "boolean", "是否获取全部字段，默认为False", false, nlohmann::json(false), false}
    }});

    tools.push_back({"get_history_market_data", "获取历史行情数据", marketDataRangeParams()});

    tools.push_back({"get_latest_market_data", "获取最新行情数据", {
        requiredString("codes", kCodesDescription),
        stringParam("period", kPeriodDescription, "1d")
    }});

    tools.push_back({"get_full_market_data", "获取历史+最新行情数据", marketDataRangeParams()});

    tools.push_back({"create_chart_panel", "创建图表面板，显示指定股票的技术指标", {
        {"codes", "string", "股票代码列表，用逗号分隔，例如 000001.SZ,600519.SH；为空时取沪深A股前5只", false, std::nullopt, true},
        stringParam("period", "周期，例如 1d, 1m, 5m 等", "1d"),
        stringParam("indicators", "指标名称，例如 ma, macd, kdj 等", "ma"),
        stringParam("params", "指标参数，用逗号分隔，例如 5,10,20", "5,10,20")
    }});

    tools.push_back({"create_custom_layout", "创建自定义布局，可以指定指标名称、参数名和参数值", {
        {"codes", "string", "股票代码列表，用逗号分隔，例如 000001.SZ,600519.SH；为空时取沪深A股前5只", false, std::nullopt, true},
        stringParam("period", "周期，例如 1d, 1m, 5m 等", "1d"),
        stringParam("indicator_name", "指标名称，例如 ma, macd, kdj 等", "ma"),
        stringParam("param_names", "参数名称，用逗号分隔，例如 n1,n2,n3 或 short,long,mid", "n1,n2,n3"),
        stringParam("param_values", "参数值，用逗号分隔，例如 5,10,20", "5,10,20")
    }});

    return tools;
}

} // namespace

const ParamSpec* ToolSpec::findParam(const std::string& key) const {
    for (const auto& p : parameters) {
        if (p.key == key) return &p;
    }
    return nullptr;
}

nlohmann::json ToolSpec::toJson() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    for (const auto& p : parameters) {
        nlohmann::json prop = {
            {"type", p.type},
            {"description", p.description}
        };
        if (p.defaultValue) {
            prop["default"] = *p.defaultValue;
        }
        if (p.autoFilled) {
            prop["x-auto-filled"] = true;
        }
        properties[p.key] = prop;
        if (p.required) {
            required.push_back(p.key);
        }
    }

    nlohmann::json schema = {
        {"type", "object"},
        {"properties", properties}
    };
    if (!required.empty()) {
        schema["required"] = required;
    }

    return {
        {"name", name},
        {"description", description},
        {"inputSchema", schema}
    };
}

const std::vector<ToolSpec>& ToolRegistry::listTools() {
    static const std::vector<ToolSpec> catalog = buildCatalog();
    return catalog;
}

const ToolSpec* ToolRegistry::find(const std::string& name) {
    for (const auto& tool : listTools()) {
        if (tool.name == name) return &tool;
    }
    return nullptr;
}

nlohmann::json ToolRegistry::listToolSchemas() {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : listTools()) {
        tools.push_back(tool.toJson());
    }
    return tools;
}
