#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "backend/BackendTypes.h"
#include "utils/Result.h"

/**
 * @brief 行情/面板后端接口
 *
 * 必选操作由所有实现提供; 可选操作通过 supports() 协商,
 * 未声明支持的能力调用时抛出 BackendError。
 * 所有操作失败时抛出异常,由处理器边界捕获。
 */
class IBackend {
public:
    virtual ~IBackend() = default;

    /**
     * @brief 后端类型名,用于诊断信息
     */
    virtual std::string getName() const = 0;

    virtual std::vector<DateLike> getTradingDates(const std::string& market) = 0;

    virtual std::vector<std::string> getStockListInSector(const std::string& sector) = 0;

    /**
     * @brief 获取合约详情
     * @return 字段映射; 后端没有该代码时返回 std::nullopt
     */
    virtual std::optional<nlohmann::json> getInstrumentDetail(const std::string& code, bool fullDetail) = 0;

    /**
     * @brief 获取行情数据
     * @return code -> field -> 序列; 后端无结果时返回 std::nullopt
     */
    virtual std::optional<MarketDataFrame> getMarketData(const MarketDataQuery& query) = 0;

    virtual bool supports(Capability capability) const { (void)capability; return false; }

    /**
     * @brief 构造后端偏好的面板对象,失败时抛出
     */
    virtual BackendPanel createPanel(const PanelDescriptor& descriptor) {
        return {"UIPanel", descriptor.toJson()};
    }

    virtual void start() {
        throw BackendError(std::string(capabilityName(Capability::StartXtdata)) + " is not supported by " + getName());
    }

    virtual void refreshUi() {
        throw BackendError(std::string(capabilityName(Capability::RefreshUi)) + " is not supported by " + getName());
    }

    /**
     * @brief 调用一个面板控制方法
     * @param method 面板类能力 (ApplyUiPanelControl 或其候补)
     * @return 后端返回值
     */
    virtual nlohmann::json invokePanelMethod(Capability method, const std::vector<BackendPanel>& panels) {
        (void)panels;
        throw BackendError(std::string(capabilityName(method)) + " is not supported by " + getName());
    }

    /**
     * @brief 已声明支持的可选能力名称列表
     */
    std::vector<std::string> listCapabilities() const {
        std::vector<std::string> names;
        for (Capability c : allCapabilities()) {
            if (supports(c)) names.push_back(capabilityName(c));
        }
        return names;
    }
};
