#include "backend/BackendTypes.h"
#include <sstream>

nlohmann::json paramValueToJson(const ParamValue& value) {
    if (const auto* i = std::get_if<long long>(&value)) return *i;
    if (const auto* d = std::get_if<double>(&value)) return *d;
    return std::get<std::string>(value);
}

nlohmann::json IndicatorConfig::toJson() const {
    nlohmann::json params = nlohmann::json::object();
    for (const auto& [name, value] : parameters) {
        params[name] = paramValueToJson(value);
    }
    return {{indicatorName, params}};
}

nlohmann::json PanelDescriptor::toJson() const {
    nlohmann::json figs = nlohmann::json::array();
    for (const auto& fig : figures) {
        figs.push_back(fig.toJson());
    }
    return {
        {"stock", stock},
        {"period", period},
        {"figures", figs}
    };
}

std::string BackendPanel::describe() const {
    std::ostringstream ss;
    ss << typeName << "(stock=" << body.value("stock", "")
       << ", period=" << body.value("period", "")
       << ", figures=" << (body.contains("figures") ? body["figures"].dump() : "[]") << ")";
    return ss.str();
}

const char* capabilityName(Capability capability) {
    switch (capability) {
        case Capability::StartXtdata: return "start_xtdata";
        case Capability::RefreshUi: return "refresh_ui";
        case Capability::ApplyUiPanelControl: return "apply_ui_panel_control";
        case Capability::ApplyPanelControl: return "apply_panel_control";
        case Capability::CreatePanel: return "create_panel";
        case Capability::ShowPanel: return "show_panel";
        case Capability::DisplayPanel: return "display_panel";
    }
    return "unknown";
}

const std::vector<Capability>& allCapabilities() {
    static const std::vector<Capability> all = {
        Capability::StartXtdata,
        Capability::RefreshUi,
        Capability::ApplyUiPanelControl,
        Capability::ApplyPanelControl,
        Capability::CreatePanel,
        Capability::ShowPanel,
        Capability::DisplayPanel
    };
    return all;
}

bool capabilityFromName(const std::string& name, Capability& out) {
    for (Capability c : allCapabilities()) {
        if (name == capabilityName(c)) {
            out = c;
            return true;
        }
    }
    return false;
}
