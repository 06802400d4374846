#pragma once
#include <string>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

struct Config {
    struct Server {
        std::string name = "xtquantai";
        std::string version = "0.1.0";
    } server;

    struct Backend {
        std::string mode = "auto";  // auto | bridge | mock
        std::string bridgeUrl = "http://127.0.0.1:58610";
        int connectTimeout = 3;     // 秒
        int readTimeout = 30;       // 秒
        int maxRetries = 3;
    } backend;

    struct Panel {
        int settleDelayMs = 500;
    } panel;

    struct Logging {
        std::string file = "quantmcp.log";
        bool enableDebug = false;
    } logging;

    static Config defaults() { return Config{}; }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }

        return fromJson(j);
    }

    /**
     * @brief 从 JSON 构造配置,缺失的字段保留默认值
     */
    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be a JSON object");
        }

        try {
            if (j.contains("server")) {
                const auto& s = j.at("server");
                cfg.server.name = s.value("name", cfg.server.name);
                cfg.server.version = s.value("version", cfg.server.version);
            }

            if (j.contains("backend")) {
                const auto& b = j.at("backend");
                cfg.backend.mode = b.value("mode", cfg.backend.mode);
                cfg.backend.bridgeUrl = b.value("bridge_url", cfg.backend.bridgeUrl);
                cfg.backend.connectTimeout = b.value("connect_timeout", cfg.backend.connectTimeout);
                cfg.backend.readTimeout = b.value("read_timeout", cfg.backend.readTimeout);
                cfg.backend.maxRetries = b.value("max_retries", cfg.backend.maxRetries);
            }

            if (j.contains("panel")) {
                cfg.panel.settleDelayMs = j.at("panel").value("settle_delay_ms", cfg.panel.settleDelayMs);
            }

            if (j.contains("logging")) {
                const auto& l = j.at("logging");
                cfg.logging.file = l.value("file", cfg.logging.file);
                cfg.logging.enableDebug = l.value("enable_debug", cfg.logging.enableDebug);
            }
        } catch (const nlohmann::json::type_error& e) {
            throw std::runtime_error(std::string("Invalid config value: ") + e.what());
        }

        if (cfg.backend.mode != "auto" && cfg.backend.mode != "bridge" && cfg.backend.mode != "mock") {
            throw std::runtime_error("Invalid backend.mode: " + cfg.backend.mode);
        }
        if (cfg.backend.maxRetries < 1) cfg.backend.maxRetries = 1;
        if (cfg.panel.settleDelayMs < 0) cfg.panel.settleDelayMs = 0;

        return cfg;
    }
};
