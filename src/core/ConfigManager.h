#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "core/GatewayError.h"
#include "utils/Logger.h"

struct GatewayConfig {
    struct Notebook {
        int maxOutputSize = 2000;     // characters per output item
        int timeoutSeconds = 30;      // execution deadline
    } notebook;

    struct Server {
        std::string host = "127.0.0.1";
        int port = 0;                 // 0 = OS-assigned
        int requestTimeoutSeconds = 600;
        double maxRequestSizeMB = 10;

        size_t maxRequestBytes() const {
            return static_cast<size_t>(maxRequestSizeMB * 1024.0 * 1024.0);
        }
    } server;

    struct Host {
        std::string command;
        int callTimeoutSeconds = 60;
    } host;

    std::vector<std::string> workspaceRoots;

    struct Logging {
        std::string level = "info";
        std::string file = "nbgate.log";
        bool console = true;
    } logging;

    static GatewayConfig load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw Errors::configError("Could not open config file: " + pathStr, {{"configPath", pathStr}});
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw Errors::configError("JSON Parse Error in " + path.string() + ": " + e.what(),
                                      {{"configPath", pathStr}});
        }
        return fromJson(j);
    }

    static GatewayConfig fromJson(const nlohmann::json& j) {
        GatewayConfig cfg;
        if (!j.is_object()) {
            throw Errors::configError("Configuration root must be a JSON object");
        }

        if (j.contains("notebook") && j["notebook"].is_object()) {
            const auto& nb = j["notebook"];
            cfg.notebook.maxOutputSize = static_cast<int>(numeric(nb, "max_output_size", 2000, 100, 50000));
            cfg.notebook.timeoutSeconds = static_cast<int>(numeric(nb, "timeout_seconds", 30, 5, 300));
        }

        if (j.contains("server") && j["server"].is_object()) {
            const auto& s = j["server"];
            cfg.server.host = s.value("host", cfg.server.host);
            cfg.server.port = static_cast<int>(numeric(s, "port", 0, 0, 65535));
            cfg.server.requestTimeoutSeconds = static_cast<int>(numeric(s, "request_timeout_seconds", 600, 30, 3600));
            cfg.server.maxRequestSizeMB = numeric(s, "max_request_size_mb", 10, 1, 100);
        }

        if (j.contains("host") && j["host"].is_object()) {
            const auto& h = j["host"];
            cfg.host.command = h.value("command", "");
            cfg.host.callTimeoutSeconds = static_cast<int>(numeric(h, "call_timeout_seconds", 60, 1, 3600));
        }

        if (j.contains("workspace") && j["workspace"].contains("roots")) {
            cfg.workspaceRoots = j["workspace"]["roots"].get<std::vector<std::string>>();
        }

        if (j.contains("logging") && j["logging"].is_object()) {
            const auto& l = j["logging"];
            cfg.logging.level = l.value("level", cfg.logging.level);
            cfg.logging.file = l.value("file", cfg.logging.file);
            cfg.logging.console = l.value("console", cfg.logging.console);
        }

        return cfg;
    }

    /**
     * Reads `section[key]` as a number. Non-numeric values fall back to the
     * default, out-of-range values are clamped; both cases log a warning.
     */
    static double numeric(const nlohmann::json& section, const std::string& key,
                          double defaultValue, double min, double max) {
        if (!section.contains(key)) return defaultValue;
        const auto& v = section[key];
        if (!v.is_number()) {
            Logger::getInstance().warn("Invalid numeric config value for " + key + ", using default",
                                       {{"key", key}, {"value", v}, {"defaultValue", defaultValue}});
            return defaultValue;
        }
        double value = v.get<double>();
        if (value < min) {
            Logger::getInstance().warn("Config value for " + key + " below minimum, clamping to " + std::to_string(min),
                                       {{"key", key}, {"value", value}, {"min", min}});
            return min;
        }
        if (value > max) {
            Logger::getInstance().warn("Config value for " + key + " above maximum, clamping to " + std::to_string(max),
                                       {{"key", key}, {"value", value}, {"max", max}});
            return max;
        }
        return value;
    }
};
