#pragma once
#include <string>
#include <functional>
#include <mutex>
#include <vector>
#include <nlohmann/json.hpp>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx);
        minLevel = level;
    }

    /**
     * @brief Parse "debug" | "info" | "warn" | "error" (case-insensitive).
     * Unknown names map to INFO.
     */
    static LogLevel parseLevel(const std::string& name);

    void setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx);
        logFilePath = path;
    }

    void setConsoleEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        consoleEnabled = enabled;
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (level < minLevel) return;
        writeRecord(level, message);

        if (callback) {
            callback(level, message);
        }
    }

    void log(LogLevel level, const std::string& message, const nlohmann::json& context) {
        if (context.is_null() || context.empty()) {
            log(level, message);
        } else {
            // invalid UTF-8 (e.g. echoed from a parse error) is replaced, never thrown
            log(level, message + " " + context.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        }
    }

    // Convenience methods
    void debug(const std::string& m, const nlohmann::json& ctx = nullptr) { log(LogLevel::DEBUG, m, ctx); }
    void info(const std::string& m, const nlohmann::json& ctx = nullptr) { log(LogLevel::INFO, m, ctx); }
    void warn(const std::string& m, const nlohmann::json& ctx = nullptr) { log(LogLevel::WARNING, m, ctx); }
    void error(const std::string& m, const nlohmann::json& ctx = nullptr) { log(LogLevel::ERROR, m, ctx); }

    void operationStart(const std::string& op, const nlohmann::json& ctx = nullptr) {
        debug("Starting operation: " + op, ctx);
    }
    void operationSuccess(const std::string& op, const nlohmann::json& ctx = nullptr) {
        debug("Operation completed successfully: " + op, ctx);
    }
    void operationFailure(const std::string& op, const std::string& what, const nlohmann::json& ctx = nullptr) {
        error("Operation failed: " + op + "\nError: " + what, ctx);
    }

private:
    Logger() = default;
    LogCallback callback;
    std::mutex mtx;
    LogLevel minLevel = LogLevel::INFO;
    std::string logFilePath = "nbgate.log";
    bool consoleEnabled = true;

    void writeRecord(LogLevel level, const std::string& message);
};
