#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "core/GatewayError.h"
#include "mcp/McpDispatcher.h"
#include "mcp/RequestServer.h"
#include "notebook/NotebookService.h"
#include "notebook/StdioNotebookHost.h"
#include "tools/NotebookTools.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string RED = "\033[38;5;196m";
const std::string GREEN = "\033[38;5;46m";
const std::string CYAN = "\033[38;5;51m";
const std::string GRAY = "\033[38;5;242m";

namespace {
std::atomic<bool> g_stopRequested{false};

void onSignal(int) {
    g_stopRequested = true;
}

void configureLogger(const GatewayConfig& cfg) {
    Logger& logger = Logger::getInstance();
    logger.setLevel(Logger::parseLevel(cfg.logging.level));
    logger.setLogFile(cfg.logging.file);
    logger.setConsoleEnabled(cfg.logging.console);
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [config_path]\n"
              << "  config_path  JSON configuration file (default: nbgate.json)\n";
}

void printClientConfig(const std::string& endpoint) {
    nlohmann::json snippet = {
        {"mcpServers", {
            {"nbgate", {
                {"type", "http"},
                {"url", endpoint}
            }}
        }}
    };
    std::cout << GRAY << "  MCP client configuration:" << RESET << "\n" << snippet.dump(2) << std::endl;
}
} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "nbgate.json";
    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        configPath = arg;
    }

    // writes to a dead host child or a closed client socket must not kill us
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    try {
        GatewayConfig cfg = GatewayConfig::load(configPath);
        configureLogger(cfg);

        if (cfg.host.command.empty()) {
            throw Errors::configError("host.command is required", {{"configPath", configPath}});
        }

        auto host = std::make_shared<StdioNotebookHost>(cfg.host.command,
                                                        std::chrono::seconds(cfg.host.callTimeoutSeconds));
        host->start();

        NotebookService::Settings settings;
        settings.maxOutputSize = cfg.notebook.maxOutputSize;
        settings.timeoutSeconds = cfg.notebook.timeoutSeconds;
        settings.workspaceRoots = cfg.workspaceRoots;
        auto service = std::make_shared<NotebookService>(host, settings);

        auto registry = std::make_shared<ToolRegistry>();
        registerNotebookTools(*registry, service);
        auto dispatcher = std::make_shared<McpDispatcher>(registry);

        RequestServer::Options options;
        options.host = cfg.server.host;
        options.port = cfg.server.port;
        options.requestTimeout = std::chrono::seconds(cfg.server.requestTimeoutSeconds);
        options.maxRequestBytes = cfg.server.maxRequestBytes();
        RequestServer server(dispatcher, options);

        std::unique_ptr<ServerHandle> handle = server.start();

        std::cout << GREEN << BOLD << "  nbgate " << NBGATE_VERSION << RESET << " listening on "
                  << CYAN << handle->endpoint() << RESET << std::endl;
        printClientConfig(handle->endpoint());

        while (!g_stopRequested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        Logger::getInstance().info("Shutdown requested");
        // closing the host first makes dispatch workers fail fast, so the
        // server stop below can drain them within its bound
        host->stop();
        RequestServer::stop(std::move(handle));
        return 0;
    } catch (const GatewayError& e) {
        Logger::getInstance().error("FATAL ERROR: " + std::string(e.what()), e.context());
        std::cerr << "\n" << RED << BOLD << "█ FATAL ERROR: " << RESET << e.forAgent() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        Logger::getInstance().error("FATAL ERROR: " + std::string(e.what()));
        std::cerr << "\n" << RED << BOLD << "█ FATAL ERROR: " << RESET << e.what() << std::endl;
        return 1;
    }
}
