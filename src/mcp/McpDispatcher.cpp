#include "mcp/McpDispatcher.h"
#include "core/GatewayError.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"
#include <algorithm>
#include <vector>

using json = nlohmann::json;

namespace {
const std::vector<std::string> kSupportedProtocolVersions = {"2025-06-18", "2025-03-26", "2024-11-05"};

json successResponse(const json& id, json result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json errorResult(const std::string& text) {
    return {
        {"content", json::array({{{"type", "text"}, {"text", text}}})},
        {"isError", true}
    };
}
} // namespace

McpDispatcher::McpDispatcher(std::shared_ptr<ToolRegistry> registry)
    : registry(std::move(registry)), validators(ValidatorTable::build(*this->registry)) {
    Logger::getInstance().debug("Dispatcher ready",
                                {{"tools", this->registry->getToolCount()}, {"validators", validators.size()}});
}

json McpDispatcher::createErrorResponse(const json& id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

DispatchResult McpDispatcher::dispatch(const std::string& body) const {
    json message;
    try {
        message = json::parse(body);
    } catch (const json::parse_error& e) {
        Logger::getInstance().warn("Rejected request body that is not JSON", {{"reason", e.what()}});
        return {400, createErrorResponse(nullptr, -32700, "Parse error")};
    }
    return handleMessage(message);
}

DispatchResult McpDispatcher::handleMessage(const json& message) const {
    if (!message.is_object()) {
        // batches included: they are not supported
        return {400, createErrorResponse(nullptr, -32600, "Invalid Request")};
    }

    json id = message.contains("id") ? message["id"] : json(nullptr);
    if (!id.is_null() && !id.is_string() && !id.is_number_integer() && !id.is_number_unsigned()) {
        return {400, createErrorResponse(nullptr, -32600, "Invalid Request - id must be a string or an integer")};
    }
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        return {400, createErrorResponse(id, -32600, "Invalid Request - missing or invalid jsonrpc")};
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        return {400, createErrorResponse(id, -32600, "Invalid Request - missing method")};
    }

    std::string method = message["method"].get<std::string>();
    json params = message.contains("params") ? message["params"] : json::object();

    if (!message.contains("id")) {
        Logger::getInstance().debug("Notification received", {{"method", method}});
        return {202, std::nullopt};
    }

    if (method == "initialize") {
        return {200, handleInitialize(id, params)};
    }
    if (method == "ping") {
        return {200, successResponse(id, json::object())};
    }
    if (method == "tools/list") {
        return {200, handleListTools(id)};
    }
    if (method == "tools/call") {
        return {200, handleCallTool(id, params)};
    }

    Logger::getInstance().warn("Unknown JSON-RPC method", {{"method", method}});
    return {200, createErrorResponse(id, -32601, "Method not found: " + method)};
}

json McpDispatcher::handleInitialize(const json& id, const json& params) const {
    std::string version = kProtocolVersion;
    if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        std::string requested = params["protocolVersion"].get<std::string>();
        if (std::find(kSupportedProtocolVersions.begin(), kSupportedProtocolVersions.end(), requested) !=
            kSupportedProtocolVersions.end()) {
            version = requested;
        }
    }

    Logger::getInstance().info("Client initialized", {{"protocolVersion", version}});
    return successResponse(id, {
        {"protocolVersion", version},
        {"capabilities", {{"tools", json::object()}}},
        {"serverInfo", {{"name", kServerName}, {"version", NBGATE_VERSION}}}
    });
}

json McpDispatcher::handleListTools(const json& id) const {
    json tools = json::array();
    for (auto& schema : registry->listToolSchemas()) {
        tools.push_back(std::move(schema));
    }
    return successResponse(id, {{"tools", tools}});
}

json McpDispatcher::handleCallTool(const json& id, const json& params) const {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return createErrorResponse(id, -32602, "Invalid params - missing tool name");
    }

    std::string name = params["name"].get<std::string>();
    json args = params.contains("arguments") ? params["arguments"] : json::object();
    if (args.is_null()) args = json::object();

    return successResponse(id, callTool(name, args));
}

json McpDispatcher::callTool(const std::string& name, const json& args) const {
    auto& logger = Logger::getInstance();
    logger.operationStart(name, {{"arguments", args}});

    try {
        if (!registry->hasTool(name)) {
            throw Errors::toolError(name, "Unknown tool: " + name);
        }
        validators.check(name, args);

        json result = registry->executeTool(name, args);
        logger.operationSuccess(name);
        return result;
    } catch (const GatewayError& e) {
        logger.operationFailure(name, e.what(), e.context());
        return errorResult(e.forAgent());
    } catch (const std::exception& e) {
        GatewayError wrapped = Errors::wrap(e, ErrorCode::INTERNAL_ERROR, {{"toolName", name}});
        logger.operationFailure(name, e.what(), wrapped.context());
        return errorResult(wrapped.forAgent());
    }
}
