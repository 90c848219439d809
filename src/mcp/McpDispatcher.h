#pragma once
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "mcp/SchemaValidator.h"

#ifndef NBGATE_VERSION
#define NBGATE_VERSION "0.1.0"
#endif

class ToolRegistry;

/**
 * @brief HTTP-agnostic answer to one JSON-RPC message.
 *
 * `body` is empty for notifications (answered with 202).
 */
struct DispatchResult {
    int status = 200;
    std::optional<nlohmann::json> body;
};

/**
 * @brief JSON-RPC 2.0 / MCP method routing.
 *
 * Stateless: every message is handled on its own, no session is kept.
 * Anything that goes wrong after the body parsed as JSON comes back as a
 * well-formed envelope; tool failures are tool results with `isError`.
 */
class McpDispatcher {
public:
    static constexpr const char* kServerName = "nbgate";
    static constexpr const char* kProtocolVersion = "2025-03-26";

    explicit McpDispatcher(std::shared_ptr<ToolRegistry> registry);

    /** Parses `body` and handles it; a parse failure gives 400 / -32700. */
    DispatchResult dispatch(const std::string& body) const;

    /** Handles an already parsed message. */
    DispatchResult handleMessage(const nlohmann::json& message) const;

    /**
     * @brief Validate and run one tool.
     * @return `{content: [...]}` on success, `{content: [...], isError: true}` otherwise
     */
    nlohmann::json callTool(const std::string& name, const nlohmann::json& args) const;

    static nlohmann::json createErrorResponse(const nlohmann::json& id, int code, const std::string& message);

private:
    std::shared_ptr<ToolRegistry> registry;
    ValidatorTable validators;

    nlohmann::json handleInitialize(const nlohmann::json& id, const nlohmann::json& params) const;
    nlohmann::json handleListTools(const nlohmann::json& id) const;
    nlohmann::json handleCallTool(const nlohmann::json& id, const nlohmann::json& params) const;
};
