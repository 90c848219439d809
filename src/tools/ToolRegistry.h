#pragma once
#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief Owns the tools and keeps them in registration order.
 *
 * The registry is filled once at startup and is read-only afterwards, so
 * lookups need no locking.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /**
     * @brief Register a tool. A second tool with the same name replaces the
     * first one in place (keeping its position).
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /** nullptr when no tool has that name. */
    ITool* getTool(const std::string& name) const;

    /**
     * @brief Tool declarations for `tools/list`, in registration order.
     *
     * [
     *   {"name": "...", "description": "...", "inputSchema": { JSON Schema }}
     * ]
     */
    std::vector<nlohmann::json> listToolSchemas() const;

    /** Throws MCP_TOOL_ERROR `Unknown tool: <name>` for unregistered names. */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args);

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

    const std::vector<std::unique_ptr<ITool>>& all() const { return tools; }

private:
    std::vector<std::unique_ptr<ITool>> tools;
    std::unordered_map<std::string, size_t> byName;
};
