#include "ToolRegistry.h"
#include "core/GatewayError.h"
#include "utils/Logger.h"

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return;

    std::string name = tool->getName();
    auto it = byName.find(name);
    if (it != byName.end()) {
        Logger::getInstance().warn("Tool registered twice, replacing previous definition", {{"toolName", name}});
        tools[it->second] = std::move(tool);
        return;
    }

    byName[name] = tools.size();
    tools.push_back(std::move(tool));
}

ITool* ToolRegistry::getTool(const std::string& name) const {
    auto it = byName.find(name);
    if (it == byName.end()) {
        return nullptr;
    }
    return tools[it->second].get();
}

std::vector<nlohmann::json> ToolRegistry::listToolSchemas() const {
    std::vector<nlohmann::json> schemas;
    schemas.reserve(tools.size());

    for (const auto& tool : tools) {
        nlohmann::json schema;
        schema["name"] = tool->getName();
        schema["description"] = tool->getDescription();
        schema["inputSchema"] = tool->getSchema();
        schemas.push_back(schema);
    }

    return schemas;
}

nlohmann::json ToolRegistry::executeTool(const std::string& name, const nlohmann::json& args) {
    ITool* tool = getTool(name);
    if (!tool) {
        throw Errors::toolError(name, "Unknown tool: " + name);
    }
    return tool->execute(args);
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return byName.count(name) > 0;
}
