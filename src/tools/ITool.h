#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief A tool exposed through `tools/list` and `tools/call`.
 *
 * Tools are thin: they pull their arguments out of the (already schema
 * checked) JSON and forward to one notebook operation. Failures are thrown
 * as GatewayError; turning them into an `isError` result is the
 * dispatcher's job.
 */
class ITool {
public:
    virtual ~ITool() = default;

    /** Unique name, used as the `name` of a tools/call request. */
    virtual std::string getName() const = 0;

    /** Short description shown to the calling agent. */
    virtual std::string getDescription() const = 0;

    /** JSON Schema of the `arguments` object. */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief Run the tool.
     * @param args tool arguments
     * @return MCP content result:
     * {
     *   "content": [
     *     {"type": "text", "text": "..."}
     *   ]
     * }
     */
    virtual nlohmann::json execute(const nlohmann::json& args) = 0;
};
