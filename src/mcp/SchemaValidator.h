#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

class ToolRegistry;

/**
 * @brief A JSON Schema compiled into a checker.
 *
 * Covers the subset the tool schemas use: type (string or list, "integer"
 * included), enum, const, properties/required/additionalProperties, items,
 * minItems/maxItems, minLength/maxLength, pattern and the numeric bounds.
 * Unknown keywords are ignored.
 */
class SchemaValidator {
public:
    struct Violation {
        std::string path;     // dotted, e.g. "cells.0.cell_type"; empty for the root
        std::string message;
    };

    /** Throws INTERNAL_ERROR when the schema itself is malformed. */
    static SchemaValidator compile(const nlohmann::json& schema);

    std::vector<Violation> validate(const nlohmann::json& value) const;

    /** `Invalid parameters for <tool>: path: message, path: message` */
    static std::string describe(const std::string& toolName, const std::vector<Violation>& violations);

private:
    struct Node;
    std::shared_ptr<const Node> root;

    static std::shared_ptr<Node> compileNode(const nlohmann::json& schema, const std::string& where);
    static void check(const Node& node, const nlohmann::json& value, const std::string& path,
                      std::vector<Violation>& out);
};

/**
 * @brief Validators for every registered tool, built once at startup.
 *
 * Immutable after construction; safe to share between request threads.
 */
class ValidatorTable {
public:
    static ValidatorTable build(const ToolRegistry& registry);

    /** nullptr for tools without a schema. */
    const SchemaValidator* find(const std::string& toolName) const;

    /** Throws VALIDATION_ERROR listing every violation. */
    void check(const std::string& toolName, const nlohmann::json& args) const;

    size_t size() const { return validators.size(); }

private:
    std::unordered_map<std::string, SchemaValidator> validators;
};
