#include "mcp/SchemaValidator.h"
#include "core/GatewayError.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"
#include "utils/Utf8.h"
#include <algorithm>
#include <cmath>
#include <optional>
#include <regex>

struct SchemaValidator::Node {
    std::vector<std::string> types;              // empty = any
    std::optional<nlohmann::json> enumValues;
    std::optional<nlohmann::json> constValue;

    std::vector<std::pair<std::string, std::shared_ptr<Node>>> properties;
    std::vector<std::string> required;
    bool additionalAllowed = true;
    std::shared_ptr<Node> items;

    std::optional<size_t> minItems, maxItems;
    std::optional<size_t> minLength, maxLength;
    std::optional<std::regex> pattern;
    std::string patternSource;

    std::optional<double> minimum, maximum;
    std::optional<double> exclusiveMinimum, exclusiveMaximum;
};

namespace {
const std::vector<std::string> kKnownTypes = {"object", "array", "string", "integer", "number", "boolean", "null"};

std::string typeOf(const nlohmann::json& v) {
    switch (v.type()) {
        case nlohmann::json::value_t::object: return "object";
        case nlohmann::json::value_t::array: return "array";
        case nlohmann::json::value_t::string: return "string";
        case nlohmann::json::value_t::boolean: return "boolean";
        case nlohmann::json::value_t::null: return "null";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return "integer";
        case nlohmann::json::value_t::number_float: return "number";
        default: return "unknown";
    }
}

bool matchesType(const std::string& type, const nlohmann::json& v) {
    if (type == "integer") {
        if (v.is_number_integer()) return true;
        if (v.is_number_float()) {
            double d = v.get<double>();
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    if (type == "number") return v.is_number();
    return typeOf(v) == type;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::string childPath(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

std::string formatNumber(double d) {
    if (std::floor(d) == d && std::fabs(d) < 1e15) {
        return std::to_string(static_cast<long long>(d));
    }
    return std::to_string(d);
}

std::optional<size_t> sizeKeyword(const nlohmann::json& schema, const char* key, const std::string& where) {
    if (!schema.contains(key)) return std::nullopt;
    const auto& v = schema[key];
    if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<long long>() >= 0)) {
        throw GatewayError(std::string("Schema keyword '") + key + "' must be a non-negative integer",
                           ErrorCode::INTERNAL_ERROR, {{"schemaPath", where}});
    }
    return v.get<size_t>();
}

std::optional<double> numberKeyword(const nlohmann::json& schema, const char* key, const std::string& where) {
    if (!schema.contains(key)) return std::nullopt;
    const auto& v = schema[key];
    if (!v.is_number()) {
        throw GatewayError(std::string("Schema keyword '") + key + "' must be a number",
                           ErrorCode::INTERNAL_ERROR, {{"schemaPath", where}});
    }
    return v.get<double>();
}
} // namespace

// ============================================================================
// Compilation
// ============================================================================

SchemaValidator SchemaValidator::compile(const nlohmann::json& schema) {
    SchemaValidator validator;
    validator.root = compileNode(schema, "#");
    return validator;
}

std::shared_ptr<SchemaValidator::Node> SchemaValidator::compileNode(const nlohmann::json& schema,
                                                                    const std::string& where) {
    if (!schema.is_object()) {
        throw GatewayError("Schema must be an object", ErrorCode::INTERNAL_ERROR, {{"schemaPath", where}});
    }
    auto node = std::make_shared<Node>();

    if (schema.contains("type")) {
        const auto& t = schema["type"];
        if (t.is_string()) {
            node->types.push_back(t.get<std::string>());
        } else if (t.is_array()) {
            for (const auto& each : t) node->types.push_back(each.get<std::string>());
        } else {
            throw GatewayError("Schema 'type' must be a string or an array", ErrorCode::INTERNAL_ERROR,
                               {{"schemaPath", where}});
        }
        for (const auto& type : node->types) {
            if (std::find(kKnownTypes.begin(), kKnownTypes.end(), type) == kKnownTypes.end()) {
                throw GatewayError("Unknown schema type: " + type, ErrorCode::INTERNAL_ERROR, {{"schemaPath", where}});
            }
        }
    }

    if (schema.contains("enum")) {
        if (!schema["enum"].is_array() || schema["enum"].empty()) {
            throw GatewayError("Schema 'enum' must be a non-empty array", ErrorCode::INTERNAL_ERROR,
                               {{"schemaPath", where}});
        }
        node->enumValues = schema["enum"];
    }
    if (schema.contains("const")) {
        node->constValue = schema["const"];
    }

    if (schema.contains("properties")) {
        for (auto it = schema["properties"].begin(); it != schema["properties"].end(); ++it) {
            node->properties.emplace_back(it.key(), compileNode(it.value(), where + "/properties/" + it.key()));
        }
    }
    if (schema.contains("required")) {
        node->required = schema["required"].get<std::vector<std::string>>();
    }
    if (schema.contains("additionalProperties") && schema["additionalProperties"].is_boolean()) {
        node->additionalAllowed = schema["additionalProperties"].get<bool>();
    }
    if (schema.contains("items")) {
        node->items = compileNode(schema["items"], where + "/items");
    }

    node->minItems = sizeKeyword(schema, "minItems", where);
    node->maxItems = sizeKeyword(schema, "maxItems", where);
    node->minLength = sizeKeyword(schema, "minLength", where);
    node->maxLength = sizeKeyword(schema, "maxLength", where);

    if (schema.contains("pattern")) {
        node->patternSource = schema["pattern"].get<std::string>();
        try {
            node->pattern = std::regex(node->patternSource, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw GatewayError("Invalid schema pattern: " + node->patternSource, ErrorCode::INTERNAL_ERROR,
                               {{"schemaPath", where}, {"reason", e.what()}});
        }
    }

    node->minimum = numberKeyword(schema, "minimum", where);
    node->maximum = numberKeyword(schema, "maximum", where);
    node->exclusiveMinimum = numberKeyword(schema, "exclusiveMinimum", where);
    node->exclusiveMaximum = numberKeyword(schema, "exclusiveMaximum", where);

    return node;
}

// ============================================================================
// Validation
// ============================================================================

std::vector<SchemaValidator::Violation> SchemaValidator::validate(const nlohmann::json& value) const {
    std::vector<Violation> out;
    if (root) check(*root, value, "", out);
    return out;
}

void SchemaValidator::check(const Node& node, const nlohmann::json& value, const std::string& path,
                            std::vector<Violation>& out) {
    if (!node.types.empty()) {
        bool ok = std::any_of(node.types.begin(), node.types.end(),
                              [&](const std::string& t) { return matchesType(t, value); });
        if (!ok) {
            out.push_back({path, "Expected " + join(node.types, " | ") + ", received " + typeOf(value)});
            return;  // further keywords would only repeat the same problem
        }
    }

    if (node.enumValues) {
        bool ok = std::any_of(node.enumValues->begin(), node.enumValues->end(),
                              [&](const nlohmann::json& e) { return e == value; });
        if (!ok) {
            std::vector<std::string> options;
            for (const auto& e : *node.enumValues) options.push_back(e.is_string() ? e.get<std::string>() : e.dump());
            out.push_back({path, "Invalid enum value. Expected one of: " + join(options, ", ")});
        }
    }
    if (node.constValue && *node.constValue != value) {
        out.push_back({path, "Expected constant " + node.constValue->dump()});
    }

    if (value.is_object()) {
        for (const auto& key : node.required) {
            if (!value.contains(key)) {
                out.push_back({childPath(path, key), "Required"});
            }
        }
        for (const auto& [key, child] : node.properties) {
            if (value.contains(key)) {
                check(*child, value[key], childPath(path, key), out);
            }
        }
        if (!node.additionalAllowed) {
            for (auto it = value.begin(); it != value.end(); ++it) {
                bool declared = std::any_of(node.properties.begin(), node.properties.end(),
                                            [&](const auto& p) { return p.first == it.key(); });
                if (!declared) {
                    out.push_back({path, "Unrecognized key: '" + it.key() + "'"});
                }
            }
        }
    }

    if (value.is_array()) {
        if (node.minItems && value.size() < *node.minItems) {
            out.push_back({path, "Array must contain at least " + std::to_string(*node.minItems) + " element(s)"});
        }
        if (node.maxItems && value.size() > *node.maxItems) {
            out.push_back({path, "Array must contain at most " + std::to_string(*node.maxItems) + " element(s)"});
        }
        if (node.items) {
            for (size_t i = 0; i < value.size(); ++i) {
                check(*node.items, value[i], childPath(path, std::to_string(i)), out);
            }
        }
    }

    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        size_t length = UTF8Utils::codepointCount(s);
        if (node.minLength && length < *node.minLength) {
            out.push_back({path, "String must contain at least " + std::to_string(*node.minLength) + " character(s)"});
        }
        if (node.maxLength && length > *node.maxLength) {
            out.push_back({path, "String must contain at most " + std::to_string(*node.maxLength) + " character(s)"});
        }
        if (node.pattern && !std::regex_search(s, *node.pattern)) {
            out.push_back({path, "String must match pattern " + node.patternSource});
        }
    }

    if (value.is_number()) {
        double d = value.get<double>();
        if (node.minimum && d < *node.minimum) {
            out.push_back({path, "Number must be greater than or equal to " + formatNumber(*node.minimum)});
        }
        if (node.maximum && d > *node.maximum) {
            out.push_back({path, "Number must be less than or equal to " + formatNumber(*node.maximum)});
        }
        if (node.exclusiveMinimum && d <= *node.exclusiveMinimum) {
            out.push_back({path, "Number must be greater than " + formatNumber(*node.exclusiveMinimum)});
        }
        if (node.exclusiveMaximum && d >= *node.exclusiveMaximum) {
            out.push_back({path, "Number must be less than " + formatNumber(*node.exclusiveMaximum)});
        }
    }
}

std::string SchemaValidator::describe(const std::string& toolName, const std::vector<Violation>& violations) {
    std::vector<std::string> parts;
    for (const auto& v : violations) {
        parts.push_back(v.path.empty() ? v.message : v.path + ": " + v.message);
    }
    return "Invalid parameters for " + toolName + ": " + join(parts, ", ");
}

// ============================================================================
// ValidatorTable
// ============================================================================

ValidatorTable ValidatorTable::build(const ToolRegistry& registry) {
    ValidatorTable table;
    for (const auto& tool : registry.all()) {
        nlohmann::json schema = tool->getSchema();
        if (schema.is_null()) continue;
        table.validators.emplace(tool->getName(), SchemaValidator::compile(schema));
        Logger::getInstance().debug("Compiled parameter schema", {{"toolName", tool->getName()}});
    }
    return table;
}

const SchemaValidator* ValidatorTable::find(const std::string& toolName) const {
    auto it = validators.find(toolName);
    return it == validators.end() ? nullptr : &it->second;
}

void ValidatorTable::check(const std::string& toolName, const nlohmann::json& args) const {
    const SchemaValidator* validator = find(toolName);
    if (!validator) return;

    auto violations = validator->validate(args);
    if (!violations.empty()) {
        throw Errors::validationError(SchemaValidator::describe(toolName, violations), {{"toolName", toolName}});
    }
}
