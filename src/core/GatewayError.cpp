#include "core/GatewayError.h"

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALIDATION_ERROR: return "VALIDATION_ERROR";
        case ErrorCode::SCHEMA_VALIDATION_FAILED: return "SCHEMA_VALIDATION_FAILED";
        case ErrorCode::NO_ACTIVE_NOTEBOOK: return "NO_ACTIVE_NOTEBOOK";
        case ErrorCode::INDEX_OUT_OF_BOUNDS: return "INDEX_OUT_OF_BOUNDS";
        case ErrorCode::CELL_OPERATION_FAILED: return "CELL_OPERATION_FAILED";
        case ErrorCode::NOTEBOOK_SAVE_FAILED: return "NOTEBOOK_SAVE_FAILED";
        case ErrorCode::NOTEBOOK_OPEN_FAILED: return "NOTEBOOK_OPEN_FAILED";
        case ErrorCode::KERNEL_ERROR: return "KERNEL_ERROR";
        case ErrorCode::EXECUTION_TIMEOUT: return "EXECUTION_TIMEOUT";
        case ErrorCode::MCP_SERVER_START_FAILED: return "MCP_SERVER_START_FAILED";
        case ErrorCode::MCP_TOOL_ERROR: return "MCP_TOOL_ERROR";
        case ErrorCode::MCP_TRANSPORT_ERROR: return "MCP_TRANSPORT_ERROR";
        case ErrorCode::HOST_ERROR: return "HOST_ERROR";
        case ErrorCode::CONFIG_ERROR: return "CONFIG_ERROR";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
    }
    return "UNKNOWN_ERROR";
}

std::string GatewayError::forAgent() const {
    std::string text = std::string("Error [") + errorCodeName(errorCode) + "]: " + what();
    if (ctx.is_object() && !ctx.empty()) {
        text += " Context: " + ctx.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return text;
}

namespace Errors {

GatewayError validationError(const std::string& message, nlohmann::json context) {
    return GatewayError(message, ErrorCode::VALIDATION_ERROR, std::move(context));
}

GatewayError noActiveNotebook(const std::string& operation) {
    return GatewayError("No active notebook editor found", ErrorCode::NO_ACTIVE_NOTEBOOK,
                        {{"operation", operation}});
}

GatewayError indexOutOfBounds(long long index, int maxIndex, const std::string& operation) {
    return GatewayError("Index " + std::to_string(index) + " is out of bounds (0-" + std::to_string(maxIndex) + ")",
                        ErrorCode::INDEX_OUT_OF_BOUNDS,
                        {{"cellIndex", index}, {"cellCount", maxIndex + 1}, {"operation", operation}});
}

GatewayError rangeOutOfBounds(long long startIndex, long long stopIndex, int cellCount, const std::string& operation) {
    return GatewayError("Range " + std::to_string(startIndex) + "-" + std::to_string(stopIndex) +
                            " is invalid for " + std::to_string(cellCount) + " cells",
                        ErrorCode::INDEX_OUT_OF_BOUNDS,
                        {{"startIndex", startIndex}, {"stopIndex", stopIndex},
                         {"cellCount", cellCount}, {"operation", operation}});
}

GatewayError toolError(const std::string& toolName, const std::string& message) {
    return GatewayError(message, ErrorCode::MCP_TOOL_ERROR, {{"toolName", toolName}});
}

GatewayError serverError(const std::string& message, int port) {
    nlohmann::json context = nlohmann::json::object();
    if (port > 0) context["port"] = port;
    return GatewayError(message, ErrorCode::MCP_SERVER_START_FAILED, std::move(context));
}

GatewayError configError(const std::string& message, nlohmann::json context) {
    return GatewayError(message, ErrorCode::CONFIG_ERROR, std::move(context));
}

GatewayError hostError(const std::string& message, nlohmann::json context) {
    return GatewayError(message, ErrorCode::HOST_ERROR, std::move(context));
}

GatewayError wrap(const std::exception& e, ErrorCode code, nlohmann::json context) {
    if (auto* ge = dynamic_cast<const GatewayError*>(&e)) {
        return *ge;
    }
    return GatewayError(e.what(), code, std::move(context));
}

std::string forAgent(const std::exception& e) {
    if (auto* ge = dynamic_cast<const GatewayError*>(&e)) {
        return ge->forAgent();
    }
    return std::string("Error: ") + e.what();
}

} // namespace Errors
