#pragma once
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

enum class ErrorCode {
    VALIDATION_ERROR,
    SCHEMA_VALIDATION_FAILED,
    NO_ACTIVE_NOTEBOOK,
    INDEX_OUT_OF_BOUNDS,
    CELL_OPERATION_FAILED,
    NOTEBOOK_SAVE_FAILED,
    NOTEBOOK_OPEN_FAILED,
    KERNEL_ERROR,
    EXECUTION_TIMEOUT,
    MCP_SERVER_START_FAILED,
    MCP_TOOL_ERROR,
    MCP_TRANSPORT_ERROR,
    HOST_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

const char* errorCodeName(ErrorCode code);

/**
 * @brief The single exception type thrown by gateway code.
 *
 * Carries a machine-readable code and a JSON context object (operation,
 * toolName, indices, cellCount ...) so that a caller can correct its request
 * without another round trip.
 */
class GatewayError : public std::runtime_error {
public:
    GatewayError(const std::string& message, ErrorCode code, nlohmann::json context = nlohmann::json::object())
        : std::runtime_error(message), errorCode(code), ctx(std::move(context)) {}

    ErrorCode code() const { return errorCode; }
    const nlohmann::json& context() const { return ctx; }

    /** `Error [CODE]: message Context: {...}` */
    std::string forAgent() const;

private:
    ErrorCode errorCode;
    nlohmann::json ctx;
};

namespace Errors {
    GatewayError validationError(const std::string& message, nlohmann::json context = nlohmann::json::object());
    GatewayError noActiveNotebook(const std::string& operation);
    GatewayError indexOutOfBounds(long long index, int maxIndex, const std::string& operation);
    GatewayError rangeOutOfBounds(long long startIndex, long long stopIndex, int cellCount, const std::string& operation);
    GatewayError toolError(const std::string& toolName, const std::string& message);
    GatewayError serverError(const std::string& message, int port = 0);
    GatewayError configError(const std::string& message, nlohmann::json context = nlohmann::json::object());
    GatewayError hostError(const std::string& message, nlohmann::json context = nlohmann::json::object());

    /** Keeps a GatewayError as is, otherwise re-labels the message with `code`. */
    GatewayError wrap(const std::exception& e, ErrorCode code, nlohmann::json context = nlohmann::json::object());

    /** Agent-facing text for any exception. */
    std::string forAgent(const std::exception& e);
}
