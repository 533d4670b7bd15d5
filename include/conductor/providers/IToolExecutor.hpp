#pragma once

#include "../types.hpp"
#include "../cancellation.hpp"
#include <string>

namespace conductor {
namespace providers {

/**
 * @brief Abstract interface for executing named tools
 *
 * Fails with ToolNotFound for unknown names and ToolExecutionFailed (or
 * InvalidToolArguments) when the tool itself rejects the call.
 */
class IToolExecutor {
public:
    virtual ~IToolExecutor() = default;

    /**
     * @brief Execute a tool
     *
     * @param tool_name Registered tool name
     * @param params JSON object of arguments
     * @param cancel Cancellation/deadline signal
     * @return Expected<Value> Structured tool result
     */
    virtual Expected<Value> execute(
        const std::string& tool_name,
        const Value& params,
        const CancellationToken& cancel
    ) = 0;
};

} // namespace providers
} // namespace conductor
