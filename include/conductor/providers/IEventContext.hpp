#pragma once

#include "../types.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace conductor {
namespace providers {

/**
 * @brief Receiver for agent lifecycle events
 *
 * Typically forwards to a message bus or a websocket. Emission failures are
 * logged by the agent and never fail the stage.
 */
class IEventContext {
public:
    virtual ~IEventContext() = default;

    virtual Expected<void> emit_agent_started(const std::string& agent) = 0;

    /**
     * @param agent Agent name
     * @param status "success" or "error"
     * @param duration_ms Wall time of the stage
     * @param error Failure reported by the stage, if any
     */
    virtual Expected<void> emit_agent_completed(
        const std::string& agent,
        const std::string& status,
        int64_t duration_ms,
        const std::optional<Error>& error
    ) = 0;
};

} // namespace providers
} // namespace conductor
