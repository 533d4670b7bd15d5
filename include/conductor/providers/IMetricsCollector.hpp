#pragma once

#include <cstdint>
#include <string>

namespace conductor {
namespace providers {

/**
 * @brief Counters and histograms for agent and pipeline executions
 *
 * Injected into Runtime and Agent instead of process-wide globals.
 */
class IMetricsCollector {
public:
    virtual ~IMetricsCollector() = default;

    /// status: "success" or "error"
    virtual void record_agent_execution(const std::string& agent, const std::string& status, int64_t duration_ms) = 0;

    /// status: "success", "terminated", "interrupted" or "error"
    virtual void record_pipeline_execution(const std::string& pipeline, const std::string& status, int64_t duration_ms) = 0;
};

} // namespace providers
} // namespace conductor
