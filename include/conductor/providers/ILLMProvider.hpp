#pragma once

#include "../types.hpp"
#include "../cancellation.hpp"
#include <string>

namespace conductor {
namespace providers {

/**
 * @brief Abstract interface for LLM text generation
 *
 * Concrete adapters (hosted APIs, local servers) live outside the engine and
 * are injected per model role through RuntimeDependencies::llm_factory.
 *
 * Implementations must be safe to call concurrently: in parallel mode several
 * agents sharing a role invoke the same provider from different threads.
 */
class ILLMProvider {
public:
    virtual ~ILLMProvider() = default;

    /**
     * @brief Generate a completion for a prompt
     *
     * @param model Model role or name (`"default"` when the agent sets none)
     * @param prompt Fully rendered prompt text
     * @param options Generation options (`num_predict`, `num_ctx`, `temperature`)
     * @param cancel Cancellation/deadline signal; long calls should poll it
     * @return Expected<std::string> Raw model output or a provider error
     */
    virtual Expected<std::string> generate(
        const std::string& model,
        const std::string& prompt,
        const Value& options,
        const CancellationToken& cancel
    ) = 0;
};

} // namespace providers
} // namespace conductor
