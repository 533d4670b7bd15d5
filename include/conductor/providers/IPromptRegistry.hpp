#pragma once

#include "../types.hpp"
#include <string>

namespace conductor {
namespace providers {

/** @brief Prompt lookup by key, rendered against a context object. */
class IPromptRegistry {
public:
    virtual ~IPromptRegistry() = default;

    /**
     * @param key Prompt key from AgentConfig::prompt_key
     * @param context raw_input, user_id, session_id and every agent output
     * @return Expected<std::string> Rendered prompt, or PromptNotFound
     */
    virtual Expected<std::string> get(const std::string& key, const Value& context) const = 0;
};

} // namespace providers
} // namespace conductor
