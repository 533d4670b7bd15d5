#pragma once

#include "../types.hpp"
#include <optional>
#include <string>

namespace conductor {
namespace providers {

/**
 * @brief Storage for envelope state keyed by thread id
 *
 * `state` is exactly the shape produced by Envelope::to_state_dict().
 * Implementations must be safe to call from the runtime's worker threads.
 */
class IPersistenceAdapter {
public:
    virtual ~IPersistenceAdapter() = default;

    /** @brief Insert or replace the state stored for the thread. */
    virtual Expected<void> save_state(const std::string& thread_id, const Value& state) = 0;

    /** @brief Stored state, or nullopt when the thread has none. */
    virtual Expected<std::optional<Value>> load_state(const std::string& thread_id) = 0;
};

} // namespace providers
} // namespace conductor
