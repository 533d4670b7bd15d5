#pragma once

#include "../types.hpp"
#include "../providers/IPersistenceAdapter.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace conductor {
namespace persistence {

/**
 * @brief Process-local IPersistenceAdapter.
 *
 * Stores deep copies so callers can keep mutating their own state objects.
 */
class InMemoryStateStore : public providers::IPersistenceAdapter {
public:
    Expected<void> save_state(const std::string& thread_id, const Value& state) override {
        if (thread_id.empty()) {
            return tl::unexpected(Error{ErrorCode::PersistenceFailed, "Thread id cannot be empty"});
        }
        std::lock_guard<std::mutex> lock(mutex_);
        states_.insert_or_assign(thread_id, deep_copy(state));
        ++save_count_;
        return {};
    }

    Expected<std::optional<Value>> load_state(const std::string& thread_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = states_.find(thread_id);
        if (it == states_.end()) {
            return std::optional<Value>{};
        }
        return std::optional<Value>{deep_copy(it->second)};
    }

    bool delete_state(const std::string& thread_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return states_.erase(thread_id) > 0;
    }

    std::vector<std::string> thread_ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids;
        ids.reserve(states_.size());
        for (const auto& [id, state] : states_) {
            ids.push_back(id);
        }
        return ids;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return states_.size();
    }

    /// Total number of successful saves since construction.
    size_t save_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return save_count_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Value> states_;
    size_t save_count_ = 0;
};

} // namespace persistence
} // namespace conductor
