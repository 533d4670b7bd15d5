#pragma once

#include "conductor/providers/IToolExecutor.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace conductor {
namespace testing {

/**
 * @brief Tool executor returning canned results per tool name
 *
 * Unknown tools fail with ToolNotFound. Tools listed in `failing_tools`
 * fail with ToolExecutionFailed.
 */
class MockToolExecutor : public providers::IToolExecutor {
public:
    struct Call {
        std::string tool;
        Value params;
    };

    std::map<std::string, Value> results;
    std::map<std::string, std::string> failing_tools;  ///< tool -> error message

    Expected<Value> execute(const std::string& tool_name, const Value& params,
                            const CancellationToken& cancel) override {
        if (auto stop = cancel.check()) {
            return tl::unexpected(*stop);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(Call{tool_name, params});

        if (auto it = failing_tools.find(tool_name); it != failing_tools.end()) {
            return tl::unexpected(Error{ErrorCode::ToolExecutionFailed, it->second, tool_name});
        }
        auto it = results.find(tool_name);
        if (it == results.end()) {
            return tl::unexpected(Error{ErrorCode::ToolNotFound, "Tool not found: " + tool_name, tool_name});
        }
        return it->second;
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::vector<std::string> called_tools() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& call : calls_) names.push_back(call.tool);
        return names;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Call> calls_;
};

} // namespace testing
} // namespace conductor
