#pragma once

#include "../types.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace conductor {
namespace engine {

/**
 * @brief One item of a streaming run.
 *
 * Regular items carry a stage name and that stage's output. The final item
 * carries kStreamEndMarker with `{"terminated": bool}`.
 */
struct StageOutput {
    std::string stage;
    Value output;
    std::optional<Error> error;

    bool is_end() const { return stage == kStreamEndMarker; }
};

/**
 * @brief Blocking single-producer/single-consumer channel of stage outputs.
 *
 * The runtime's worker pushes one item per completed stage and closes the
 * stream after the end marker. Items pushed before close() remain poppable.
 */
class StageStream {
public:
    /// @return false if the stream was already closed
    bool push(StageOutput item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Blocks until an item is available.
     *
     * @return Next item, or nullopt once the stream is closed and drained
     */
    std::optional<StageOutput> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !items_.empty() || closed_; });
        return take_front();
    }

    template<typename Rep, typename Period>
    std::optional<StageOutput> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; })) {
            return std::nullopt;
        }
        return take_front();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

private:
    // Caller holds mutex_.
    std::optional<StageOutput> take_front() {
        if (items_.empty()) {
            return std::nullopt;
        }
        StageOutput item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<StageOutput> items_;
    bool closed_ = false;
};

} // namespace engine
} // namespace conductor
