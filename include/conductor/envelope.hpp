#pragma once

#include "types.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace conductor {

// ============================================================================
// Terminal Reasons
// ============================================================================

/**
 * @brief Specific cause recorded when a run stops.
 */
enum class TerminalReason {
    Completed,
    MaxIterationsExceeded,
    MaxLlmCallsExceeded,
    MaxAgentHopsExceeded,
    MaxLoopExceeded,
    UserCancelled,
    ToolFailedFatally,
    LlmFailedFatally,
    PolicyViolation
};

[[nodiscard]] inline const char* terminal_reason_to_string(TerminalReason reason) {
    switch (reason) {
        case TerminalReason::Completed: return "completed";
        case TerminalReason::MaxIterationsExceeded: return "max_iterations_exceeded";
        case TerminalReason::MaxLlmCallsExceeded: return "max_llm_calls_exceeded";
        case TerminalReason::MaxAgentHopsExceeded: return "max_agent_hops_exceeded";
        case TerminalReason::MaxLoopExceeded: return "max_loop_exceeded";
        case TerminalReason::UserCancelled: return "user_cancelled";
        case TerminalReason::ToolFailedFatally: return "tool_failed_fatally";
        case TerminalReason::LlmFailedFatally: return "llm_failed_fatally";
        case TerminalReason::PolicyViolation: return "policy_violation";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<TerminalReason> terminal_reason_from_string(const std::string& text) {
    static const std::map<std::string, TerminalReason> table = {
        {"completed", TerminalReason::Completed},
        {"max_iterations_exceeded", TerminalReason::MaxIterationsExceeded},
        {"max_llm_calls_exceeded", TerminalReason::MaxLlmCallsExceeded},
        {"max_agent_hops_exceeded", TerminalReason::MaxAgentHopsExceeded},
        {"max_loop_exceeded", TerminalReason::MaxLoopExceeded},
        {"user_cancelled", TerminalReason::UserCancelled},
        {"tool_failed_fatally", TerminalReason::ToolFailedFatally},
        {"llm_failed_fatally", TerminalReason::LlmFailedFatally},
        {"policy_violation", TerminalReason::PolicyViolation},
    };
    auto it = table.find(text);
    if (it == table.end()) return std::nullopt;
    return it->second;
}

// ============================================================================
// Interrupts
// ============================================================================

/**
 * @brief Typed pause request kinds.
 */
enum class InterruptKind {
    Clarification,
    Confirmation,
    AgentReview,
    Checkpoint,
    ResourceExhausted,
    Timeout,
    SystemError
};

[[nodiscard]] inline const char* interrupt_kind_to_string(InterruptKind kind) {
    switch (kind) {
        case InterruptKind::Clarification: return "clarification";
        case InterruptKind::Confirmation: return "confirmation";
        case InterruptKind::AgentReview: return "agent_review";
        case InterruptKind::Checkpoint: return "checkpoint";
        case InterruptKind::ResourceExhausted: return "resource_exhausted";
        case InterruptKind::Timeout: return "timeout";
        case InterruptKind::SystemError: return "system_error";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<InterruptKind> interrupt_kind_from_string(const std::string& text) {
    static const std::map<std::string, InterruptKind> table = {
        {"clarification", InterruptKind::Clarification},
        {"confirmation", InterruptKind::Confirmation},
        {"agent_review", InterruptKind::AgentReview},
        {"checkpoint", InterruptKind::Checkpoint},
        {"resource_exhausted", InterruptKind::ResourceExhausted},
        {"timeout", InterruptKind::Timeout},
        {"system_error", InterruptKind::SystemError},
    };
    auto it = table.find(text);
    if (it == table.end()) return std::nullopt;
    return it->second;
}

/**
 * @brief External answer to a pending interrupt.
 *
 * `data` is null when absent.
 */
struct InterruptResponse {
    std::optional<std::string> text;      ///< Clarification answer
    std::optional<bool> approved;         ///< Confirmation decision
    std::optional<std::string> decision;  ///< Review decision (approve/reject/modify)
    Value data;                           ///< Extensible payload
    Timestamp received_at{};              ///< Stamped when the response is applied

    bool operator==(const InterruptResponse& other) const {
        return text == other.text &&
               approved == other.approved &&
               decision == other.decision &&
               data == other.data &&
               received_at == other.received_at;
    }

    bool operator!=(const InterruptResponse& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Single-slot interrupt stored in the envelope.
 */
struct FlowInterrupt {
    InterruptKind kind = InterruptKind::Clarification;
    std::string id;
    std::string question;
    std::string message;
    Value data;                                 ///< Extensible payload, null when absent
    std::optional<InterruptResponse> response;  ///< Kept after resolution for audit
    Timestamp created_at{};
    std::optional<Timestamp> expires_at;

    bool operator==(const FlowInterrupt& other) const {
        return kind == other.kind &&
               id == other.id &&
               question == other.question &&
               message == other.message &&
               data == other.data &&
               response == other.response &&
               created_at == other.created_at &&
               expires_at == other.expires_at;
    }

    bool operator!=(const FlowInterrupt& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Optional settings applied by Envelope::set_interrupt().
 *
 * @code
 * env.set_interrupt(InterruptKind::Clarification, "int_1",
 *                   InterruptOptions{}.with_question("Which account?"));
 * @endcode
 */
struct InterruptOptions {
    std::optional<std::string> question;
    std::optional<std::string> message;
    std::optional<std::chrono::milliseconds> expiry;
    Value data;

    InterruptOptions& with_question(std::string q) {
        question = std::move(q);
        return *this;
    }

    InterruptOptions& with_message(std::string m) {
        message = std::move(m);
        return *this;
    }

    InterruptOptions& with_expiry(std::chrono::milliseconds d) {
        expiry = d;
        return *this;
    }

    InterruptOptions& with_data(Value d) {
        data = std::move(d);
        return *this;
    }
};

// ============================================================================
// Processing Record
// ============================================================================

/** @brief Audit entry for one agent execution. */
struct ProcessingRecord {
    std::string agent;
    int stage_order = 0;
    Timestamp started_at{};
    std::optional<Timestamp> completed_at;
    int64_t duration_ms = 0;
    std::string status = "running";  ///< running, success, error, skipped
    std::optional<std::string> error;
    int llm_calls = 0;

    bool operator==(const ProcessingRecord& other) const {
        return agent == other.agent &&
               stage_order == other.stage_order &&
               started_at == other.started_at &&
               completed_at == other.completed_at &&
               duration_ms == other.duration_ms &&
               status == other.status &&
               error == other.error &&
               llm_calls == other.llm_calls;
    }

    bool operator!=(const ProcessingRecord& other) const {
        return !(*this == other);
    }
};

namespace detail {

inline Value optional_string(const std::optional<std::string>& value) {
    return value ? Value(*value) : Value(nullptr);
}

inline Value optional_timestamp(const std::optional<Timestamp>& value) {
    return value ? Value(format_timestamp(*value)) : Value(nullptr);
}

/**
 * @brief Typed field reader for state dictionaries.
 *
 * Absent and null keys leave the target untouched; a present key of the
 * wrong type records the first decode error.
 */
class StateReader {
public:
    StateReader(const Value& object, std::string where, ErrorCode code = ErrorCode::StateDecodeFailed)
        : object_(object), where_(std::move(where)), code_(code) {
        if (!object_.is_object()) {
            fail(where_, "expected an object");
        }
    }

    const std::optional<Error>& error() const { return error_; }

    void read(const char* key, std::string& out) {
        if (const Value* v = find(key)) {
            if (v->is_string()) out = v->get<std::string>();
            else fail(key, "expected a string");
        }
    }

    void read(const char* key, std::optional<std::string>& out) {
        out.reset();
        if (const Value* v = find(key)) {
            if (v->is_string()) out = v->get<std::string>();
            else fail(key, "expected a string or null");
        }
    }

    void read(const char* key, int& out) {
        if (const Value* v = find(key)) {
            if (v->is_number_integer()) out = v->get<int>();
            else if (v->is_number_float()) out = static_cast<int>(v->get<double>());
            else fail(key, "expected an integer");
        }
    }

    void read(const char* key, int64_t& out) {
        if (const Value* v = find(key)) {
            if (v->is_number_integer()) out = v->get<int64_t>();
            else if (v->is_number_float()) out = static_cast<int64_t>(v->get<double>());
            else fail(key, "expected an integer");
        }
    }

    void read(const char* key, bool& out) {
        if (const Value* v = find(key)) {
            if (v->is_boolean()) out = v->get<bool>();
            else fail(key, "expected a boolean");
        }
    }

    void read(const char* key, std::optional<int>& out) {
        out.reset();
        if (const Value* v = find(key)) {
            if (v->is_number_integer()) out = v->get<int>();
            else fail(key, "expected an integer or null");
        }
    }

    void read(const char* key, std::optional<double>& out) {
        out.reset();
        if (const Value* v = find(key)) {
            if (v->is_number()) out = v->get<double>();
            else fail(key, "expected a number or null");
        }
    }

    void read(const char* key, std::optional<bool>& out) {
        out.reset();
        if (const Value* v = find(key)) {
            if (v->is_boolean()) out = v->get<bool>();
            else fail(key, "expected a boolean or null");
        }
    }

    void read(const char* key, Timestamp& out) {
        if (const Value* v = find(key)) {
            std::optional<Timestamp> parsed;
            if (v->is_string()) parsed = parse_timestamp(v->get<std::string>());
            if (parsed) out = *parsed;
            else fail(key, "expected an RFC 3339 timestamp");
        }
    }

    void read(const char* key, std::optional<Timestamp>& out) {
        out.reset();
        if (const Value* v = find(key)) {
            std::optional<Timestamp> parsed;
            if (v->is_string()) parsed = parse_timestamp(v->get<std::string>());
            if (parsed) out = parsed;
            else fail(key, "expected an RFC 3339 timestamp or null");
        }
    }

    void read(const char* key, std::vector<std::string>& out) {
        if (const Value* v = find(key)) {
            if (!v->is_array()) {
                fail(key, "expected an array of strings");
                return;
            }
            out.clear();
            for (const auto& item : *v) {
                if (!item.is_string()) {
                    fail(key, "expected an array of strings");
                    return;
                }
                out.push_back(item.get<std::string>());
            }
        }
    }

    void read(const char* key, std::set<std::string>& out) {
        std::vector<std::string> items;
        read(key, items);
        out = std::set<std::string>(items.begin(), items.end());
    }

    void read(const char* key, std::map<std::string, std::string>& out) {
        if (const Value* v = find(key)) {
            if (!v->is_object()) {
                fail(key, "expected an object of strings");
                return;
            }
            out.clear();
            for (auto it = v->begin(); it != v->end(); ++it) {
                if (!it.value().is_string()) {
                    fail(key, "expected an object of strings");
                    return;
                }
                out[it.key()] = it.value().get<std::string>();
            }
        }
    }

    void read(const char* key, std::vector<Value>& out) {
        if (const Value* v = find(key)) {
            if (!v->is_array()) {
                fail(key, "expected an array");
                return;
            }
            out.clear();
            for (const auto& item : *v) {
                out.push_back(deep_copy(item));
            }
        }
    }

    /// Reads an arbitrary value, keeping null as null.
    void read_any(const char* key, Value& out) {
        auto it = object_.is_object() ? object_.find(key) : object_.end();
        if (it != object_.end()) {
            out = deep_copy(*it);
        }
    }

    const Value* find(const char* key) const {
        if (!object_.is_object()) return nullptr;
        auto it = object_.find(key);
        if (it == object_.end() || it->is_null()) return nullptr;
        return &*it;
    }

    void fail(const std::string& key, const std::string& what) {
        if (!error_) {
            error_ = Error{code_, "Malformed field '" + key + "': " + what, where_};
        }
    }

private:
    const Value& object_;
    std::string where_;
    ErrorCode code_;
    std::optional<Error> error_;
};

} // namespace detail

inline Value processing_record_to_json(const ProcessingRecord& record) {
    return Value{
        {"agent", record.agent},
        {"stage_order", record.stage_order},
        {"started_at", format_timestamp(record.started_at)},
        {"completed_at", detail::optional_timestamp(record.completed_at)},
        {"duration_ms", record.duration_ms},
        {"status", record.status},
        {"error", detail::optional_string(record.error)},
        {"llm_calls", record.llm_calls}
    };
}

inline Expected<ProcessingRecord> processing_record_from_json(const Value& value) {
    ProcessingRecord record;
    detail::StateReader reader(value, "processing_history");
    reader.read("agent", record.agent);
    reader.read("stage_order", record.stage_order);
    reader.read("started_at", record.started_at);
    reader.read("completed_at", record.completed_at);
    reader.read("duration_ms", record.duration_ms);
    reader.read("status", record.status);
    reader.read("error", record.error);
    reader.read("llm_calls", record.llm_calls);
    if (reader.error()) {
        return tl::unexpected(*reader.error());
    }
    return record;
}

// ============================================================================
// Envelope
// ============================================================================

/**
 * @brief Per-run mutable state container threaded through the agent graph.
 *
 * Identity, outputs, goal bookkeeping and retry state are plain members.
 * Bounds counters, termination, interrupt, stage sets and the audit history
 * are private so every change goes through the operations that keep their
 * invariants: counters never decrease, the three stage-status sets stay
 * disjoint, and only terminate() marks the envelope terminated.
 *
 * @threadsafety Not thread-safe. The runtime serializes access during
 * parallel rounds; workers operate on clones.
 */
class Envelope {
public:
    /// Output keys cleared by advance_stage().
    static const std::vector<std::string>& stage_scoped_outputs() {
        static const std::vector<std::string> keys = {"plan", "execution", "critic"};
        return keys;
    }

    /// Output keys cleared by increment_iteration().
    static const std::vector<std::string>& iteration_scoped_outputs() {
        static const std::vector<std::string> keys = {"plan", "arbiter", "execution", "synthesizer", "critic"};
        return keys;
    }

    // Identity
    std::string envelope_id;
    std::string request_id;
    std::string user_id = "anonymous";
    std::string session_id;
    std::string raw_input;
    Timestamp received_at{};
    Timestamp created_at{};

    // Outputs keyed by agent output key
    std::map<std::string, Value> outputs;

    // Pipeline state
    std::string current_stage = "start";
    std::vector<std::string> stage_order;
    int max_iterations = 3;
    int max_llm_calls = 10;
    int max_agent_hops = 21;
    bool parallel_mode = false;

    // Multi-stage goals
    std::vector<std::string> all_goals;
    std::vector<std::string> remaining_goals;
    std::map<std::string, std::string> goal_completion_status;
    std::vector<Value> completed_stages;
    int current_stage_number = 1;
    int max_stages = 5;

    // Retry state
    std::vector<Value> prior_plans;
    std::vector<std::string> loop_feedback;

    // Errors reported by agents ({agent, error, error_type, timestamp})
    std::vector<Value> errors;

    Value metadata = Value::object();

    Envelope()
        : envelope_id(generate_id("env_"))
        , request_id(generate_id("req_"))
        , session_id(generate_id("sess_"))
        , received_at(now_utc())
        , created_at(received_at)
    {}

    /**
     * @brief Creates an envelope for a new request.
     *
     * @param raw_input The user request text
     * @param user_id User identifier ("anonymous" when empty)
     * @param session_id Session identifier (generated when empty)
     * @param request_id Request identifier (generated when absent)
     * @param metadata Free-form metadata object
     * @param stage_order Initial stage order
     */
    static Envelope create(
        std::string raw_input,
        std::string user_id = "anonymous",
        std::string session_id = "",
        std::optional<std::string> request_id = std::nullopt,
        Value metadata = Value::object(),
        std::vector<std::string> stage_order = {}
    ) {
        Envelope env;
        env.raw_input = std::move(raw_input);
        if (!user_id.empty()) env.user_id = std::move(user_id);
        if (!session_id.empty()) env.session_id = std::move(session_id);
        if (request_id) env.request_id = std::move(*request_id);
        if (metadata.is_object()) env.metadata = std::move(metadata);
        env.stage_order = std::move(stage_order);
        return env;
    }

    // ========================================================================
    // Outputs
    // ========================================================================

    void set_output(const std::string& key, Value value) {
        outputs[key] = std::move(value);
    }

    /** @brief Output stored under key, or nullptr if absent. */
    const Value* get_output(const std::string& key) const {
        auto it = outputs.find(key);
        return it == outputs.end() ? nullptr : &it->second;
    }

    bool has_output(const std::string& key) const {
        return outputs.find(key) != outputs.end();
    }

    // ========================================================================
    // Audit
    // ========================================================================

    /** @brief Appends a running record and counts one agent hop. */
    void record_agent_start(const std::string& agent, int stage_order_index) {
        ProcessingRecord record;
        record.agent = agent;
        record.stage_order = stage_order_index;
        record.started_at = now_utc();
        record.status = "running";
        processing_history_.push_back(std::move(record));
        ++agent_hop_count_;
    }

    /**
     * @brief Finalizes the most recent running record for the agent.
     *
     * The LLM call count is added to the envelope total even when no running
     * record is found. A non-positive duration is computed from the record's
     * start time.
     */
    void record_agent_complete(
        const std::string& agent,
        const std::string& status,
        std::optional<std::string> error,
        int llm_calls,
        int64_t duration_ms
    ) {
        for (auto it = processing_history_.rbegin(); it != processing_history_.rend(); ++it) {
            if (it->agent == agent && it->status == "running") {
                const auto now = now_utc();
                it->completed_at = now;
                it->status = status;
                it->error = std::move(error);
                it->llm_calls = llm_calls;
                it->duration_ms = duration_ms > 0
                    ? duration_ms
                    : std::chrono::duration_cast<std::chrono::milliseconds>(now - it->started_at).count();
                break;
            }
        }
        llm_call_count_ += std::max(0, llm_calls);
    }

    /** @brief Appends an agent error entry. */
    void add_error(const std::string& agent, const std::string& message,
                   const std::string& error_type = "ProcessingError") {
        errors.push_back(Value{
            {"agent", agent},
            {"error", message},
            {"error_type", error_type},
            {"timestamp", format_timestamp(now_utc())}
        });
    }

    const std::vector<ProcessingRecord>& processing_history() const { return processing_history_; }

    int64_t total_processing_time_ms() const {
        int64_t total = 0;
        for (const auto& record : processing_history_) {
            total += record.duration_ms;
        }
        return total;
    }

    // ========================================================================
    // Bounds and control
    // ========================================================================

    int iteration() const { return iteration_; }
    int llm_call_count() const { return llm_call_count_; }
    int agent_hop_count() const { return agent_hop_count_; }
    bool terminated() const { return terminated_; }
    const std::optional<std::string>& termination_reason() const { return termination_reason_; }
    std::optional<TerminalReason> terminal_reason() const { return terminal_reason_; }
    const std::optional<Timestamp>& completed_at() const { return completed_at_; }

    /**
     * @brief Decides whether another stage may be dispatched.
     *
     * Checked in order: terminated, pending interrupt, iterations, LLM calls,
     * agent hops. The first exceeded bound is recorded as the terminal reason.
     */
    bool can_continue() {
        if (terminated_) return false;
        if (interrupt_pending_) return false;
        if (iteration_ > max_iterations) {
            terminal_reason_ = TerminalReason::MaxIterationsExceeded;
            return false;
        }
        if (llm_call_count_ >= max_llm_calls) {
            terminal_reason_ = TerminalReason::MaxLlmCallsExceeded;
            return false;
        }
        if (agent_hop_count_ >= max_agent_hops) {
            terminal_reason_ = TerminalReason::MaxAgentHopsExceeded;
            return false;
        }
        return true;
    }

    void terminate(std::string reason, std::optional<TerminalReason> terminal_reason = std::nullopt) {
        terminated_ = true;
        termination_reason_ = std::move(reason);
        if (terminal_reason) {
            terminal_reason_ = terminal_reason;
        }
        completed_at_ = now_utc();
    }

    /**
     * @brief Counts a retry loop.
     *
     * Archives a copy of the current plan, records feedback if given and
     * clears the iteration-scoped outputs.
     */
    void increment_iteration(const std::optional<std::string>& feedback = std::nullopt) {
        ++iteration_;
        if (feedback) {
            loop_feedback.push_back(*feedback);
        }
        if (const Value* plan = get_output("plan")) {
            prior_plans.push_back(deep_copy(*plan));
        }
        for (const auto& key : iteration_scoped_outputs()) {
            outputs.erase(key);
        }
    }

    // ========================================================================
    // Interrupts
    // ========================================================================

    /** @brief Installs an interrupt, replacing any prior one. */
    void set_interrupt(InterruptKind kind, std::string id, InterruptOptions options = {}) {
        FlowInterrupt flow;
        flow.kind = kind;
        flow.id = std::move(id);
        flow.created_at = now_utc();
        if (options.question) flow.question = std::move(*options.question);
        if (options.message) flow.message = std::move(*options.message);
        if (options.expiry) flow.expires_at = flow.created_at + *options.expiry;
        flow.data = std::move(options.data);
        interrupt_ = std::move(flow);
        interrupt_pending_ = true;
    }

    /** @brief Attaches the response, stamps it, and clears the pending flag. */
    void resolve_interrupt(InterruptResponse response) {
        if (interrupt_) {
            response.received_at = now_utc();
            interrupt_->response = std::move(response);
        }
        interrupt_pending_ = false;
    }

    void clear_interrupt() {
        interrupt_pending_ = false;
        interrupt_.reset();
    }

    bool interrupt_pending() const { return interrupt_pending_; }
    bool has_pending_interrupt() const { return interrupt_pending_ && interrupt_.has_value(); }
    const std::optional<FlowInterrupt>& interrupt() const { return interrupt_; }

    std::optional<InterruptKind> interrupt_kind() const {
        if (!interrupt_) return std::nullopt;
        return interrupt_->kind;
    }

    // ========================================================================
    // Stage status sets
    // ========================================================================

    void start_stage(const std::string& stage) {
        completed_stage_set_.erase(stage);
        failed_stages_.erase(stage);
        active_stages_.insert(stage);
    }

    void complete_stage(const std::string& stage) {
        active_stages_.erase(stage);
        failed_stages_.erase(stage);
        completed_stage_set_.insert(stage);
    }

    void fail_stage(const std::string& stage, const std::string& error) {
        active_stages_.erase(stage);
        completed_stage_set_.erase(stage);
        failed_stages_[stage] = error;
    }

    /** @brief Removes a stage from every status set so it can run again. */
    void reset_stage(const std::string& stage) {
        active_stages_.erase(stage);
        completed_stage_set_.erase(stage);
        failed_stages_.erase(stage);
    }

    bool is_stage_active(const std::string& stage) const { return active_stages_.count(stage) > 0; }
    bool is_stage_completed(const std::string& stage) const { return completed_stage_set_.count(stage) > 0; }
    bool is_stage_failed(const std::string& stage) const { return failed_stages_.count(stage) > 0; }

    size_t active_stage_count() const { return active_stages_.size(); }
    size_t completed_stage_count() const { return completed_stage_set_.size(); }

    const std::set<std::string>& active_stages() const { return active_stages_; }
    const std::set<std::string>& completed_stage_set() const { return completed_stage_set_; }
    const std::map<std::string, std::string>& failed_stages() const { return failed_stages_; }

    bool all_stages_complete() const {
        if (stage_order.empty()) return false;
        return std::all_of(stage_order.begin(), stage_order.end(),
                           [this](const std::string& s) { return is_stage_completed(s); });
    }

    bool has_failures() const { return !failed_stages_.empty(); }

    // ========================================================================
    // Goals
    // ========================================================================

    void initialize_goals(const std::vector<std::string>& goals) {
        all_goals = goals;
        remaining_goals = goals;
        goal_completion_status.clear();
        for (const auto& goal : goals) {
            goal_completion_status[goal] = "pending";
        }
    }

    /**
     * @brief Closes the current goal stage.
     *
     * @return false when no goals remain or the stage cap is reached, true
     *         after moving to the next stage and clearing its outputs
     */
    bool advance_stage(const std::vector<std::string>& satisfied_goals, const Value& summary) {
        for (const auto& goal : satisfied_goals) {
            goal_completion_status[goal] = "satisfied";
            remaining_goals.erase(std::remove(remaining_goals.begin(), remaining_goals.end(), goal),
                                  remaining_goals.end());
        }

        Value plan_id = nullptr;
        if (const Value* plan = get_output("plan"); plan != nullptr && plan->is_object()) {
            auto it = plan->find("plan_id");
            if (it != plan->end()) plan_id = *it;
        }

        completed_stages.push_back(Value{
            {"stage_number", current_stage_number},
            {"satisfied_goals", satisfied_goals},
            {"summary", deep_copy(summary)},
            {"plan_id", plan_id}
        });

        if (remaining_goals.empty() || current_stage_number >= max_stages) {
            return false;
        }

        ++current_stage_number;
        for (const auto& key : stage_scoped_outputs()) {
            outputs.erase(key);
        }
        return true;
    }

    /** @brief Accumulated goal context for prompts. */
    Value get_stage_context() const {
        Value satisfied = Value::array();
        for (const auto& [goal, status] : goal_completion_status) {
            if (status == "satisfied") satisfied.push_back(goal);
        }
        return Value{
            {"current_stage", current_stage_number},
            {"completed_stages", completed_stages},
            {"remaining_goals", remaining_goals},
            {"goal_completion_status", goal_completion_status},
            {"satisfied_goals", satisfied}
        };
    }

    // ========================================================================
    // Responses
    // ========================================================================

    /**
     * @brief User-facing response text.
     *
     * A pending clarification question or confirmation message wins over
     * `outputs["integration"]["final_response"]`.
     */
    std::optional<std::string> get_final_response() const {
        if (interrupt_pending_ && interrupt_) {
            if (interrupt_->kind == InterruptKind::Clarification && !interrupt_->question.empty()) {
                return interrupt_->question;
            }
            if (interrupt_->kind == InterruptKind::Confirmation && !interrupt_->message.empty()) {
                return interrupt_->message;
            }
        }
        if (const Value* integration = get_output("integration"); integration != nullptr && integration->is_object()) {
            auto it = integration->find("final_response");
            if (it != integration->end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
        return std::nullopt;
    }

    /** @brief Compact summary for API responses. */
    Value to_result_dict() const {
        Value result = {
            {"envelope_id", envelope_id},
            {"request_id", request_id},
            {"user_id", user_id},
            {"session_id", session_id},
            {"current_stage", current_stage},
            {"terminated", terminated_},
            {"termination_reason", detail::optional_string(termination_reason_)},
            {"response", detail::optional_string(get_final_response())},
            {"interrupt_pending", interrupt_pending_},
            {"iteration", iteration_},
            {"llm_call_count", llm_call_count_},
            {"processing_time_ms", total_processing_time_ms()},
            {"errors", errors}
        };

        if (interrupt_) {
            result["interrupt"] = {
                {"kind", interrupt_kind_to_string(interrupt_->kind)},
                {"id", interrupt_->id},
                {"question", interrupt_->question},
                {"message", interrupt_->message},
                {"created_at", format_timestamp(interrupt_->created_at)}
            };
            if (interrupt_->kind == InterruptKind::Clarification) {
                result["clarification_needed"] = interrupt_pending_;
                result["clarification_question"] = interrupt_->question;
            }
            if (interrupt_->kind == InterruptKind::Confirmation) {
                result["confirmation_needed"] = interrupt_pending_;
                result["confirmation_message"] = interrupt_->message;
                result["confirmation_id"] = interrupt_->id;
            }
        }
        return result;
    }

    // ========================================================================
    // Copying and parallel merge
    // ========================================================================

    /** @brief Fully independent deep copy. */
    Envelope clone() const {
        Envelope copy = *this;
        for (auto& [key, value] : copy.outputs) {
            value = deep_copy(value);
        }
        for (auto& snapshot : copy.completed_stages) snapshot = deep_copy(snapshot);
        for (auto& plan : copy.prior_plans) plan = deep_copy(plan);
        for (auto& error : copy.errors) error = deep_copy(error);
        copy.metadata = deep_copy(metadata);
        if (copy.interrupt_) {
            copy.interrupt_->data = deep_copy(interrupt_->data);
            if (copy.interrupt_->response) {
                copy.interrupt_->response->data = deep_copy(interrupt_->response->data);
            }
        }
        return copy;
    }

    /** @brief Counters captured when a parallel branch is cloned off. */
    struct BranchBaseline {
        size_t history_size = 0;
        size_t error_count = 0;
        int llm_call_count = 0;
        int agent_hop_count = 0;
    };

    BranchBaseline baseline() const {
        return BranchBaseline{processing_history_.size(), errors.size(), llm_call_count_, agent_hop_count_};
    }

    /**
     * @brief Folds a finished parallel branch back into this envelope.
     *
     * Only the branch's own output key is taken. Audit records, errors and
     * counter deltas produced after the baseline are appended; a pending
     * interrupt or termination raised by the branch is carried over.
     */
    void merge_branch(const Envelope& branch, const std::string& output_key, const BranchBaseline& base) {
        if (const Value* output = branch.get_output(output_key)) {
            outputs[output_key] = deep_copy(*output);
        }
        for (size_t i = base.history_size; i < branch.processing_history_.size(); ++i) {
            processing_history_.push_back(branch.processing_history_[i]);
        }
        for (size_t i = base.error_count; i < branch.errors.size(); ++i) {
            errors.push_back(deep_copy(branch.errors[i]));
        }
        llm_call_count_ += std::max(0, branch.llm_call_count_ - base.llm_call_count);
        agent_hop_count_ += std::max(0, branch.agent_hop_count_ - base.agent_hop_count);

        if (branch.has_pending_interrupt()) {
            interrupt_ = branch.interrupt_;
            interrupt_pending_ = true;
        }
        if (branch.terminated_ && !terminated_) {
            terminate(branch.termination_reason_.value_or(""), branch.terminal_reason_);
        }
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    /** @brief Full persisted state; timestamps use format_timestamp(). */
    Value to_state_dict() const {
        Value outputs_json = Value::object();
        for (const auto& [key, value] : outputs) {
            outputs_json[key] = value;
        }

        Value history = Value::array();
        for (const auto& record : processing_history_) {
            history.push_back(processing_record_to_json(record));
        }

        Value interrupt_json = nullptr;
        if (interrupt_) {
            interrupt_json = {
                {"kind", interrupt_kind_to_string(interrupt_->kind)},
                {"id", interrupt_->id},
                {"question", interrupt_->question},
                {"message", interrupt_->message},
                {"data", interrupt_->data},
                {"created_at", format_timestamp(interrupt_->created_at)},
                {"expires_at", detail::optional_timestamp(interrupt_->expires_at)}
            };
            if (interrupt_->response) {
                const auto& response = *interrupt_->response;
                Value response_json = {{"received_at", format_timestamp(response.received_at)}};
                if (response.text) response_json["text"] = *response.text;
                if (response.approved) response_json["approved"] = *response.approved;
                if (response.decision) response_json["decision"] = *response.decision;
                if (!response.data.is_null()) response_json["data"] = response.data;
                interrupt_json["response"] = std::move(response_json);
            } else {
                interrupt_json["response"] = nullptr;
            }
        }

        return Value{
            {"envelope_id", envelope_id},
            {"request_id", request_id},
            {"user_id", user_id},
            {"session_id", session_id},
            {"raw_input", raw_input},
            {"received_at", format_timestamp(received_at)},
            {"created_at", format_timestamp(created_at)},
            {"completed_at", detail::optional_timestamp(completed_at_)},
            {"outputs", std::move(outputs_json)},
            {"current_stage", current_stage},
            {"stage_order", stage_order},
            {"iteration", iteration_},
            {"max_iterations", max_iterations},
            {"llm_call_count", llm_call_count_},
            {"max_llm_calls", max_llm_calls},
            {"agent_hop_count", agent_hop_count_},
            {"max_agent_hops", max_agent_hops},
            {"terminal_reason", terminal_reason_ ? Value(terminal_reason_to_string(*terminal_reason_)) : Value(nullptr)},
            {"active_stages", active_stages_},
            {"completed_stage_set", completed_stage_set_},
            {"failed_stages", failed_stages_},
            {"parallel_mode", parallel_mode},
            {"terminated", terminated_},
            {"termination_reason", detail::optional_string(termination_reason_)},
            {"interrupt_pending", interrupt_pending_},
            {"interrupt", std::move(interrupt_json)},
            {"all_goals", all_goals},
            {"remaining_goals", remaining_goals},
            {"goal_completion_status", goal_completion_status},
            {"completed_stages", completed_stages},
            {"current_stage_number", current_stage_number},
            {"max_stages", max_stages},
            {"prior_plans", prior_plans},
            {"loop_feedback", loop_feedback},
            {"processing_history", std::move(history)},
            {"errors", errors},
            {"metadata", metadata}
        };
    }

    /**
     * @brief Rebuilds an envelope from to_state_dict() output.
     *
     * Absent keys keep their defaults; present keys of the wrong shape fail
     * with StateDecodeFailed.
     */
    static Expected<Envelope> from_state_dict(const Value& state) {
        Envelope env;
        detail::StateReader reader(state, "envelope");

        reader.read("envelope_id", env.envelope_id);
        reader.read("request_id", env.request_id);
        reader.read("user_id", env.user_id);
        reader.read("session_id", env.session_id);
        reader.read("raw_input", env.raw_input);
        reader.read("received_at", env.received_at);
        reader.read("created_at", env.created_at);
        reader.read("completed_at", env.completed_at_);

        if (const Value* outputs_json = reader.find("outputs")) {
            if (outputs_json->is_object()) {
                for (auto it = outputs_json->begin(); it != outputs_json->end(); ++it) {
                    env.outputs[it.key()] = deep_copy(it.value());
                }
            } else {
                reader.fail("outputs", "expected an object");
            }
        }

        reader.read("current_stage", env.current_stage);
        reader.read("stage_order", env.stage_order);
        reader.read("iteration", env.iteration_);
        reader.read("max_iterations", env.max_iterations);
        reader.read("llm_call_count", env.llm_call_count_);
        reader.read("max_llm_calls", env.max_llm_calls);
        reader.read("agent_hop_count", env.agent_hop_count_);
        reader.read("max_agent_hops", env.max_agent_hops);

        std::optional<std::string> terminal;
        reader.read("terminal_reason", terminal);
        if (terminal) {
            env.terminal_reason_ = terminal_reason_from_string(*terminal);
            if (!env.terminal_reason_) reader.fail("terminal_reason", "unknown value '" + *terminal + "'");
        }

        reader.read("active_stages", env.active_stages_);
        reader.read("completed_stage_set", env.completed_stage_set_);
        reader.read("failed_stages", env.failed_stages_);
        reader.read("parallel_mode", env.parallel_mode);
        reader.read("terminated", env.terminated_);
        reader.read("termination_reason", env.termination_reason_);
        reader.read("interrupt_pending", env.interrupt_pending_);

        if (const Value* interrupt_json = reader.find("interrupt")) {
            auto flow = decode_interrupt(*interrupt_json);
            if (!flow) return tl::unexpected(flow.error());
            env.interrupt_ = std::move(*flow);
        }

        reader.read("all_goals", env.all_goals);
        reader.read("remaining_goals", env.remaining_goals);
        reader.read("goal_completion_status", env.goal_completion_status);
        reader.read("completed_stages", env.completed_stages);
        reader.read("current_stage_number", env.current_stage_number);
        reader.read("max_stages", env.max_stages);
        reader.read("prior_plans", env.prior_plans);
        reader.read("loop_feedback", env.loop_feedback);
        reader.read("errors", env.errors);

        if (const Value* history = reader.find("processing_history")) {
            if (!history->is_array()) {
                reader.fail("processing_history", "expected an array");
            } else {
                for (const auto& item : *history) {
                    auto record = processing_record_from_json(item);
                    if (!record) return tl::unexpected(record.error());
                    env.processing_history_.push_back(std::move(*record));
                }
            }
        }

        if (const Value* meta = reader.find("metadata")) {
            if (meta->is_object()) env.metadata = deep_copy(*meta);
            else reader.fail("metadata", "expected an object");
        }

        if (reader.error()) {
            return tl::unexpected(*reader.error());
        }
        return env;
    }

    bool operator==(const Envelope& other) const {
        return envelope_id == other.envelope_id &&
               request_id == other.request_id &&
               user_id == other.user_id &&
               session_id == other.session_id &&
               raw_input == other.raw_input &&
               received_at == other.received_at &&
               created_at == other.created_at &&
               outputs == other.outputs &&
               current_stage == other.current_stage &&
               stage_order == other.stage_order &&
               max_iterations == other.max_iterations &&
               max_llm_calls == other.max_llm_calls &&
               max_agent_hops == other.max_agent_hops &&
               parallel_mode == other.parallel_mode &&
               all_goals == other.all_goals &&
               remaining_goals == other.remaining_goals &&
               goal_completion_status == other.goal_completion_status &&
               completed_stages == other.completed_stages &&
               current_stage_number == other.current_stage_number &&
               max_stages == other.max_stages &&
               prior_plans == other.prior_plans &&
               loop_feedback == other.loop_feedback &&
               errors == other.errors &&
               metadata == other.metadata &&
               iteration_ == other.iteration_ &&
               llm_call_count_ == other.llm_call_count_ &&
               agent_hop_count_ == other.agent_hop_count_ &&
               terminal_reason_ == other.terminal_reason_ &&
               terminated_ == other.terminated_ &&
               termination_reason_ == other.termination_reason_ &&
               completed_at_ == other.completed_at_ &&
               interrupt_pending_ == other.interrupt_pending_ &&
               interrupt_ == other.interrupt_ &&
               active_stages_ == other.active_stages_ &&
               completed_stage_set_ == other.completed_stage_set_ &&
               failed_stages_ == other.failed_stages_ &&
               processing_history_ == other.processing_history_;
    }

    bool operator!=(const Envelope& other) const {
        return !(*this == other);
    }

private:
    static Expected<FlowInterrupt> decode_interrupt(const Value& value) {
        FlowInterrupt flow;
        detail::StateReader reader(value, "interrupt");

        std::string kind;
        reader.read("kind", kind);
        if (auto parsed = interrupt_kind_from_string(kind)) {
            flow.kind = *parsed;
        } else {
            reader.fail("kind", "unknown interrupt kind '" + kind + "'");
        }
        reader.read("id", flow.id);
        reader.read("question", flow.question);
        reader.read("message", flow.message);
        reader.read_any("data", flow.data);
        reader.read("created_at", flow.created_at);
        reader.read("expires_at", flow.expires_at);

        if (const Value* response_json = reader.find("response")) {
            InterruptResponse response;
            detail::StateReader response_reader(*response_json, "interrupt.response");
            response_reader.read("text", response.text);
            response_reader.read("approved", response.approved);
            response_reader.read("decision", response.decision);
            response_reader.read_any("data", response.data);
            response_reader.read("received_at", response.received_at);
            if (response_reader.error()) {
                return tl::unexpected(*response_reader.error());
            }
            flow.response = std::move(response);
        }

        if (reader.error()) {
            return tl::unexpected(*reader.error());
        }
        return flow;
    }

    int iteration_ = 0;
    int llm_call_count_ = 0;
    int agent_hop_count_ = 0;
    std::optional<TerminalReason> terminal_reason_;

    bool terminated_ = false;
    std::optional<std::string> termination_reason_;
    std::optional<Timestamp> completed_at_;

    bool interrupt_pending_ = false;
    std::optional<FlowInterrupt> interrupt_;

    std::set<std::string> active_stages_;
    std::set<std::string> completed_stage_set_;
    std::map<std::string, std::string> failed_stages_;

    std::vector<ProcessingRecord> processing_history_;
};

} // namespace conductor
