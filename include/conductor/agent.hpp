#pragma once

#include "types.hpp"
#include "cancellation.hpp"
#include "config.hpp"
#include "envelope.hpp"
#include "engine/json_extractor.hpp"
#include "providers/interface.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace conductor {

/** @brief Collaborators an agent may call. Null members are simply absent. */
struct AgentCapabilities {
    std::shared_ptr<providers::ILLMProvider> llm;
    std::shared_ptr<providers::IToolExecutor> tools;
    std::shared_ptr<providers::IPromptRegistry> prompts;
    std::shared_ptr<providers::IEventContext> events;
    std::shared_ptr<providers::IMetricsCollector> metrics;
    std::shared_ptr<providers::ILogger> logger;
};

/// Runs before the main processing; may mutate the envelope or reject the stage.
using PreProcessHook = std::function<Expected<void>(Envelope&, const AgentConfig&)>;

/// Runs after the output is stored; may inspect the envelope and reject the stage.
using PostProcessHook = std::function<Expected<void>(Envelope&, const Value& output)>;

/// Replaces the main processing when mock mode is enabled.
using MockHandler = std::function<Expected<Value>(const Envelope&)>;

struct AgentHooks {
    PreProcessHook pre_process;
    PostProcessHook post_process;
    MockHandler mock_handler;
};

/** @brief Outcome of one Agent::process() call. */
struct AgentResult {
    std::string next_stage;            ///< Routing target (kEndStage to finish)
    Value output = Value::object();    ///< Produced output, or the error payload when failed
    bool failed = false;               ///< True when a recoverable failure occurred
    std::optional<Error> error;        ///< The recoverable failure, if any
};

// ============================================================================
// Agent
// ============================================================================

/**
 * @brief Single processing unit bound to one AgentConfig.
 *
 * Mode is chosen on every call, first match wins:
 * 1. mock handler (only when mock mode is enabled)
 * 2. LLM when `has_llm`
 * 3. tools when `has_tools`
 * 4. service passthrough, producing an empty object
 *
 * Lifecycle per call: record start, pre-process hook, main processing,
 * required-field validation, store output, post-process hook, routing,
 * record completion. Lifecycle events are emitted around the whole call.
 *
 * An Agent holds no per-run state, so one instance may process several
 * envelopes concurrently provided its collaborators are thread-safe.
 */
class Agent {
public:
    /**
     * @brief Factory method to create an Agent
     *
     * @param config Agent configuration (validated here)
     * @param capabilities Collaborators; `llm` is required for LLM agents and
     *        `tools` for tool agents
     * @param hooks Optional hooks
     * @param use_mock Route processing through `hooks.mock_handler` when set
     * @param default_timeout_seconds Stage timeout when the config sets none (0 = none)
     * @return Expected<std::unique_ptr<Agent>> Agent or MissingCapability / config error
     */
    static Expected<std::unique_ptr<Agent>> create(
        AgentConfig config,
        AgentCapabilities capabilities,
        AgentHooks hooks = {},
        bool use_mock = false,
        int default_timeout_seconds = 0
    ) {
        if (auto result = config.validate(); !result) {
            return tl::unexpected(result.error());
        }
        if (config.has_llm && !capabilities.llm) {
            return tl::unexpected(Error{
                ErrorCode::MissingCapability,
                "Agent '" + config.name + "' has_llm but no LLM provider was supplied",
                config.name
            });
        }
        if (config.has_tools && !capabilities.tools) {
            return tl::unexpected(Error{
                ErrorCode::MissingCapability,
                "Agent '" + config.name + "' has_tools but no tool executor was supplied",
                config.name
            });
        }

        if (!capabilities.logger) {
            capabilities.logger = std::make_shared<providers::NullLogger>();
        }
        capabilities.logger = capabilities.logger->bind(Value{{"agent", config.name}});

        return std::unique_ptr<Agent>(
            new Agent(std::move(config), std::move(capabilities), std::move(hooks), use_mock, default_timeout_seconds));
    }

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    const std::string& name() const { return config_.name; }
    const AgentConfig& config() const { return config_; }
    bool uses_mock() const { return use_mock_ && static_cast<bool>(hooks_.mock_handler); }

    /**
     * @brief Run this agent against the envelope.
     *
     * Recoverable failures (LLM, parsing, validation, hooks) are recorded in
     * the envelope and reported through AgentResult::failed.
     *
     * @return AgentResult, or RequestCancelled / RequestTimeout when the call
     *         was aborted. An aborted stage is still recorded as an error.
     */
    Expected<AgentResult> process(Envelope& env, const CancellationToken& cancel) {
        const auto started = std::chrono::steady_clock::now();
        const std::string& agent = config_.name;

        env.record_agent_start(agent, stage_index(env));
        emit_started();
        logger_->info(agent + "_started", Value{
            {"envelope_id", env.envelope_id},
            {"iteration", env.iteration()}
        });

        const CancellationToken token = stage_timeout_.count() > 0 ? cancel.child(stage_timeout_) : cancel;
        int llm_calls = 0;
        auto outcome = run_lifecycle(env, token, llm_calls);
        const int64_t duration_ms = elapsed_ms(started);

        if (!outcome) {
            const Error& err = outcome.error();
            if (err.is_abort()) {
                env.record_agent_complete(agent, "error", err.message, llm_calls, duration_ms);
                logger_->warn(agent + "_error", Value{
                    {"envelope_id", env.envelope_id},
                    {"error", err.message},
                    {"error_type", error_code_name(err.code)}
                });
                finish("error", duration_ms, err);
                return tl::unexpected(err);
            }
            return handle_failure(env, err, llm_calls, duration_ms);
        }

        AgentResult result;
        result.output = std::move(*outcome);
        result.next_stage = route(result.output);

        env.record_agent_complete(agent, "success", std::nullopt, llm_calls, duration_ms);
        logger_->debug(agent + "_routing", Value{{"next_stage", result.next_stage}});
        logger_->info(agent + "_completed", Value{
            {"envelope_id", env.envelope_id},
            {"next_stage", result.next_stage},
            {"duration_ms", duration_ms},
            {"llm_calls", llm_calls}
        });
        finish("success", duration_ms, std::nullopt);
        return result;
    }

    /**
     * @brief Next stage for an output.
     *
     * The first rule whose condition field equals its value wins, then
     * `default_next`, then kEndStage.
     */
    std::string route(const Value& output) const {
        if (output.is_object()) {
            for (const auto& rule : config_.routing_rules) {
                auto it = output.find(rule.condition);
                if (it != output.end() && *it == rule.value) {
                    return rule.target;
                }
            }
        }
        if (!config_.default_next.empty()) {
            return config_.default_next;
        }
        return kEndStage;
    }

    /** @brief Whether this agent's access level and allow-list permit the tool. */
    bool can_use_tool(const std::string& tool) const {
        switch (config_.tool_access) {
            case ToolAccess::None:
                return false;
            case ToolAccess::All:
                return true;
            case ToolAccess::Read:
            case ToolAccess::Write:
                return config_.allowed_tools.empty() || config_.allowed_tools.count(tool) > 0;
        }
        return false;
    }

private:
    Agent(AgentConfig config, AgentCapabilities capabilities, AgentHooks hooks, bool use_mock,
          int default_timeout_seconds)
        : config_(std::move(config))
        , caps_(std::move(capabilities))
        , hooks_(std::move(hooks))
        , logger_(caps_.logger)
        , use_mock_(use_mock)
        , stage_timeout_(std::chrono::seconds(
              config_.timeout_seconds > 0 ? config_.timeout_seconds : std::max(0, default_timeout_seconds)))
    {}

    Expected<Value> run_lifecycle(Envelope& env, const CancellationToken& token, int& llm_calls) {
        if (auto stop = token.check()) {
            return tl::unexpected(*stop);
        }

        if (hooks_.pre_process) {
            if (auto hook = hooks_.pre_process(env, config_); !hook) {
                return tl::unexpected(hook.error());
            }
        }

        auto produced = run_mode(env, token, llm_calls);
        if (!produced) {
            return produced;
        }
        Value output = std::move(*produced);

        if (auto missing = first_missing_field(output)) {
            return tl::unexpected(Error{
                ErrorCode::OutputValidationFailed,
                "Missing required output field: " + *missing,
                config_.name
            });
        }

        env.set_output(config_.effective_output_key(), output);

        if (hooks_.post_process) {
            if (auto hook = hooks_.post_process(env, output); !hook) {
                return tl::unexpected(hook.error());
            }
        }
        return output;
    }

    Expected<Value> run_mode(Envelope& env, const CancellationToken& token, int& llm_calls) {
        if (uses_mock()) {
            return hooks_.mock_handler(env);
        }
        if (config_.has_llm) {
            return process_llm(env, token, llm_calls);
        }
        if (config_.has_tools) {
            return process_tools(env, token);
        }
        return Value::object();
    }

    // ------------------------------------------------------------------------
    // LLM mode
    // ------------------------------------------------------------------------

    Expected<Value> process_llm(const Envelope& env, const CancellationToken& token, int& llm_calls) {
        const std::string prompt = build_prompt(env);
        const std::string model = config_.model_role.empty() ? "default" : config_.model_role;

        Value options = {
            {"num_predict", config_.max_tokens.value_or(kDefaultMaxTokens)},
            {"num_ctx", kDefaultContextSize}
        };
        if (config_.temperature) {
            options["temperature"] = *config_.temperature;
        }

        std::optional<Error> last_error;
        for (int attempt = 0; attempt <= config_.max_retries; ++attempt) {
            if (auto stop = token.check()) {
                return tl::unexpected(*stop);
            }

            ++llm_calls;
            auto text = caps_.llm->generate(model, prompt, options, token);
            if (!text) {
                if (text.error().is_abort()) {
                    return tl::unexpected(text.error());
                }
                last_error = text.error();
                logger_->warn(config_.name + "_llm_error", Value{
                    {"attempt", attempt + 1},
                    {"error", text.error().message}
                });
                continue;
            }

            logger_->debug(config_.name + "_llm_response", Value{
                {"attempt", attempt + 1},
                {"length", text->size()}
            });

            auto parsed = engine::JsonExtractor::extract_object(*text);
            if (parsed) {
                return parsed;
            }
            last_error = parsed.error();
        }
        return tl::unexpected(*last_error);
    }

    std::string build_prompt(const Envelope& env) const {
        if (caps_.prompts && !config_.prompt_key.empty()) {
            Value context = {
                {"raw_input", env.raw_input},
                {"user_id", env.user_id},
                {"session_id", env.session_id}
            };
            for (const auto& [key, value] : env.outputs) {
                context[key] = value;
            }

            auto rendered = caps_.prompts->get(config_.prompt_key, context);
            if (rendered) {
                return *rendered;
            }
            logger_->warn(config_.name + "_prompt_registry_error", Value{
                {"prompt_key", config_.prompt_key},
                {"error", rendered.error().message}
            });
        }
        return "Process this request: " + env.raw_input;
    }

    // ------------------------------------------------------------------------
    // Tool mode
    // ------------------------------------------------------------------------

    Expected<Value> process_tools(const Envelope& env, const CancellationToken& token) {
        Value results = Value::array();
        int64_t total_ms = 0;
        bool all_succeeded = true;

        const Value* plan = env.get_output("plan");
        const Value* steps = nullptr;
        if (plan != nullptr && plan->is_object()) {
            auto it = plan->find("steps");
            if (it != plan->end() && it->is_array()) {
                steps = &*it;
            }
        }

        if (steps != nullptr) {
            for (size_t i = 0; i < steps->size(); ++i) {
                if (auto stop = token.check()) {
                    return tl::unexpected(*stop);
                }

                auto step_result = execute_step((*steps)[i], i, token);
                if (!step_result) {
                    return tl::unexpected(step_result.error());
                }

                const bool ok = (*step_result)["status"] == "success";
                total_ms += (*step_result)["execution_time_ms"].get<int64_t>();
                results.push_back(std::move(*step_result));

                if (!ok) {
                    all_succeeded = false;
                    if (!config_.continue_on_tool_failure) {
                        break;
                    }
                }
            }
        }

        return Value{
            {"results", std::move(results)},
            {"total_time_ms", total_ms},
            {"all_succeeded", all_succeeded}
        };
    }

    // Only an aborted tool call is returned as an error; every other outcome
    // is reported inside the step result.
    Expected<Value> execute_step(const Value& step, size_t index, const CancellationToken& token) {
        const auto started = std::chrono::steady_clock::now();

        std::string tool;
        Value parameters = Value::object();
        std::string step_id = "step_" + std::to_string(index);
        if (step.is_object()) {
            if (auto it = step.find("tool"); it != step.end() && it->is_string()) tool = it->get<std::string>();
            if (auto it = step.find("parameters"); it != step.end() && it->is_object()) parameters = *it;
            if (auto it = step.find("step_id"); it != step.end() && it->is_string()) step_id = it->get<std::string>();
        }

        Value result = {
            {"step_id", step_id},
            {"tool", tool},
            {"parameters", parameters}
        };

        auto fail = [&result](const std::string& message, const char* type) {
            result["status"] = "error";
            result["error"] = Value{{"message", message}, {"type", type}};
        };

        if (tool.empty()) {
            fail("Plan step has no tool name", error_code_name(ErrorCode::InvalidToolArguments));
        } else if (!can_use_tool(tool)) {
            fail("Tool access denied: " + tool, error_code_name(ErrorCode::ToolAccessDenied));
        } else {
            auto executed = caps_.tools->execute(tool, parameters, token);
            if (executed) {
                result["status"] = "success";
                result["data"] = std::move(*executed);
            } else if (executed.error().is_abort()) {
                return tl::unexpected(executed.error());
            } else {
                fail(executed.error().message, error_code_name(executed.error().code));
            }
        }

        result["execution_time_ms"] = elapsed_ms(started);
        if (result["status"] != "success") {
            logger_->warn(config_.name + "_tool_failed", Value{
                {"step_id", step_id},
                {"tool", tool},
                {"error", result["error"]["message"]}
            });
        }
        return result;
    }

    // ------------------------------------------------------------------------
    // Failure handling and bookkeeping
    // ------------------------------------------------------------------------

    AgentResult handle_failure(Envelope& env, const Error& err, int llm_calls, int64_t duration_ms) {
        const std::string& agent = config_.name;
        const char* error_type = error_code_name(err.code);

        env.add_error(agent, err.message, error_type);

        AgentResult result;
        result.failed = true;
        result.error = err;
        result.output = Value{
            {"error", true},
            {"error_message", err.message},
            {"error_type", error_type}
        };

        if (!config_.error_next.empty()) {
            result.next_stage = config_.error_next;
        } else {
            env.set_output(config_.effective_output_key(), result.output);
            result.next_stage = route(result.output);
        }

        env.record_agent_complete(agent, "error", err.message, llm_calls, duration_ms);
        logger_->error(agent + "_error", Value{
            {"envelope_id", env.envelope_id},
            {"error", err.message},
            {"error_type", error_type},
            {"next_stage", result.next_stage}
        });
        finish("error", duration_ms, err);
        return result;
    }

    std::optional<std::string> first_missing_field(const Value& output) const {
        for (const auto& field : config_.required_output_fields) {
            if (!output.is_object() || !output.contains(field)) {
                return field;
            }
        }
        return std::nullopt;
    }

    int stage_index(const Envelope& env) const {
        auto it = std::find(env.stage_order.begin(), env.stage_order.end(), config_.name);
        if (it != env.stage_order.end()) {
            return static_cast<int>(std::distance(env.stage_order.begin(), it));
        }
        return config_.stage_order;
    }

    void emit_started() {
        if (!caps_.events) return;
        if (auto r = caps_.events->emit_agent_started(config_.name); !r) {
            logger_->warn(config_.name + "_event_error", Value{{"error", r.error().message}});
        }
    }

    void finish(const std::string& status, int64_t duration_ms, const std::optional<Error>& error) {
        if (caps_.events) {
            if (auto r = caps_.events->emit_agent_completed(config_.name, status, duration_ms, error); !r) {
                logger_->warn(config_.name + "_event_error", Value{{"error", r.error().message}});
            }
        }
        if (caps_.metrics) {
            caps_.metrics->record_agent_execution(config_.name, status, duration_ms);
        }
    }

    static int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - since).count();
    }

    static constexpr int kDefaultMaxTokens = 2000;
    static constexpr int kDefaultContextSize = 16384;

    AgentConfig config_;
    AgentCapabilities caps_;
    AgentHooks hooks_;
    std::shared_ptr<providers::ILogger> logger_;
    bool use_mock_;
    std::chrono::milliseconds stage_timeout_;
};

} // namespace conductor
