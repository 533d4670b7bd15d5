#pragma once

#include "types.hpp"
#include "agent.hpp"
#include "cancellation.hpp"
#include "config.hpp"
#include "envelope.hpp"
#include "engine/stage_stream.hpp"
#include "providers/interface.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace conductor {

/// Resolves the LLM provider for a model role ("default" when the agent sets none).
using LlmProviderFactory = std::function<std::shared_ptr<providers::ILLMProvider>(const std::string& role)>;

/** @brief Collaborators shared by every agent of a pipeline. */
struct RuntimeDependencies {
    LlmProviderFactory llm_factory;
    std::shared_ptr<providers::IToolExecutor> tools;
    std::shared_ptr<providers::IPromptRegistry> prompts;
    std::shared_ptr<providers::ILogger> logger;
    std::shared_ptr<providers::IPersistenceAdapter> persistence;
    std::shared_ptr<providers::IEventContext> events;
    std::shared_ptr<providers::IMetricsCollector> metrics;
    bool use_mock = false;
    std::map<std::string, AgentHooks> hooks;   ///< Keyed by agent name
};

/** @brief Per-call options for Runtime::execute(). */
struct RunOptions {
    std::optional<RunMode> mode;                   ///< Pipeline default when unset
    std::string thread_id;                         ///< Empty disables persistence
    CancellationToken cancel;
    std::shared_ptr<engine::StageStream> stream;   ///< Receives stage outputs when set
};

/** @brief Handle for a run executing on a background thread. */
struct StreamingRun {
    std::shared_ptr<engine::StageStream> stream;
    std::future<Expected<Envelope>> result;
};

// ============================================================================
// Runtime
// ============================================================================

/**
 * @brief State machine driving an Envelope through a pipeline's agents.
 *
 * One instance per PipelineConfig. Agents are built once at creation; the
 * Runtime keeps no per-run state, so independent envelopes may be executed
 * concurrently.
 *
 * Example:
 * @code
 * RuntimeDependencies deps;
 * deps.llm_factory = [&](const std::string&) { return provider; };
 * deps.logger = logging::SpdlogLogger::create();
 *
 * auto runtime = Runtime::create(pipeline, deps);
 * if (!runtime) {
 *     std::cerr << runtime.error().to_string() << std::endl;
 *     return 1;
 * }
 *
 * auto env = Envelope::create("Summarize the release notes");
 * if (auto done = (*runtime)->run(env); !done) {
 *     std::cerr << done.error().to_string() << std::endl;
 * }
 * @endcode
 */
class Runtime {
public:
    /**
     * @brief Validate the pipeline and build its agents.
     *
     * @return Runtime, or the first configuration / MissingCapability error
     */
    static Expected<std::unique_ptr<Runtime>> create(PipelineConfig config, RuntimeDependencies deps) {
        if (auto valid = config.validate(); !valid) {
            return tl::unexpected(valid.error());
        }
        if (!deps.logger) {
            deps.logger = std::make_shared<providers::NullLogger>();
        }
        auto logger = deps.logger->bind(Value{{"pipeline", config.name}});

        std::map<std::string, std::unique_ptr<Agent>> agents;
        Value names = Value::array();
        for (const auto& agent_config : config.agents) {
            AgentCapabilities caps;
            if (agent_config.has_llm && deps.llm_factory) {
                caps.llm = deps.llm_factory(agent_config.model_role.empty() ? "default" : agent_config.model_role);
            }
            caps.tools = deps.tools;
            caps.prompts = deps.prompts;
            caps.events = deps.events;
            caps.metrics = deps.metrics;
            caps.logger = logger;

            AgentHooks hooks;
            if (auto it = deps.hooks.find(agent_config.name); it != deps.hooks.end()) {
                hooks = it->second;
            }

            auto agent = Agent::create(agent_config, std::move(caps), std::move(hooks),
                                       deps.use_mock, config.default_timeout_seconds);
            if (!agent) {
                return tl::unexpected(agent.error());
            }
            names.push_back(agent_config.name);
            agents.emplace(agent_config.name, std::move(*agent));
        }

        logger->info("runtime_agents_built", Value{
            {"agent_count", agents.size()},
            {"agents", names}
        });

        return std::unique_ptr<Runtime>(
            new Runtime(std::move(config), std::move(deps), std::move(logger), std::move(agents)));
    }

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    const PipelineConfig& config() const { return config_; }

    /** @brief Agent bound to a stage, or nullptr. */
    const Agent* get_agent(const std::string& stage) const {
        auto it = agents_.find(stage);
        return it == agents_.end() ? nullptr : it->second.get();
    }

    /**
     * @brief Drive the envelope until it ends, pauses or exhausts a bound.
     *
     * A fresh envelope (current stage "start") is initialized from the
     * pipeline: stage order, first stage and bounds. Otherwise execution
     * continues from the envelope's current stage.
     *
     * Termination, bound exhaustion and interrupts are normal outcomes and
     * visible on the envelope. When a stream is given it always receives the
     * end marker and is closed.
     *
     * @return Success, or RequestCancelled / RequestTimeout. The envelope
     *         keeps every completed stage and marks the aborted one failed.
     */
    Expected<void> execute(Envelope& env, const RunOptions& options = {}) {
        const RunMode mode = options.mode.value_or(config_.default_run_mode);
        initialize_envelope(env);
        if (mode == RunMode::Parallel) {
            env.parallel_mode = true;
        }

        const auto started = std::chrono::steady_clock::now();
        logger_->info(mode == RunMode::Parallel ? "pipeline_parallel_started" : "pipeline_started", Value{
            {"envelope_id", env.envelope_id},
            {"request_id", env.request_id},
            {"mode", run_mode_to_string(mode)},
            {"stream", static_cast<bool>(options.stream)},
            {"current_stage", env.current_stage},
            {"stage_order", env.stage_order}
        });

        Expected<void> outcome = mode == RunMode::Parallel
            ? run_parallel_core(env, options)
            : run_sequential_core(env, options);

        persist(env, options.thread_id);
        close_stream(options, env, outcome);

        const int64_t duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        const std::string status = !outcome ? "error"
            : env.interrupt_pending() ? "interrupted"
            : env.terminal_reason() == TerminalReason::Completed ? "success"
            : "terminated";
        if (deps_.metrics) {
            deps_.metrics->record_pipeline_execution(config_.name, status, duration_ms);
        }

        Value fields = {
            {"envelope_id", env.envelope_id},
            {"request_id", env.request_id},
            {"final_stage", env.current_stage},
            {"terminated", env.terminated()},
            {"status", status},
            {"duration_ms", duration_ms}
        };
        if (env.terminal_reason()) {
            fields["terminal_reason"] = terminal_reason_to_string(*env.terminal_reason());
        }
        logger_->info(mode == RunMode::Parallel ? "pipeline_parallel_completed" : "pipeline_completed", fields);
        return outcome;
    }

    Expected<void> run(Envelope& env, const std::string& thread_id = "",
                       const CancellationToken& cancel = CancellationToken()) {
        RunOptions options;
        options.mode = RunMode::Sequential;
        options.thread_id = thread_id;
        options.cancel = cancel;
        return execute(env, options);
    }

    Expected<void> run_parallel(Envelope& env, const std::string& thread_id = "",
                                const CancellationToken& cancel = CancellationToken()) {
        RunOptions options;
        options.mode = RunMode::Parallel;
        options.thread_id = thread_id;
        options.cancel = cancel;
        return execute(env, options);
    }

    /**
     * @brief Execute on a background thread, streaming stage outputs.
     *
     * The returned future yields the final envelope, or the abort error.
     * Destroying the future waits for the run to finish.
     */
    StreamingRun run_with_stream(Envelope env, RunOptions options = {}) {
        auto stream = std::make_shared<engine::StageStream>();
        options.stream = stream;

        StreamingRun handle;
        handle.stream = stream;
        handle.result = std::async(std::launch::async,
            [this, env = std::move(env), options = std::move(options)]() mutable -> Expected<Envelope> {
                auto outcome = execute(env, options);
                if (!outcome) {
                    return tl::unexpected(outcome.error());
                }
                return std::move(env);
            });
        return handle;
    }

    /**
     * @brief Answer the pending interrupt and continue the run.
     *
     * A confirmation that is not explicitly approved terminates the run.
     * Otherwise execution restarts at the stage configured for the
     * interrupt's kind, in the envelope's original mode.
     *
     * An attached stream is closed with the end marker on every path.
     *
     * @return NoPendingInterrupt, InvalidEnvelopeState for a terminated
     *         envelope, ResumeStageNotConfigured, or the result of the
     *         continued execution
     */
    Expected<void> resume(Envelope& env, InterruptResponse response, RunOptions options = {}) {
        if (!env.has_pending_interrupt()) {
            return reject_resume(env, options, Error{
                ErrorCode::NoPendingInterrupt,
                "No pending interrupt to resume",
                env.envelope_id
            });
        }
        if (env.terminated()) {
            return reject_resume(env, options, Error{
                ErrorCode::InvalidEnvelopeState,
                "Cannot resume a terminated envelope",
                env.envelope_id
            });
        }

        const InterruptKind kind = env.interrupt()->kind;

        if (kind == InterruptKind::Confirmation && response.approved != true) {
            env.resolve_interrupt(std::move(response));
            env.terminate("User denied confirmation");
            logger_->info("pipeline_resumed", Value{
                {"envelope_id", env.envelope_id},
                {"interrupt_kind", interrupt_kind_to_string(kind)},
                {"approved", false}
            });
            persist(env, options.thread_id);
            close_stream(options, env, Expected<void>{});
            return {};
        }

        auto resume_stage = config_.get_resume_stage(kind);
        if (!resume_stage) {
            return reject_resume(env, options, Error{
                ErrorCode::ResumeStageNotConfigured,
                std::string("No resume stage configured for interrupt kind ") + interrupt_kind_to_string(kind),
                config_.name
            });
        }

        env.resolve_interrupt(std::move(response));
        env.current_stage = *resume_stage;
        if (env.parallel_mode) {
            for (const auto& stage : stage_with_dependents(*resume_stage)) {
                env.reset_stage(stage);
            }
        }

        logger_->info("pipeline_resumed", Value{
            {"envelope_id", env.envelope_id},
            {"interrupt_kind", interrupt_kind_to_string(kind)},
            {"resume_stage", *resume_stage}
        });

        options.mode = env.parallel_mode ? RunMode::Parallel : RunMode::Sequential;
        return execute(env, options);
    }

    /**
     * @brief Run one named agent against the envelope, outside the state machine.
     *
     * Stage status sets are updated; routing is reported but not followed.
     */
    Expected<AgentResult> execute_single_agent(const std::string& agent_name, Envelope& env,
                                               const CancellationToken& cancel = CancellationToken()) {
        auto it = agents_.find(agent_name);
        if (it == agents_.end()) {
            return tl::unexpected(Error{ErrorCode::UnknownStage, "Unknown agent: " + agent_name, agent_name});
        }

        env.start_stage(agent_name);
        auto result = it->second->process(env, cancel);
        if (!result) {
            env.fail_stage(agent_name, result.error().message);
        } else if (result->failed) {
            env.fail_stage(agent_name, result->error ? result->error->message : "agent failed");
        } else {
            env.complete_stage(agent_name);
        }
        return result;
    }

    /** @brief Persisted state dict for a thread; nullopt when absent or no store is configured. */
    Expected<std::optional<Value>> get_state(const std::string& thread_id) {
        if (!deps_.persistence) {
            return std::optional<Value>{};
        }
        return deps_.persistence->load_state(thread_id);
    }

    /** @brief Decoded envelope for a thread, or StateNotFound. */
    Expected<Envelope> load_envelope(const std::string& thread_id) {
        auto state = get_state(thread_id);
        if (!state) {
            return tl::unexpected(state.error());
        }
        if (!state->has_value()) {
            return tl::unexpected(Error{ErrorCode::StateNotFound, "No state stored for thread", thread_id});
        }
        return Envelope::from_state_dict(**state);
    }

private:
    Runtime(PipelineConfig config, RuntimeDependencies deps, std::shared_ptr<providers::ILogger> logger,
            std::map<std::string, std::unique_ptr<Agent>> agents)
        : config_(std::move(config))
        , deps_(std::move(deps))
        , logger_(std::move(logger))
        , agents_(std::move(agents))
    {}

    void initialize_envelope(Envelope& env) const {
        if (env.stage_order.empty()) {
            env.stage_order = config_.get_stage_order();
        }
        if (env.current_stage.empty() || env.current_stage == "start") {
            env.current_stage = env.stage_order.empty() ? std::string(kEndStage) : env.stage_order.front();
            env.max_iterations = config_.max_iterations;
            env.max_llm_calls = config_.max_llm_calls;
            env.max_agent_hops = config_.max_agent_hops;
        }
    }

    /**
     * @brief Shared pre-dispatch gate.
     *
     * @return true when dispatch must stop. Bound exhaustion terminates the
     *         envelope with the reason reported by can_continue().
     */
    bool should_stop(Envelope& env) {
        if (env.can_continue()) {
            return false;
        }
        if (env.terminated()) {
            return true;
        }
        if (env.interrupt_pending()) {
            Value fields = {{"envelope_id", env.envelope_id}, {"stage", env.current_stage}};
            if (auto kind = env.interrupt_kind()) {
                fields["interrupt_kind"] = interrupt_kind_to_string(*kind);
            }
            logger_->info("pipeline_interrupt", fields);
            return true;
        }

        const TerminalReason reason = env.terminal_reason().value_or(TerminalReason::MaxIterationsExceeded);
        logger_->warn("pipeline_bounds_exceeded", Value{
            {"envelope_id", env.envelope_id},
            {"terminal_reason", terminal_reason_to_string(reason)},
            {"iteration", env.iteration()},
            {"llm_call_count", env.llm_call_count()},
            {"agent_hop_count", env.agent_hop_count()}
        });
        env.terminate(std::string("Bounds exceeded: ") + terminal_reason_to_string(reason), reason);
        return true;
    }

    // ------------------------------------------------------------------------
    // Sequential mode
    // ------------------------------------------------------------------------

    Expected<void> run_sequential_core(Envelope& env, const RunOptions& options) {
        std::map<std::pair<std::string, std::string>, int> edge_traversals;

        while (true) {
            // A stage may raise an interrupt and still route to the end.
            if (env.current_stage == kEndStage && !env.interrupt_pending()) {
                if (!env.terminated()) {
                    env.terminate("completed", TerminalReason::Completed);
                }
                return {};
            }
            if (should_stop(env)) {
                return {};
            }
            if (auto stop = options.cancel.check()) {
                log_cancelled(env, *stop);
                return tl::unexpected(*stop);
            }

            const std::string stage = env.current_stage;
            auto agent_it = agents_.find(stage);
            if (agent_it == agents_.end()) {
                logger_->error("pipeline_unknown_stage", Value{
                    {"envelope_id", env.envelope_id},
                    {"stage", stage}
                });
                env.terminate("Unknown stage: " + stage, TerminalReason::ToolFailedFatally);
                return {};
            }

            env.start_stage(stage);
            auto result = agent_it->second->process(env, options.cancel);
            if (!result) {
                env.fail_stage(stage, result.error().message);
                publish(options, engine::StageOutput{stage, Value(nullptr), result.error()});
                log_cancelled(env, result.error());
                return tl::unexpected(result.error());
            }

            if (result->failed) {
                env.fail_stage(stage, result->error->message);
                logger_->error("pipeline_agent_error", Value{
                    {"envelope_id", env.envelope_id},
                    {"agent", stage},
                    {"error", result->error->message},
                    {"next_stage", result->next_stage}
                });
            } else {
                env.complete_stage(stage);
            }

            publish(options, engine::StageOutput{stage, result->output, result->error});
            logger_->debug("stage_completed", Value{
                {"envelope_id", env.envelope_id},
                {"stage", stage},
                {"next_stage", result->next_stage}
            });

            const std::string& next = result->next_stage;
            if (next != kEndStage) {
                const int limit = config_.get_edge_limit(stage, next);
                const int traversals = ++edge_traversals[{stage, next}];
                if (limit > 0 && traversals > limit) {
                    const std::string edge = stage + "->" + next;
                    logger_->warn("edge_limit_exceeded", Value{
                        {"envelope_id", env.envelope_id},
                        {"edge", edge},
                        {"limit", limit},
                        {"traversals", traversals}
                    });
                    env.current_stage = kEndStage;
                    env.terminate("Edge limit exceeded: " + edge, TerminalReason::MaxLoopExceeded);
                    return {};
                }

                if (is_loop_back(env, stage, next)) {
                    env.increment_iteration();
                    logger_->debug("iteration_incremented", Value{
                        {"envelope_id", env.envelope_id},
                        {"iteration", env.iteration()},
                        {"edge", stage + "->" + next}
                    });
                }
            }

            env.current_stage = next;
            persist(env, options.thread_id);
        }
    }

    static bool is_loop_back(const Envelope& env, const std::string& from, const std::string& to) {
        const auto& order = env.stage_order;
        auto from_it = std::find(order.begin(), order.end(), from);
        auto to_it = std::find(order.begin(), order.end(), to);
        return from_it != order.end() && to_it != order.end() && to_it < from_it;
    }

    // ------------------------------------------------------------------------
    // Parallel mode
    // ------------------------------------------------------------------------

    Expected<void> run_parallel_core(Envelope& env, const RunOptions& options) {
        std::mutex env_mutex;

        while (true) {
            if (should_stop(env)) {
                return {};
            }
            if (auto stop = options.cancel.check()) {
                log_cancelled(env, *stop);
                return tl::unexpected(*stop);
            }

            std::vector<std::string> ready;
            for (const auto& stage : config_.get_ready_stages(env.completed_stage_set())) {
                if (!env.is_stage_failed(stage)) {
                    ready.push_back(stage);
                }
            }
            if (ready.empty()) {
                env.current_stage = kEndStage;
                if (env.terminated()) {
                    return {};
                }
                if (auto stranded = stranded_stages(env); env.has_failures() && !stranded.empty()) {
                    std::string failed;
                    for (const auto& [stage, error] : env.failed_stages()) {
                        failed += (failed.empty() ? "" : ", ") + stage;
                    }
                    logger_->error("pipeline_stage_failures", Value{
                        {"envelope_id", env.envelope_id},
                        {"failed_stages", failed},
                        {"unrun_stages", stranded}
                    });
                    env.terminate("Stage failures: " + failed, TerminalReason::ToolFailedFatally);
                    return {};
                }
                env.terminate("completed", TerminalReason::Completed);
                return {};
            }

            const int hop_budget = env.max_agent_hops - env.agent_hop_count();
            if (hop_budget > 0 && ready.size() > static_cast<size_t>(hop_budget)) {
                ready.resize(static_cast<size_t>(hop_budget));
            }
            // Stages cut here stay ready and run in a later round.
            if (config_.max_parallel > 0 && ready.size() > static_cast<size_t>(config_.max_parallel)) {
                ready.resize(static_cast<size_t>(config_.max_parallel));
            }

            logger_->debug("parallel_batch", Value{
                {"envelope_id", env.envelope_id},
                {"ready_stages", ready},
                {"completed", env.completed_stage_count()}
            });

            struct Branch {
                std::string stage;
                Agent* agent;
                Envelope env;
                Envelope::BranchBaseline base;
            };
            std::vector<Branch> branches;
            branches.reserve(ready.size());
            for (const auto& stage : ready) {
                Branch branch{stage, agents_.at(stage).get(), env.clone(), env.baseline()};
                branch.env.current_stage = stage;
                branches.push_back(std::move(branch));
                env.start_stage(stage);
            }

            std::vector<std::future<Expected<AgentResult>>> futures;
            futures.reserve(branches.size());
            for (auto& branch : branches) {
                futures.push_back(std::async(std::launch::async, [&branch, &env, &env_mutex, &options]() {
                    auto result = branch.agent->process(branch.env, options.cancel);
                    {
                        std::lock_guard<std::mutex> lock(env_mutex);
                        if (!result) {
                            env.fail_stage(branch.stage, result.error().message);
                        } else if (result->failed) {
                            env.fail_stage(branch.stage, result->error->message);
                        } else {
                            env.complete_stage(branch.stage);
                        }
                    }
                    if (options.stream) {
                        options.stream->push(result
                            ? engine::StageOutput{branch.stage, result->output, result->error}
                            : engine::StageOutput{branch.stage, Value(nullptr), result.error()});
                    }
                    return result;
                }));
            }

            std::vector<Expected<AgentResult>> results;
            results.reserve(futures.size());
            for (auto& future : futures) {
                results.push_back(future.get());
            }

            std::optional<Error> abort;
            for (size_t i = 0; i < branches.size(); ++i) {
                const auto& result = results[i];
                const Branch& branch = branches[i];
                env.merge_branch(branch.env, branch.agent->config().effective_output_key(), branch.base);

                if (!result) {
                    if (!abort) abort = result.error();
                    continue;
                }
                if (result->failed) {
                    logger_->error("pipeline_agent_error", Value{
                        {"envelope_id", env.envelope_id},
                        {"agent", branch.stage},
                        {"error", result->error->message}
                    });
                }
                logger_->debug("stage_completed", Value{
                    {"envelope_id", env.envelope_id},
                    {"stage", branch.stage}
                });
            }

            persist(env, options.thread_id);

            if (abort) {
                log_cancelled(env, *abort);
                return tl::unexpected(*abort);
            }
        }
    }

    /** @brief Stages that neither completed nor failed. */
    std::vector<std::string> stranded_stages(const Envelope& env) const {
        std::vector<std::string> stranded;
        for (const auto& stage : config_.get_stage_order()) {
            if (!env.is_stage_completed(stage) && !env.is_stage_failed(stage)) {
                stranded.push_back(stage);
            }
        }
        return stranded;
    }

    /** @brief The stage plus everything that transitively depends on it. */
    std::set<std::string> stage_with_dependents(const std::string& stage) const {
        std::set<std::string> result{stage};
        std::vector<std::string> pending{stage};
        while (!pending.empty()) {
            const std::string current = pending.back();
            pending.pop_back();
            for (const auto& dependent : config_.get_dependents(current)) {
                if (result.insert(dependent).second) {
                    pending.push_back(dependent);
                }
            }
        }
        return result;
    }

    // ------------------------------------------------------------------------
    // Side channels
    // ------------------------------------------------------------------------

    /** @brief Pushes the end marker and closes the stream, if one is attached. */
    static void close_stream(const RunOptions& options, const Envelope& env, const Expected<void>& outcome) {
        if (!options.stream) {
            return;
        }
        engine::StageOutput end_marker{kStreamEndMarker, Value{{"terminated", env.terminated()}}, std::nullopt};
        if (!outcome) {
            end_marker.error = outcome.error();
        }
        options.stream->push(std::move(end_marker));
        options.stream->close();
    }

    Expected<void> reject_resume(const Envelope& env, const RunOptions& options, Error error) {
        logger_->warn("pipeline_resume_rejected", Value{
            {"envelope_id", env.envelope_id},
            {"error", error.message}
        });
        Expected<void> outcome = tl::unexpected(std::move(error));
        close_stream(options, env, outcome);
        return outcome;
    }

    static void publish(const RunOptions& options, engine::StageOutput item) {
        if (options.stream) {
            options.stream->push(std::move(item));
        }
    }

    void persist(const Envelope& env, const std::string& thread_id) {
        if (!deps_.persistence || thread_id.empty()) {
            return;
        }
        if (auto saved = deps_.persistence->save_state(thread_id, env.to_state_dict()); !saved) {
            logger_->warn("state_persist_error", Value{
                {"thread_id", thread_id},
                {"error", saved.error().message}
            });
        }
    }

    void log_cancelled(const Envelope& env, const Error& error) {
        logger_->info("pipeline_cancelled", Value{
            {"envelope_id", env.envelope_id},
            {"stage", env.current_stage},
            {"reason", error_code_name(error.code)},
            {"completed_stages", env.completed_stage_count()}
        });
    }

    PipelineConfig config_;
    RuntimeDependencies deps_;
    std::shared_ptr<providers::ILogger> logger_;
    std::map<std::string, std::unique_ptr<Agent>> agents_;
};

} // namespace conductor
