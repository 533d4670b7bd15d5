#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include "conductor/runtime.hpp"
#include "mocks/mock_llm_provider.hpp"
#include "mocks/mock_event_context.hpp"
#include "mocks/mock_persistence.hpp"
#include "mocks/recording_logger.hpp"
#include "fixtures/pipelines.hpp"

using namespace conductor;
using namespace conductor::testing;
using json = nlohmann::json;

class RuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        llm = std::make_shared<MockLLMProvider>();
        logger = std::make_shared<RecordingLogger>();
        metrics = std::make_shared<MockMetricsCollector>();
        store = std::make_shared<MockPersistence>();
    }

    // Makes `stage` produce `produce(n)` on its n-th run (1-based) in mock mode.
    void script(const std::string& stage, std::function<Expected<Value>(int)> produce) {
        hooks[stage].mock_handler = [this, stage, produce](const Envelope&) -> Expected<Value> {
            return produce(bump(stage));
        };
    }

    // Gives every non-LLM agent without a script a default output; LLM agents
    // keep talking to the mock provider.
    void script_all(const PipelineConfig& config) {
        for (const auto& agent : config.agents) {
            if (!agent.has_llm && !hooks[agent.name].mock_handler) {
                script(agent.name, [name = agent.name](int) -> Expected<Value> {
                    return Value{{"by", name}};
                });
            }
        }
    }

    // Raises an interrupt from `stage` after its first run only.
    void interrupt_once(const std::string& stage, InterruptKind kind, InterruptOptions options = {}) {
        hooks[stage].post_process = [this, stage, kind, options](Envelope& e, const Value&) -> Expected<void> {
            if (runs(stage) == 1) {
                e.set_interrupt(kind, "int_" + stage, options);
            }
            return {};
        };
    }

    std::unique_ptr<Runtime> build(const PipelineConfig& config) {
        script_all(config);
        RuntimeDependencies deps;
        deps.llm_factory = [this](const std::string&) { return llm; };
        deps.logger = logger;
        deps.metrics = metrics;
        deps.persistence = store;
        deps.use_mock = true;
        deps.hooks = hooks;
        auto runtime = Runtime::create(config, deps);
        EXPECT_TRUE(runtime.has_value()) << runtime.error().to_string();
        return runtime ? std::move(*runtime) : nullptr;
    }

    int runs(const std::string& stage) {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        return runs_[stage];
    }

    Envelope fresh(const std::string& input = "Find the auth bug") {
        return Envelope::create(input, "user_1", "sess_1");
    }

    static Value verdict(const std::string& value) {
        return Value{{"verdict", value}};
    }

    std::shared_ptr<MockLLMProvider> llm;
    std::shared_ptr<RecordingLogger> logger;
    std::shared_ptr<MockMetricsCollector> metrics;
    std::shared_ptr<MockPersistence> store;
    std::map<std::string, AgentHooks> hooks;

private:
    int bump(const std::string& stage) {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        return ++runs_[stage];
    }

    std::mutex runs_mutex_;
    std::map<std::string, int> runs_;
};

// ============================================================================
// Creation
// ============================================================================

TEST_F(RuntimeTest, CreateValidatesPipeline) {
    PipelineConfig config = pipelines::review_loop();
    config.agents[0].default_next = "nowhere";

    auto runtime = Runtime::create(config, RuntimeDependencies{});
    ASSERT_FALSE(runtime.has_value());
    EXPECT_EQ(runtime.error().code, ErrorCode::UnknownReference);
}

TEST_F(RuntimeTest, CreateRequiresProviderForLlmAgents) {
    PipelineConfig config = pipelines::linear(2);
    config.agents[1].has_llm = true;

    RuntimeDependencies deps;
    auto runtime = Runtime::create(config, deps);
    ASSERT_FALSE(runtime.has_value());
    EXPECT_EQ(runtime.error().code, ErrorCode::MissingCapability);
}

TEST_F(RuntimeTest, FactoryReceivesModelRole) {
    PipelineConfig config = pipelines::linear(2);
    config.agents[0].has_llm = true;
    config.agents[0].model_role = "planner";
    config.agents[1].has_llm = true;

    std::vector<std::string> roles;
    RuntimeDependencies deps;
    deps.llm_factory = [this, &roles](const std::string& role) {
        roles.push_back(role);
        return llm;
    };
    ASSERT_TRUE(Runtime::create(config, deps).has_value());
    EXPECT_EQ(roles, (std::vector<std::string>{"planner", "default"}));
}

// ============================================================================
// Sequential execution
// ============================================================================

TEST_F(RuntimeTest, LinearPipelineCompletes) {
    auto runtime = build(pipelines::linear(3));
    Envelope env = fresh();

    ASSERT_TRUE(runtime->run(env).has_value());

    EXPECT_TRUE(env.terminated());
    EXPECT_EQ(env.terminal_reason(), TerminalReason::Completed);
    EXPECT_EQ(env.termination_reason(), std::optional<std::string>("completed"));
    EXPECT_EQ(env.current_stage, kEndStage);
    EXPECT_EQ(env.stage_order, (std::vector<std::string>{"stage0", "stage1", "stage2"}));
    EXPECT_TRUE(env.all_stages_complete());
    EXPECT_EQ(env.processing_history().size(), 3u);
    EXPECT_EQ((*env.get_output("stage2"))["by"], "stage2");

    ASSERT_EQ(metrics->pipeline_records.size(), 1u);
    EXPECT_EQ(metrics->pipeline_records[0].name, "linear");
    EXPECT_EQ(metrics->pipeline_records[0].status, "success");
    EXPECT_TRUE(logger->has_event("runtime_agents_built"));
    EXPECT_TRUE(logger->has_event("pipeline_started"));
    auto completed = logger->find_event("pipeline_completed");
    ASSERT_TRUE(completed.has_value());
    EXPECT_EQ(completed->fields["pipeline"], "linear");
    EXPECT_EQ(completed->fields["terminal_reason"], "completed");
}

TEST_F(RuntimeTest, FreshEnvelopeTakesPipelineBounds) {
    PipelineConfig config = pipelines::linear(2);
    config.max_iterations = 7;
    config.max_llm_calls = 8;
    config.max_agent_hops = 9;
    auto runtime = build(config);
    Envelope env = fresh();

    ASSERT_TRUE(runtime->run(env).has_value());
    EXPECT_EQ(env.max_iterations, 7);
    EXPECT_EQ(env.max_llm_calls, 8);
    EXPECT_EQ(env.max_agent_hops, 9);
}

TEST_F(RuntimeTest, RoutingLoopCountsIterations) {
    script("critic", [](int n) -> Expected<Value> { return verdict(n < 3 ? "retry" : "approved"); });
    auto runtime = build(pipelines::review_loop());
    Envelope env = fresh();

    ASSERT_TRUE(runtime->run(env).has_value());

    EXPECT_EQ(env.terminal_reason(), TerminalReason::Completed);
    EXPECT_EQ(env.iteration(), 2);
    EXPECT_EQ(runs("planner"), 3);
    EXPECT_EQ(runs("critic"), 3);
    EXPECT_EQ(env.agent_hop_count(), 9);
    EXPECT_TRUE(logger->has_event("iteration_incremented"));
}

TEST_F(RuntimeTest, EdgeLimitForcesEnd) {
    PipelineConfig config = pipelines::review_loop();
    config.edge_limits.push_back(EdgeLimit{"critic", "planner", 3});
    script("critic", [](int) -> Expected<Value> { return verdict("retry"); });
    auto runtime = build(config);
    Envelope env = fresh();

    ASSERT_TRUE(runtime->run(env).has_value());

    EXPECT_TRUE(env.terminated());
    EXPECT_EQ(env.terminal_reason(), TerminalReason::MaxLoopExceeded);
    EXPECT_EQ(env.termination_reason(), std::optional<std::string>("Edge limit exceeded: critic->planner"));
    EXPECT_EQ(env.current_stage, kEndStage);
    EXPECT_EQ(runs("critic"), 4);
    EXPECT_EQ(runs("planner"), 4);
    EXPECT_EQ(env.iteration(), 3);
    EXPECT_TRUE(logger->has_event("edge_limit_exceeded"));
    EXPECT_EQ(metrics->pipeline_records.back().status, "terminated");
}

TEST_F(RuntimeTest, DefaultEdgeLimitAppliesToSelfLoops) {
    PipelineConfig config;
    config.name = "self_loop";
    config.default_edge_limit = 2;
    AgentConfig poller = pipelines::agent("poller", 0, "end");
    poller.routing_rules.push_back(RoutingRule{"again", true, "poller"});
    config.agents = {poller};
    script("poller", [](int) -> Expected<Value> { return Value{{"again", true}}; });
    auto runtime = build(config);
    Envelope env = fresh();

    ASSERT_TRUE(runtime->run(env).has_value());
    EXPECT_EQ(runs("poller"), 3);
    EXPECT_EQ(env.terminal_reason(), TerminalReason::MaxLoopExceeded);
    EXPECT_EQ(env.iteration(), 0);
}

TEST_F(RuntimeTest, IterationBoundTerminates) {
    PipelineConfig config = pipelines::review_loop();
    config.max_iterations = 1;
    script("critic", [](int) -> Expected<Value> { return verdict("retry"); });
    auto runtime = build(config);
    Envelope env = fresh();

    ASSERT_TRUE(runtime->run(env).has_value());

    EXPECT_EQ(env.terminal_reason(), TerminalReason::MaxIterationsExceeded);
    EXPECT_EQ(env.termination_reason(), std::optional<std::string>("Bounds exceeded: max_iterations_exceeded"));
    EXPECT_EQ(runs("planner"), 2);
    EXPECT_TRUE(logger->has_event("pipeline_bounds_exceeded"));
}

TEST_F(RuntimeTest, HopBoundTerminates) {
    PipelineConfig config = pipelines::linear(4);
    config.max_agent_hops = 2;
    auto runtime = build(config);
    Envelope env = fresh();

    ASSERT_TRUE(runtime->run(env).has_value());
    EXPECT_EQ(env.terminal_reason(), TerminalReason::MaxAgentHopsExceeded);
    EXPECT_EQ(env.agent_hop_count(), 2);
    EXPECT_EQ(env.current_stage, "stage2");
}

TEST_F(RuntimeTest, LlmCallBoundTerminates) {
    PipelineConfig config = pipelines::linear(3);
    for (auto& agent : config.agents) agent.has_llm = true;
    config.max_llm_calls = 1;

    RuntimeDependencies deps;
    deps.llm_factory = [this](const std::string&) { return llm; };
    auto runtime = Runtime::create(config, deps);
    ASSERT_TRUE(runtime.has_value());
    Envelope env = fresh();

    ASSERT_TRUE((*runtime)->run(env).has_value());
    EXPECT_EQ(env.terminal_reason(), TerminalReason::MaxLlmCallsExceeded);
    EXPECT_EQ(llm->call_count(), 1u);
}

TEST_F(RuntimeTest, UnknownStageTerminates) {
    auto runtime = build(pipelines::linear(2));
    Envelope env = fresh();
    env.current_stage = "ghost";

    ASSERT_TRUE(runtime->run(env).has_value());
    EXPECT_EQ(env.termination_reason(), std::optional<std::string>("Unknown stage: ghost"));
    EXPECT_EQ(env.terminal_reason(), TerminalReason::ToolFailedFatally);
    EXPECT_TRUE(logger->has_event("pipeline_unknown_stage"));
}

TEST_F(RuntimeTest, AgentFailureIsRecordedAndRoutingContinues) {
    script("stage0", [](int) -> Expected<Value> {
        return tl::unexpected(Error{ErrorCode::LlmProviderFailed, "upstream 503"});
    });
    auto runtime = build(pipelines::linear(2));
    Envelope env = fresh();

    ASSERT_TRUE(runtime->run(env).has_value());

    EXPECT_TRUE(env.is_stage_failed("stage0"));
    EXPECT_TRUE(env.is_stage_completed("stage1"));
    ASSERT_EQ(env.errors.size(), 1u);
    EXPECT_EQ(env.errors[0]["error_type"], "LlmProviderFailed");
    EXPECT_EQ(env.terminal_reason(), TerminalReason::Completed);
    EXPECT_TRUE(logger->has_event("pipeline_agent_error"));
}

TEST_F(RuntimeTest, FailureRoutedToEndCompletes) {
    PipelineConfig config = pipelines::linear(2);
    config.agents[0].error_next = "end";
    script("stage0", [](int) -> Expected<Value> {
        return tl::unexpected(Error{ErrorCode::OutputValidationFailed, "bad output"});
    });
    auto runtime = build(config);
    Envelope env = fresh();

    ASSERT_TRUE(runtime->run(env).has_value());
    EXPECT_EQ(env.terminal_reason(), TerminalReason::Completed);
    EXPECT_EQ(runs("stage1"), 0);
    EXPECT_EQ(env.errors.size(), 1u);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(RuntimeTest, CancelledBeforeStartRunsNothing) {
    auto runtime = build(pipelines::linear(2));
    Envelope env = fresh();
    CancellationToken cancel;
    cancel.cancel();

    auto result = runtime->run(env, "", cancel);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RequestCancelled);
    EXPECT_EQ(runs("stage0"), 0);
    EXPECT_FALSE(env.terminated());
    EXPECT_EQ(metrics->pipeline_records.back().status, "error");
    EXPECT_TRUE(logger->has_event("pipeline_cancelled"));
}

TEST_F(RuntimeTest, CancellationBetweenStagesKeepsCompletedWork) {
    CancellationToken cancel;
    script("stage0", [cancel](int) mutable -> Expected<Value> {
        cancel.cancel();
        return Value{{"done", true}};
    });
    auto runtime = build(pipelines::linear(3));
    Envelope env = fresh();

    auto result = runtime->run(env, "thread_c", cancel);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RequestCancelled);
    EXPECT_TRUE(env.is_stage_completed("stage0"));
    EXPECT_EQ(runs("stage1"), 0);
    EXPECT_EQ(env.current_stage, "stage1");
    EXPECT_FALSE(env.terminated());

    // The partial state is still persisted
    auto loaded = runtime->load_envelope("thread_c");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->is_stage_completed("stage0"));
}

TEST_F(RuntimeTest, DeadlineAbortsRunningStage) {
    PipelineConfig config = pipelines::linear(2);
    config.agents[1].has_llm = true;
    llm->generation_delay_ms = 5000;
    auto runtime = build(config);
    Envelope env = fresh();

    auto result = runtime->run(env, "", CancellationToken::with_timeout(std::chrono::milliseconds(100)));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RequestTimeout);
    EXPECT_TRUE(env.is_stage_completed("stage0"));
    EXPECT_TRUE(env.is_stage_failed("stage1"));
}

// ============================================================================
// Interrupts
// ============================================================================

TEST_F(RuntimeTest, ClarificationPausesAndResumes) {
    PipelineConfig config = pipelines::review_loop();
    config.resume_stages[InterruptKind::Clarification] = "planner";
    interrupt_once("planner", InterruptKind::Clarification, InterruptOptions{}.with_question("Which module?"));
    auto runtime = build(config);
    Envelope env = fresh();

    ASSERT_TRUE(runtime->run(env, "thread_1").has_value());
    EXPECT_TRUE(env.has_pending_interrupt());
    EXPECT_FALSE(env.terminated());
    EXPECT_EQ(runs("executor"), 0);
    EXPECT_EQ(env.get_final_response(), std::optional<std::string>("Which module?"));
    EXPECT_EQ(metrics->pipeline_records.back().status, "interrupted");
    EXPECT_TRUE(logger->has_event("pipeline_interrupt"));

    InterruptResponse answer;
    answer.text = "the auth module";
    RunOptions options;
    options.thread_id = "thread_1";
    ASSERT_TRUE(runtime->resume(env, answer, options).has_value());

    EXPECT_FALSE(env.interrupt_pending());
    ASSERT_TRUE(env.interrupt().has_value());
    EXPECT_EQ(env.interrupt()->response->text, std::optional<std::string>("the auth module"));
    EXPECT_EQ(runs("planner"), 2);
    EXPECT_EQ(runs("critic"), 1);
    EXPECT_EQ(env.terminal_reason(), TerminalReason::Completed);
    EXPECT_TRUE(logger->has_event("pipeline_resumed"));

    auto stored = runtime->load_envelope("thread_1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, env);
}

TEST_F(RuntimeTest, ResumeAfterReloadFromStore) {
    PipelineConfig config = pipelines::review_loop();
    config.resume_stages[InterruptKind::Clarification] = "executor";
    interrupt_once("planner", InterruptKind::Clarification);
    auto runtime = build(config);
    Envelope env = fresh();
    ASSERT_TRUE(runtime->run(env, "thread_r").has_value());

    auto restored = runtime->load_envelope("thread_r");
    ASSERT_TRUE(restored.has_value());
    ASSERT_TRUE(restored->has_pending_interrupt());

    InterruptResponse answer;
    answer.text = "yes";
    ASSERT_TRUE(runtime->resume(*restored, answer).has_value());
    EXPECT_EQ(runs("planner"), 1);
    EXPECT_EQ(runs("executor"), 1);
    EXPECT_EQ(restored->terminal_reason(), TerminalReason::Completed);
}

TEST_F(RuntimeTest, ConfirmationApprovedContinues) {
    PipelineConfig config = pipelines::review_loop();
    config.resume_stages[InterruptKind::Confirmation] = "executor";
    interrupt_once("executor", InterruptKind::Confirmation, InterruptOptions{}.with_message("Delete 3 files?"));
    auto runtime = build(config);
    Envelope env = fresh();

    ASSERT_TRUE(runtime->run(env).has_value());
    ASSERT_EQ(env.interrupt_kind(), InterruptKind::Confirmation);
    EXPECT_EQ(env.to_result_dict()["confirmation_needed"], true);

    InterruptResponse approval;
    approval.approved = true;
    ASSERT_TRUE(runtime->resume(env, approval).has_value());
    EXPECT_EQ(runs("executor"), 2);
    EXPECT_EQ(env.terminal_reason(), TerminalReason::Completed);
}

TEST_F(RuntimeTest, ConfirmationDeniedTerminates) {
    PipelineConfig config = pipelines::review_loop();
    config.resume_stages[InterruptKind::Confirmation] = "executor";
    interrupt_once("executor", InterruptKind::Confirmation);
    auto runtime = build(config);
    Envelope env = fresh();
    ASSERT_TRUE(runtime->run(env, "thread_d").has_value());

    InterruptResponse denial;
    denial.approved = false;
    RunOptions options;
    options.thread_id = "thread_d";
    ASSERT_TRUE(runtime->resume(env, denial, options).has_value());

    EXPECT_TRUE(env.terminated());
    EXPECT_EQ(env.termination_reason(), std::optional<std::string>("User denied confirmation"));
    EXPECT_EQ(runs("executor"), 1);
    EXPECT_EQ(runs("critic"), 0);

    auto stored = runtime->load_envelope("thread_d");
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->terminated());
}

TEST_F(RuntimeTest, InterruptFromFinalStageHoldsRun) {
    PipelineConfig config = pipelines::linear(2);
    config.resume_stages[InterruptKind::Clarification] = "stage1";
    interrupt_once("stage1", InterruptKind::Clarification, InterruptOptions{}.with_question("Which file?"));
    auto runtime = build(config);
    Envelope env = fresh();

    ASSERT_TRUE(runtime->run(env).has_value());
    EXPECT_TRUE(env.has_pending_interrupt());
    EXPECT_FALSE(env.terminated());
    EXPECT_FALSE(env.terminal_reason().has_value());
    EXPECT_EQ(metrics->pipeline_records.back().status, "interrupted");

    InterruptResponse answer;
    answer.text = "main.cpp";
    ASSERT_TRUE(runtime->resume(env, answer).has_value());
    EXPECT_EQ(runs("stage0"), 1);
    EXPECT_EQ(runs("stage1"), 2);
    EXPECT_FALSE(env.interrupt_pending());
    EXPECT_EQ(env.terminal_reason(), TerminalReason::Completed);
}

TEST_F(RuntimeTest, ResumeRejectsTerminatedEnvelope) {
    PipelineConfig config = pipelines::linear(2);
    config.resume_stages[InterruptKind::Clarification] = "stage0";
    auto runtime = build(config);
    Envelope env = fresh();
    env.set_interrupt(InterruptKind::Clarification, "late");
    env.terminate("completed", TerminalReason::Completed);

    auto result = runtime->resume(env, InterruptResponse{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidEnvelopeState);
    EXPECT_EQ(runs("stage0"), 0);
    EXPECT_TRUE(env.has_pending_interrupt());
}

TEST_F(RuntimeTest, ResumeClosesStreamOnEveryPath) {
    PipelineConfig config = pipelines::linear(2);
    config.resume_stages[InterruptKind::Confirmation] = "stage0";
    interrupt_once("stage0", InterruptKind::Confirmation);
    auto runtime = build(config);

    auto expect_end_marker = [](const std::shared_ptr<engine::StageStream>& stream,
                                std::optional<ErrorCode> error) {
        EXPECT_TRUE(stream->is_closed());
        auto item = stream->pop();
        ASSERT_TRUE(item.has_value());
        EXPECT_TRUE(item->is_end());
        if (error) {
            ASSERT_TRUE(item->error.has_value());
            EXPECT_EQ(item->error->code, *error);
        } else {
            EXPECT_FALSE(item->error.has_value());
        }
        EXPECT_FALSE(stream->pop().has_value());
    };

    // Nothing pending.
    {
        Envelope env = fresh();
        RunOptions options;
        options.stream = std::make_shared<engine::StageStream>();
        EXPECT_FALSE(runtime->resume(env, InterruptResponse{}, options).has_value());
        expect_end_marker(options.stream, ErrorCode::NoPendingInterrupt);
    }

    // Denied confirmation.
    {
        Envelope env = fresh();
        ASSERT_TRUE(runtime->run(env).has_value());
        ASSERT_TRUE(env.has_pending_interrupt());

        InterruptResponse denial;
        denial.approved = false;
        RunOptions options;
        options.stream = std::make_shared<engine::StageStream>();
        ASSERT_TRUE(runtime->resume(env, denial, options).has_value());
        expect_end_marker(options.stream, std::nullopt);
    }

    // No resume stage for the kind.
    {
        Envelope env = fresh();
        env.set_interrupt(InterruptKind::Checkpoint, "cp");
        RunOptions options;
        options.stream = std::make_shared<engine::StageStream>();
        EXPECT_FALSE(runtime->resume(env, InterruptResponse{}, options).has_value());
        expect_end_marker(options.stream, ErrorCode::ResumeStageNotConfigured);
    }
}

TEST_F(RuntimeTest, ResumeWithoutPendingInterrupt) {
    auto runtime = build(pipelines::linear(2));
    Envelope env = fresh();

    auto result = runtime->resume(env, InterruptResponse{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NoPendingInterrupt);
}

TEST_F(RuntimeTest, ResumeWithoutConfiguredStage) {
    interrupt_once("stage0", InterruptKind::Checkpoint);
    auto runtime = build(pipelines::linear(2));
    Envelope env = fresh();
    ASSERT_TRUE(runtime->run(env).has_value());

    auto result = runtime->resume(env, InterruptResponse{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ResumeStageNotConfigured);
    EXPECT_TRUE(env.has_pending_interrupt());
}

// ============================================================================
// Parallel execution
// ============================================================================

TEST_F(RuntimeTest, ParallelDiamondRunsInDependencyOrder) {
    auto runtime = build(pipelines::diamond());
    Envelope env = fresh();

    ASSERT_TRUE(runtime->execute(env).has_value());

    EXPECT_TRUE(env.parallel_mode);
    EXPECT_EQ(env.terminal_reason(), TerminalReason::Completed);
    EXPECT_EQ(env.current_stage, kEndStage);
    EXPECT_EQ(env.completed_stage_count(), 3u);
    EXPECT_EQ(env.processing_history().size(), 3u);
    EXPECT_EQ(env.agent_hop_count(), 3);
    EXPECT_EQ(env.processing_history().back().agent, "C");
    EXPECT_TRUE(env.has_output("A"));
    EXPECT_TRUE(env.has_output("B"));
    EXPECT_TRUE(env.has_output("C"));
    EXPECT_TRUE(logger->has_event("parallel_batch"));
    EXPECT_TRUE(logger->has_event("pipeline_parallel_completed"));
}

TEST_F(RuntimeTest, ParallelFailedDependencyStopsRun) {
    script("B", [](int) -> Expected<Value> { return tl::unexpected(Error{ErrorCode::LlmProviderFailed, "down"}); });
    auto runtime = build(pipelines::diamond(JoinStrategy::All));
    Envelope env = fresh();

    ASSERT_TRUE(runtime->run_parallel(env).has_value());
    EXPECT_TRUE(env.is_stage_failed("B"));
    EXPECT_EQ(runs("C"), 0);
    EXPECT_TRUE(env.terminated());
    EXPECT_EQ(env.terminal_reason(), TerminalReason::ToolFailedFatally);
    EXPECT_EQ(env.termination_reason(), std::optional<std::string>("Stage failures: B"));
    EXPECT_EQ(metrics->pipeline_records.back().status, "terminated");

    auto failure = logger->find_event("pipeline_stage_failures");
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->fields["unrun_stages"], json::array({"C"}));
}

TEST_F(RuntimeTest, ParallelJoinAnyRunsAfterOneDependency) {
    script("B", [](int) -> Expected<Value> { return tl::unexpected(Error{ErrorCode::LlmProviderFailed, "down"}); });
    auto runtime = build(pipelines::diamond(JoinStrategy::Any));
    Envelope env = fresh();

    ASSERT_TRUE(runtime->run_parallel(env).has_value());
    EXPECT_TRUE(env.is_stage_failed("B"));
    EXPECT_EQ(runs("C"), 1);
    EXPECT_EQ(runs("B"), 1);
    EXPECT_EQ(env.terminal_reason(), TerminalReason::Completed);
}

TEST_F(RuntimeTest, ParallelRoundIsTruncatedToHopBudget) {
    PipelineConfig config = pipelines::diamond();
    config.max_agent_hops = 1;
    auto runtime = build(config);
    Envelope env = fresh();

    ASSERT_TRUE(runtime->run_parallel(env).has_value());
    EXPECT_EQ(runs("A"), 1);
    EXPECT_EQ(runs("B"), 0);
    EXPECT_EQ(env.terminal_reason(), TerminalReason::MaxAgentHopsExceeded);
}

TEST_F(RuntimeTest, ParallelRoundsRespectMaxParallel) {
    PipelineConfig config;
    config.name = "fan_out";
    config.default_run_mode = RunMode::Parallel;
    config.max_parallel = 2;
    config.agents = {pipelines::agent("A", 1), pipelines::agent("B", 2), pipelines::agent("C", 3)};

    auto in_flight = std::make_shared<std::atomic<int>>(0);
    auto peak = std::make_shared<std::atomic<int>>(0);
    for (const auto& agent : config.agents) {
        script(agent.name, [in_flight, peak](int) -> Expected<Value> {
            const int now = ++*in_flight;
            int seen = peak->load();
            while (now > seen && !peak->compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            --*in_flight;
            return Value::object();
        });
    }
    auto runtime = build(config);
    Envelope env = fresh();

    ASSERT_TRUE(runtime->execute(env).has_value());
    EXPECT_EQ(env.terminal_reason(), TerminalReason::Completed);
    EXPECT_EQ(env.completed_stage_count(), 3u);
    EXPECT_LE(peak->load(), 2);

    std::vector<size_t> batch_sizes;
    for (const auto& record : logger->records()) {
        if (record.event == "parallel_batch") {
            batch_sizes.push_back(record.fields["ready_stages"].size());
        }
    }
    EXPECT_EQ(batch_sizes, (std::vector<size_t>{2, 1}));
}

TEST_F(RuntimeTest, ParallelResumeRerunsStageAndDependents) {
    PipelineConfig config = pipelines::diamond();
    config.resume_stages[InterruptKind::AgentReview] = "A";
    interrupt_once("A", InterruptKind::AgentReview);
    auto runtime = build(config);
    Envelope env = fresh();

    ASSERT_TRUE(runtime->execute(env).has_value());
    ASSERT_TRUE(env.has_pending_interrupt());
    EXPECT_EQ(runs("C"), 0);

    InterruptResponse review;
    review.decision = "approve";
    ASSERT_TRUE(runtime->resume(env, review).has_value());
    EXPECT_EQ(runs("A"), 2);
    EXPECT_EQ(runs("B"), 1);
    EXPECT_EQ(runs("C"), 1);
    EXPECT_EQ(env.terminal_reason(), TerminalReason::Completed);
}

// ============================================================================
// Persistence, streaming and single-agent execution
// ============================================================================

TEST_F(RuntimeTest, StateIsPersistedPerThread) {
    auto runtime = build(pipelines::linear(3));
    Envelope env = fresh();
    ASSERT_TRUE(runtime->run(env, "thread_p").has_value());

    EXPECT_GE(store->save_count(), 3u);
    auto state = runtime->get_state("thread_p");
    ASSERT_TRUE(state.has_value());
    ASSERT_TRUE(state->has_value());
    EXPECT_EQ((**state)["terminal_reason"], "completed");

    auto loaded = runtime->load_envelope("thread_p");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, env);
}

TEST_F(RuntimeTest, NoThreadIdMeansNoPersistence) {
    auto runtime = build(pipelines::linear(2));
    Envelope env = fresh();
    ASSERT_TRUE(runtime->run(env).has_value());
    EXPECT_EQ(store->save_count(), 0u);

    auto missing = runtime->load_envelope("absent");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::StateNotFound);
}

TEST_F(RuntimeTest, PersistenceFailureIsNotFatal) {
    store->fail_saves = true;
    auto runtime = build(pipelines::linear(2));
    Envelope env = fresh();

    ASSERT_TRUE(runtime->run(env, "thread_f").has_value());
    EXPECT_EQ(env.terminal_reason(), TerminalReason::Completed);
    auto warning = logger->find_event("state_persist_error");
    ASSERT_TRUE(warning.has_value());
    EXPECT_EQ(warning->level, "warn");
    EXPECT_EQ(warning->fields["thread_id"], "thread_f");
}

TEST_F(RuntimeTest, StreamYieldsStagesThenEndMarker) {
    auto runtime = build(pipelines::linear(3));
    auto run = runtime->run_with_stream(fresh());

    std::vector<std::string> stages;
    std::optional<engine::StageOutput> last;
    while (auto item = run.stream->pop()) {
        stages.push_back(item->stage);
        last = item;
    }

    EXPECT_EQ(stages, (std::vector<std::string>{"stage0", "stage1", "stage2", kStreamEndMarker}));
    ASSERT_TRUE(last.has_value());
    EXPECT_TRUE(last->is_end());
    EXPECT_EQ(last->output["terminated"], true);
    EXPECT_FALSE(last->error.has_value());

    auto result = run.result.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->terminal_reason(), TerminalReason::Completed);
    EXPECT_TRUE(run.stream->is_closed());
}

TEST_F(RuntimeTest, StreamEndMarkerCarriesAbort) {
    auto runtime = build(pipelines::linear(2));
    RunOptions options;
    options.cancel.cancel();
    auto run = runtime->run_with_stream(fresh(), options);

    auto item = run.stream->pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_TRUE(item->is_end());
    EXPECT_EQ(item->output["terminated"], false);
    ASSERT_TRUE(item->error.has_value());
    EXPECT_EQ(item->error->code, ErrorCode::RequestCancelled);

    auto result = run.result.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RequestCancelled);
}

TEST_F(RuntimeTest, ParallelStreamHasOneItemPerStage) {
    auto runtime = build(pipelines::diamond());
    RunOptions options;
    options.mode = RunMode::Parallel;
    auto run = runtime->run_with_stream(fresh(), options);

    std::vector<std::string> stages;
    while (auto item = run.stream->pop()) {
        stages.push_back(item->stage);
    }
    ASSERT_EQ(stages.size(), 4u);
    EXPECT_EQ(stages[2], "C");
    EXPECT_EQ(stages[3], kStreamEndMarker);
    EXPECT_TRUE(run.result.get().has_value());
}

TEST_F(RuntimeTest, ExecuteSingleAgent) {
    auto runtime = build(pipelines::review_loop());
    Envelope env = fresh();

    auto result = runtime->execute_single_agent("executor", env);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->next_stage, "critic");
    EXPECT_TRUE(env.is_stage_completed("executor"));
    EXPECT_TRUE(env.has_output("executor"));
    EXPECT_EQ(env.current_stage, "start");
    EXPECT_EQ(runs("critic"), 0);

    auto missing = runtime->execute_single_agent("ghost", env);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::UnknownStage);
}

TEST_F(RuntimeTest, IndependentEnvelopesRunConcurrently) {
    auto runtime = build(pipelines::linear(3));
    std::vector<Envelope> envs;
    for (int i = 0; i < 4; ++i) envs.push_back(fresh("request " + std::to_string(i)));

    std::vector<std::thread> workers;
    for (auto& env : envs) {
        workers.emplace_back([&runtime, &env]() { (void)runtime->run(env); });
    }
    for (auto& worker : workers) worker.join();

    for (const auto& env : envs) {
        EXPECT_EQ(env.terminal_reason(), TerminalReason::Completed);
        EXPECT_EQ(env.processing_history().size(), 3u);
    }
    EXPECT_EQ(runs("stage2"), 4);
}
