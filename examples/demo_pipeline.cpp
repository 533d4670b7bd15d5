/**
 * Conductor Demo Pipeline
 *
 * Runs a small plan / execute / critique pipeline against a scripted LLM
 * provider, so it needs no model server. Demonstrates:
 *   - sequential execution with a critic loop-back bounded by an edge limit
 *   - a clarification interrupt that pauses the run, then resume() from the
 *     persisted state
 *   - streaming stage outputs from a background run
 *
 * Usage:
 *   ./conductor_demo [options]
 *
 * Options:
 *   --db <path>       SQLite state database (default: conductor_demo.sqlite)
 *   --parallel        Run the first request in parallel mode
 *   --debug           Enable debug logging
 *   --help            Show this help message
 */

#include "conductor/conductor.hpp"
#include "conductor/persistence/sqlite_state_store.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

namespace {

// Cancelled on Ctrl+C; every run observes it.
conductor::CancellationToken g_cancel;

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_cancel.cancel();
    }
}

const char* kPipeline = R"({
    "name": "code_review_demo",
    "max_iterations": 3,
    "max_llm_calls": 10,
    "max_agent_hops": 20,
    "default_timeout_seconds": 30,
    "edge_limits": [{"from": "critic", "to": "planner", "max_count": 2}],
    "resume_stages": {"clarification": "planner"},
    "agents": [
        {
            "name": "planner",
            "stage_order": 1,
            "has_llm": true,
            "model_role": "planner",
            "prompt_key": "planner.main",
            "temperature": 0.2,
            "required_output_fields": ["steps"],
            "output_key": "plan",
            "default_next": "executor"
        },
        {
            "name": "executor",
            "stage_order": 2,
            "has_tools": true,
            "tool_access": "read",
            "allowed_tools": ["search_code", "read_file"],
            "output_key": "execution",
            "requires": ["planner"],
            "default_next": "critic"
        },
        {
            "name": "critic",
            "stage_order": 3,
            "has_llm": true,
            "model_role": "critic",
            "prompt_key": "critic.main",
            "requires": ["executor"],
            "routing_rules": [{"condition": "verdict", "value": "retry", "target": "planner"}],
            "default_next": "end",
            "error_next": "end",
            "max_retries": 1
        }
    ]
})";

// ============================================================================
// Scripted LLM provider
// ============================================================================

/**
 * Answers by model role. The critic asks for one retry per request before
 * approving.
 */
class ScriptedProvider : public conductor::providers::ILLMProvider {
public:
    conductor::Expected<std::string> generate(
        const std::string& model,
        const std::string& /*prompt*/,
        const conductor::Value& /*options*/,
        const conductor::CancellationToken& cancel
    ) override {
        if (auto stop = cancel.check()) {
            return tl::unexpected(*stop);
        }

        if (model == "planner") {
            return std::string(
                "Here is the plan:\n"
                "```json\n"
                "{\"steps\": ["
                "{\"step_id\": \"s1\", \"tool\": \"search_code\", \"parameters\": {\"query\": \"auth\", \"limit\": 2}},"
                "{\"step_id\": \"s2\", \"tool\": \"read_file\", \"parameters\": {\"path\": \"src/auth.cpp\"}}"
                "]}\n"
                "```");
        }
        if (model == "critic") {
            // First review of each plan asks for another pass.
            const bool first_pass = critic_calls_.fetch_add(1) % 2 == 0;
            if (first_pass) {
                return std::string(R"({"verdict": "retry", "feedback": "also cover session expiry"})");
            }
            return std::string(R"({"verdict": "approved", "final_response": "No blocking issues found"})");
        }
        return tl::unexpected(conductor::Error{
            conductor::ErrorCode::LlmProviderFailed, "No script for model role", model});
    }

private:
    std::atomic<int> critic_calls_{0};
};

// ============================================================================
// Example tools
// ============================================================================

conductor::Value search_code(const std::string& query, int limit) {
    conductor::Value matches = conductor::Value::array();
    for (int i = 0; i < limit; ++i) {
        matches.push_back("src/" + query + "_" + std::to_string(i) + ".cpp");
    }
    return conductor::Value{{"query", query}, {"matches", matches}};
}

std::shared_ptr<conductor::engine::ToolRegistry> make_tools() {
    auto tools = std::make_shared<conductor::engine::ToolRegistry>();
    tools->register_tool("search_code", "Search the code index", {"query", "limit"}, search_code);
    tools->register_tool("read_file", "Read a source file",
        conductor::Value{
            {"type", "object"},
            {"properties", {{"path", {{"type", "string"}}}}},
            {"required", conductor::Value::array({"path"})}
        },
        conductor::engine::ToolHandler([](const conductor::Value& args) -> conductor::Expected<conductor::Value> {
            const auto path = args["path"].get<std::string>();
            return conductor::Value{{"path", path}, {"lines", 120}};
        }));
    return tools;
}

struct CLIArgs {
    std::string db_path = "conductor_demo.sqlite";
    bool parallel = false;
    bool debug = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cout << "Conductor Demo Pipeline\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --db <path>       SQLite state database (default: conductor_demo.sqlite)\n";
    std::cout << "  --parallel        Run the first request in parallel mode\n";
    std::cout << "  --debug           Enable debug logging\n";
    std::cout << "  --help            Show this help message\n";
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            args.help = true;
            return args;
        }
        else if (arg == "--db" && i + 1 < argc) {
            args.db_path = argv[++i];
        }
        else if (arg == "--parallel") {
            args.parallel = true;
        }
        else if (arg == "--debug") {
            args.debug = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            args.help = true;
            return args;
        }
    }
    return args;
}

void print_result(const std::string& title, const conductor::Envelope& env) {
    std::cout << "\n=== " << title << " ===\n";
    std::cout << env.to_result_dict().dump(2) << "\n";
}

} // namespace

int main(int argc, char** argv) {
    CLIArgs args = parse_args(argc, argv);
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    std::signal(SIGINT, signal_handler);

    auto pipeline = conductor::PipelineConfig::from_json(conductor::Value::parse(kPipeline));
    if (!pipeline) {
        std::cerr << "Invalid pipeline: " << pipeline.error().to_string() << "\n";
        return 1;
    }

    auto store = conductor::persistence::SqliteStateStore::open(args.db_path);
    if (!store) {
        std::cerr << "Failed to open state store: " << store.error().to_string() << "\n";
        return 1;
    }

    auto prompts = std::make_shared<conductor::engine::TemplatePromptRegistry>(std::map<std::string, std::string>{
        {"planner.main", "Plan the review of: {{raw_input}}"},
        {"critic.main", "Critique {{execution}} for: {{raw_input}}"}
    });

    auto provider = std::make_shared<ScriptedProvider>();

    conductor::RuntimeDependencies deps;
    deps.llm_factory = [provider](const std::string&) { return provider; };
    deps.tools = make_tools();
    deps.prompts = prompts;
    deps.persistence = *store;
    deps.logger = conductor::logging::SpdlogLogger::create(
        "conductor_demo", args.debug ? spdlog::level::debug : spdlog::level::info);

    // Pause the planner once to ask which area to focus on.
    deps.hooks["planner"].post_process = [](conductor::Envelope& env, const conductor::Value&)
        -> conductor::Expected<void> {
        if (env.metadata.value("ask_scope", false) && !env.interrupt()) {
            env.set_interrupt(conductor::InterruptKind::Clarification, "scope",
                              conductor::InterruptOptions{}.with_question("Which module should be reviewed?"));
        }
        return {};
    };

    auto runtime = conductor::Runtime::create(*pipeline, deps);
    if (!runtime) {
        std::cerr << "Failed to create runtime: " << runtime.error().to_string() << "\n";
        return 1;
    }

    // ------------------------------------------------------------------------
    // 1. Plain run
    // ------------------------------------------------------------------------
    {
        auto env = conductor::Envelope::create("review the auth module");
        auto done = args.parallel
            ? (*runtime)->run_parallel(env, "demo-run", g_cancel)
            : (*runtime)->run(env, "demo-run", g_cancel);
        if (!done) {
            std::cerr << "Run aborted: " << done.error().to_string() << "\n";
            return 1;
        }
        print_result("Run", env);
    }

    // ------------------------------------------------------------------------
    // 2. Clarification, then resume from the stored state
    // ------------------------------------------------------------------------
    {
        auto env = conductor::Envelope::create("review something", "demo-user", "", std::nullopt,
                                               conductor::Value{{"ask_scope", true}});
        if (auto paused = (*runtime)->run(env, "demo-clarify", g_cancel); !paused) {
            std::cerr << "Run aborted: " << paused.error().to_string() << "\n";
            return 1;
        }
        if (env.has_pending_interrupt()) {
            std::cout << "\nPaused: " << env.interrupt()->question << "\n";
        }

        auto stored = (*runtime)->load_envelope("demo-clarify");
        if (!stored) {
            std::cerr << "Failed to load state: " << stored.error().to_string() << "\n";
            return 1;
        }

        conductor::InterruptResponse answer;
        answer.text = "the session module";

        conductor::RunOptions options;
        options.thread_id = "demo-clarify";
        options.cancel = g_cancel;
        if (auto resumed = (*runtime)->resume(*stored, answer, options); !resumed) {
            std::cerr << "Resume failed: " << resumed.error().to_string() << "\n";
            return 1;
        }
        print_result("Resumed", *stored);
    }

    // ------------------------------------------------------------------------
    // 3. Streaming
    // ------------------------------------------------------------------------
    {
        conductor::RunOptions options;
        options.thread_id = "demo-stream";
        options.cancel = g_cancel;
        auto handle = (*runtime)->run_with_stream(conductor::Envelope::create("review the billing module"), options);

        std::cout << "\n=== Stream ===\n";
        while (auto item = handle.stream->pop()) {
            if (item->is_end()) {
                std::cout << "[end] " << item->output.dump() << "\n";
                break;
            }
            std::cout << "[" << item->stage << "] " << item->output.dump() << "\n";
        }

        auto final_env = handle.result.get();
        if (!final_env) {
            std::cerr << "Stream run aborted: " << final_env.error().to_string() << "\n";
            return 1;
        }
        print_result("Streamed", *final_env);
    }

    auto threads = (*store)->list_threads();
    if (threads) {
        std::cout << "\nStored threads:";
        for (const auto& id : *threads) {
            std::cout << " " << id;
        }
        std::cout << "\n";
    }
    return 0;
}
