#pragma once

#include "types.hpp"
#include "envelope.hpp"
#include <algorithm>
#include <deque>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace conductor {

// ============================================================================
// Enumerations
// ============================================================================

/** @brief Tool permission level granted to an agent. */
enum class ToolAccess {
    None,
    Read,
    Write,
    All
};

/** @brief Rule deciding when a stage with several `requires` becomes ready. */
enum class JoinStrategy {
    All,  ///< Every required stage completed
    Any   ///< At least one required stage completed
};

/** @brief Scheduling mode of a run. */
enum class RunMode {
    Sequential,
    Parallel
};

[[nodiscard]] inline const char* tool_access_to_string(ToolAccess access) {
    switch (access) {
        case ToolAccess::None: return "none";
        case ToolAccess::Read: return "read";
        case ToolAccess::Write: return "write";
        case ToolAccess::All: return "all";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<ToolAccess> tool_access_from_string(const std::string& text) {
    if (text == "none") return ToolAccess::None;
    if (text == "read") return ToolAccess::Read;
    if (text == "write") return ToolAccess::Write;
    if (text == "all") return ToolAccess::All;
    return std::nullopt;
}

[[nodiscard]] inline const char* join_strategy_to_string(JoinStrategy join) {
    return join == JoinStrategy::Any ? "any" : "all";
}

[[nodiscard]] inline std::optional<JoinStrategy> join_strategy_from_string(const std::string& text) {
    if (text == "all") return JoinStrategy::All;
    if (text == "any") return JoinStrategy::Any;
    return std::nullopt;
}

[[nodiscard]] inline const char* run_mode_to_string(RunMode mode) {
    return mode == RunMode::Parallel ? "parallel" : "sequential";
}

[[nodiscard]] inline std::optional<RunMode> run_mode_from_string(const std::string& text) {
    if (text == "sequential") return RunMode::Sequential;
    if (text == "parallel") return RunMode::Parallel;
    return std::nullopt;
}

// ============================================================================
// Routing and Edges
// ============================================================================

/**
 * @brief Ordered condition/value/target triple.
 *
 * Matches when `output[condition] == value`.
 */
struct RoutingRule {
    std::string condition;
    Value value;
    std::string target;

    bool operator==(const RoutingRule& other) const {
        return condition == other.condition && value == other.value && target == other.target;
    }

    bool operator!=(const RoutingRule& other) const {
        return !(*this == other);
    }
};

/** @brief Cap on how many times a specific stage-to-stage transition may occur. */
struct EdgeLimit {
    std::string from;
    std::string to;
    int max_count = 0;

    bool operator==(const EdgeLimit& other) const {
        return from == other.from && to == other.to && max_count == other.max_count;
    }

    bool operator!=(const EdgeLimit& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// AgentConfig
// ============================================================================

/**
 * @brief Declarative description of one agent.
 *
 * Value type. Validated standalone via validate() and again as part of
 * PipelineConfig::validate(), which also checks cross-agent references.
 */
struct AgentConfig {
    // Identity
    std::string name;                                 ///< Unique agent / stage name (required)
    int stage_order = 0;                              ///< Position in the sequential order

    // Dependencies
    std::vector<std::string> requires_stages;         ///< Hard dependencies ("requires")
    std::vector<std::string> after_stages;            ///< Soft ordering ("after")
    std::vector<std::string> runs_with;               ///< Parallelisation hint
    JoinStrategy join_strategy = JoinStrategy::All;

    // Capabilities
    bool has_llm = false;
    bool has_tools = false;
    bool has_policies = false;

    // Tools
    ToolAccess tool_access = ToolAccess::None;
    std::set<std::string> allowed_tools;              ///< Empty = every tool the access level permits
    bool continue_on_tool_failure = true;             ///< Keep executing plan steps after a failed step

    // LLM
    std::string model_role;                           ///< Provider factory role ("default" when empty)
    std::string prompt_key;                           ///< Prompt registry key
    std::optional<double> temperature;
    std::optional<int> max_tokens;

    // Output
    std::string output_key;                           ///< Envelope output key (agent name when empty)
    std::vector<std::string> required_output_fields;

    // Routing
    std::vector<RoutingRule> routing_rules;
    std::string default_next;
    std::string error_next;

    // Execution limits
    int timeout_seconds = 0;                          ///< 0 = pipeline default
    int max_retries = 0;                              ///< Extra LLM attempts on failure

    const std::string& effective_output_key() const {
        return output_key.empty() ? name : output_key;
    }

    /** @brief requires followed by after. */
    std::vector<std::string> all_dependencies() const {
        std::vector<std::string> deps = requires_stages;
        deps.insert(deps.end(), after_stages.begin(), after_stages.end());
        return deps;
    }

    bool has_dependencies() const {
        return !requires_stages.empty() || !after_stages.empty();
    }

    /**
     * @brief Structural validation that needs no other agent.
     *
     * Rejects an empty name, negative limits, self references and tool
     * settings on an agent without `has_tools`.
     */
    Expected<void> validate() const {
        if (name.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "AgentConfig.name is required"});
        }
        if (name == kEndStage) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Agent name 'end' is reserved", name});
        }
        if (!has_tools && tool_access != ToolAccess::None) {
            return tl::unexpected(Error{
                ErrorCode::InvalidCapability,
                "Agent '" + name + "' requests tool access '" + tool_access_to_string(tool_access) +
                    "' without has_tools",
                name
            });
        }
        if (!has_tools && !allowed_tools.empty()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidCapability,
                "Agent '" + name + "' lists allowed_tools without has_tools",
                name
            });
        }
        if (timeout_seconds < 0 || max_retries < 0) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                "Agent '" + name + "' timeout_seconds and max_retries must be >= 0",
                name
            });
        }
        if (max_tokens && *max_tokens <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Agent '" + name + "' max_tokens must be positive", name});
        }
        for (const auto& dep : all_dependencies()) {
            if (dep == name) {
                return tl::unexpected(Error{
                    ErrorCode::UnknownReference,
                    "Agent '" + name + "' cannot depend on itself",
                    name
                });
            }
        }
        for (const auto& rule : routing_rules) {
            if (rule.condition.empty() || rule.target.empty()) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidConfig,
                    "Agent '" + name + "' has a routing rule without condition or target",
                    name
                });
            }
        }
        return {};
    }

    Value to_json() const {
        Value rules = Value::array();
        for (const auto& rule : routing_rules) {
            rules.push_back({{"condition", rule.condition}, {"value", rule.value}, {"target", rule.target}});
        }
        Value j = {
            {"name", name},
            {"stage_order", stage_order},
            {"requires", requires_stages},
            {"after", after_stages},
            {"runs_with", runs_with},
            {"join_strategy", join_strategy_to_string(join_strategy)},
            {"has_llm", has_llm},
            {"has_tools", has_tools},
            {"has_policies", has_policies},
            {"tool_access", tool_access_to_string(tool_access)},
            {"allowed_tools", allowed_tools},
            {"continue_on_tool_failure", continue_on_tool_failure},
            {"model_role", model_role},
            {"prompt_key", prompt_key},
            {"output_key", output_key},
            {"required_output_fields", required_output_fields},
            {"routing_rules", std::move(rules)},
            {"default_next", default_next},
            {"error_next", error_next},
            {"timeout_seconds", timeout_seconds},
            {"max_retries", max_retries}
        };
        j["temperature"] = temperature ? Value(*temperature) : Value(nullptr);
        j["max_tokens"] = max_tokens ? Value(*max_tokens) : Value(nullptr);
        return j;
    }

    static Expected<AgentConfig> from_json(const Value& j) {
        AgentConfig config;
        detail::StateReader reader(j, "agent", ErrorCode::InvalidConfig);
        reader.read("name", config.name);
        reader.read("stage_order", config.stage_order);
        reader.read("requires", config.requires_stages);
        reader.read("after", config.after_stages);
        reader.read("runs_with", config.runs_with);

        std::string join = "all";
        reader.read("join_strategy", join);
        if (auto parsed = join_strategy_from_string(join)) config.join_strategy = *parsed;
        else reader.fail("join_strategy", "unknown value '" + join + "'");

        reader.read("has_llm", config.has_llm);
        reader.read("has_tools", config.has_tools);
        reader.read("has_policies", config.has_policies);

        std::string access = "none";
        reader.read("tool_access", access);
        if (auto parsed = tool_access_from_string(access)) config.tool_access = *parsed;
        else reader.fail("tool_access", "unknown value '" + access + "'");

        reader.read("allowed_tools", config.allowed_tools);
        reader.read("continue_on_tool_failure", config.continue_on_tool_failure);
        reader.read("model_role", config.model_role);
        reader.read("prompt_key", config.prompt_key);
        reader.read("temperature", config.temperature);
        reader.read("max_tokens", config.max_tokens);
        reader.read("output_key", config.output_key);
        reader.read("required_output_fields", config.required_output_fields);

        if (const Value* rules = reader.find("routing_rules")) {
            if (!rules->is_array()) {
                reader.fail("routing_rules", "expected an array");
            } else {
                for (const auto& rule_json : *rules) {
                    RoutingRule rule;
                    detail::StateReader rule_reader(rule_json, "routing_rules", ErrorCode::InvalidConfig);
                    rule_reader.read("condition", rule.condition);
                    rule_reader.read_any("value", rule.value);
                    rule_reader.read("target", rule.target);
                    if (rule_reader.error()) return tl::unexpected(*rule_reader.error());
                    config.routing_rules.push_back(std::move(rule));
                }
            }
        }

        reader.read("default_next", config.default_next);
        reader.read("error_next", config.error_next);
        reader.read("timeout_seconds", config.timeout_seconds);
        reader.read("max_retries", config.max_retries);

        if (reader.error()) {
            return tl::unexpected(*reader.error());
        }
        if (config.output_key.empty()) {
            config.output_key = config.name;
        }
        return config;
    }

    bool operator==(const AgentConfig& other) const {
        return name == other.name &&
               stage_order == other.stage_order &&
               requires_stages == other.requires_stages &&
               after_stages == other.after_stages &&
               runs_with == other.runs_with &&
               join_strategy == other.join_strategy &&
               has_llm == other.has_llm &&
               has_tools == other.has_tools &&
               has_policies == other.has_policies &&
               tool_access == other.tool_access &&
               allowed_tools == other.allowed_tools &&
               continue_on_tool_failure == other.continue_on_tool_failure &&
               model_role == other.model_role &&
               prompt_key == other.prompt_key &&
               temperature == other.temperature &&
               max_tokens == other.max_tokens &&
               output_key == other.output_key &&
               required_output_fields == other.required_output_fields &&
               routing_rules == other.routing_rules &&
               default_next == other.default_next &&
               error_next == other.error_next &&
               timeout_seconds == other.timeout_seconds &&
               max_retries == other.max_retries;
    }

    bool operator!=(const AgentConfig& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// PipelineConfig
// ============================================================================

/**
 * @brief Declarative description of the agent graph.
 *
 * Constructed once, validated, then treated as immutable by the Runtime.
 *
 * @code
 * PipelineConfig pipeline;
 * pipeline.name = "support";
 * pipeline.agents.push_back(intake);
 * pipeline.agents.push_back(planner);
 * pipeline.edge_limits.push_back({"critic", "planner", 3});
 * if (auto ok = pipeline.validate(); !ok) {
 *     std::cerr << ok.error().to_string() << std::endl;
 * }
 * @endcode
 */
struct PipelineConfig {
    std::string name;                                   ///< Pipeline name for logs and metrics (required)
    std::vector<AgentConfig> agents;                    ///< Agents in declaration order

    RunMode default_run_mode = RunMode::Sequential;

    // Global bounds copied into every envelope
    int max_iterations = 3;
    int max_llm_calls = 10;
    int max_agent_hops = 21;
    int default_timeout_seconds = 300;                  ///< Per-agent timeout when the agent sets none (0 = none)

    std::vector<EdgeLimit> edge_limits;
    int default_edge_limit = 0;                         ///< Limit for edges without an entry (0 = unlimited)
    int max_parallel = 0;                               ///< Stages dispatched per parallel round (0 = unlimited)

    std::map<InterruptKind, std::string> resume_stages; ///< Stage to continue from per interrupt kind

    /// Stage names accepted as routing targets besides agent names.
    static const std::set<std::string>& reserved_targets() {
        static const std::set<std::string> targets = {"end", "clarification", "confirmation"};
        return targets;
    }

    /**
     * @brief Validates every agent plus cross-agent references.
     *
     * Rejects duplicate names, unknown routing, dependency, edge-limit and
     * resume targets, and cycles in requires/after.
     */
    Expected<void> validate() const {
        if (name.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "PipelineConfig.name is required"});
        }
        if (max_iterations < 0 || max_llm_calls < 0 || max_agent_hops < 0 ||
            default_timeout_seconds < 0 || default_edge_limit < 0 || max_parallel < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Pipeline bounds must be >= 0", name});
        }

        std::set<std::string> names;
        for (const auto& agent : agents) {
            if (auto result = agent.validate(); !result) {
                return result;
            }
            if (!names.insert(agent.name).second) {
                return tl::unexpected(Error{ErrorCode::DuplicateAgent, "Duplicate agent name: " + agent.name, agent.name});
            }
        }

        auto is_target = [&names](const std::string& target) {
            return names.count(target) > 0 || reserved_targets().count(target) > 0;
        };

        for (const auto& agent : agents) {
            for (const auto& rule : agent.routing_rules) {
                if (!is_target(rule.target)) {
                    return unknown_reference(agent.name, "routes to unknown target", rule.target);
                }
            }
            if (!agent.default_next.empty() && !is_target(agent.default_next)) {
                return unknown_reference(agent.name, "default_next references unknown stage", agent.default_next);
            }
            if (!agent.error_next.empty() && !is_target(agent.error_next)) {
                return unknown_reference(agent.name, "error_next references unknown stage", agent.error_next);
            }
            for (const auto& dep : agent.requires_stages) {
                if (names.count(dep) == 0) return unknown_reference(agent.name, "requires unknown stage", dep);
            }
            for (const auto& dep : agent.after_stages) {
                if (names.count(dep) == 0) return unknown_reference(agent.name, "is after unknown stage", dep);
            }
            for (const auto& dep : agent.runs_with) {
                if (names.count(dep) == 0) return unknown_reference(agent.name, "runs_with unknown stage", dep);
            }
        }

        for (const auto& limit : edge_limits) {
            if (names.count(limit.from) == 0 || names.count(limit.to) == 0) {
                return tl::unexpected(Error{
                    ErrorCode::UnknownReference,
                    "Edge limit references unknown stage",
                    limit.from + "->" + limit.to
                });
            }
            if (limit.max_count < 0) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Edge limit max_count must be >= 0",
                                            limit.from + "->" + limit.to});
            }
        }

        for (const auto& [kind, stage] : resume_stages) {
            if (names.count(stage) == 0) {
                return tl::unexpected(Error{
                    ErrorCode::UnknownReference,
                    std::string("Resume stage for '") + interrupt_kind_to_string(kind) + "' is unknown",
                    stage
                });
            }
        }

        auto order = topological_sort();
        if (!order) {
            return tl::unexpected(order.error());
        }
        return {};
    }

    /** @brief Agent with the given name, or nullptr. */
    const AgentConfig* get_agent(const std::string& agent_name) const {
        for (const auto& agent : agents) {
            if (agent.name == agent_name) return &agent;
        }
        return nullptr;
    }

    /** @brief Agent names sorted by stage_order; ties keep declaration order. */
    std::vector<std::string> get_stage_order() const {
        std::vector<const AgentConfig*> sorted;
        sorted.reserve(agents.size());
        for (const auto& agent : agents) sorted.push_back(&agent);
        std::stable_sort(sorted.begin(), sorted.end(), [](const AgentConfig* a, const AgentConfig* b) {
            return a->stage_order < b->stage_order;
        });
        std::vector<std::string> order;
        order.reserve(sorted.size());
        for (const auto* agent : sorted) order.push_back(agent->name);
        return order;
    }

    /** @brief Dependency order over requires/after; empty if the graph has a cycle. */
    std::vector<std::string> get_topological_order() const {
        auto order = topological_sort();
        return order ? *order : std::vector<std::string>{};
    }

    /**
     * @brief Stages whose dependencies are satisfied by `completed`.
     *
     * A stage is ready when it is not completed itself, every `after` stage
     * is completed, and its `requires` stages satisfy its join strategy:
     * ALL needs every one, ANY needs at least one. Result follows stage order.
     */
    std::vector<std::string> get_ready_stages(const std::set<std::string>& completed) const {
        std::vector<std::string> ready;
        for (const auto& stage : get_stage_order()) {
            if (completed.count(stage) > 0) continue;
            const AgentConfig* agent = get_agent(stage);

            const bool after_ok = std::all_of(agent->after_stages.begin(), agent->after_stages.end(),
                                              [&completed](const std::string& s) { return completed.count(s) > 0; });
            bool requires_ok = true;
            if (agent->join_strategy == JoinStrategy::Any && !agent->requires_stages.empty()) {
                requires_ok = std::any_of(agent->requires_stages.begin(), agent->requires_stages.end(),
                                          [&completed](const std::string& s) { return completed.count(s) > 0; });
            } else {
                requires_ok = std::all_of(agent->requires_stages.begin(), agent->requires_stages.end(),
                                          [&completed](const std::string& s) { return completed.count(s) > 0; });
            }

            if (after_ok && requires_ok) {
                ready.push_back(stage);
            }
        }
        return ready;
    }

    /** @brief Stages that list `stage` in requires or after. */
    std::vector<std::string> get_dependents(const std::string& stage) const {
        std::vector<std::string> dependents;
        for (const auto& agent : agents) {
            const auto deps = agent.all_dependencies();
            if (std::find(deps.begin(), deps.end(), stage) != deps.end()) {
                dependents.push_back(agent.name);
            }
        }
        return dependents;
    }

    /** @brief Configured limit for the edge, else default_edge_limit (0 = unlimited). */
    int get_edge_limit(const std::string& from, const std::string& to) const {
        for (const auto& limit : edge_limits) {
            if (limit.from == from && limit.to == to) {
                return limit.max_count;
            }
        }
        return default_edge_limit;
    }

    std::optional<std::string> get_resume_stage(InterruptKind kind) const {
        auto it = resume_stages.find(kind);
        if (it == resume_stages.end()) return std::nullopt;
        return it->second;
    }

    Value to_json() const {
        Value agents_json = Value::array();
        for (const auto& agent : agents) agents_json.push_back(agent.to_json());

        Value limits = Value::array();
        for (const auto& limit : edge_limits) {
            limits.push_back({{"from", limit.from}, {"to", limit.to}, {"max_count", limit.max_count}});
        }

        Value resume = Value::object();
        for (const auto& [kind, stage] : resume_stages) {
            resume[interrupt_kind_to_string(kind)] = stage;
        }

        return Value{
            {"name", name},
            {"agents", std::move(agents_json)},
            {"default_run_mode", run_mode_to_string(default_run_mode)},
            {"max_iterations", max_iterations},
            {"max_llm_calls", max_llm_calls},
            {"max_agent_hops", max_agent_hops},
            {"default_timeout_seconds", default_timeout_seconds},
            {"edge_limits", std::move(limits)},
            {"default_edge_limit", default_edge_limit},
            {"max_parallel", max_parallel},
            {"resume_stages", std::move(resume)}
        };
    }

    /** @brief Parses a pipeline document. Does not validate. */
    static Expected<PipelineConfig> from_json(const Value& j) {
        PipelineConfig config;
        detail::StateReader reader(j, "pipeline", ErrorCode::InvalidConfig);
        reader.read("name", config.name);

        if (const Value* agents_json = reader.find("agents")) {
            if (!agents_json->is_array()) {
                reader.fail("agents", "expected an array");
            } else {
                for (const auto& agent_json : *agents_json) {
                    auto agent = AgentConfig::from_json(agent_json);
                    if (!agent) return tl::unexpected(agent.error());
                    config.agents.push_back(std::move(*agent));
                }
            }
        }

        std::string mode = "sequential";
        reader.read("default_run_mode", mode);
        if (auto parsed = run_mode_from_string(mode)) config.default_run_mode = *parsed;
        else reader.fail("default_run_mode", "unknown value '" + mode + "'");

        reader.read("max_iterations", config.max_iterations);
        reader.read("max_llm_calls", config.max_llm_calls);
        reader.read("max_agent_hops", config.max_agent_hops);
        reader.read("default_timeout_seconds", config.default_timeout_seconds);
        reader.read("default_edge_limit", config.default_edge_limit);
        reader.read("max_parallel", config.max_parallel);

        if (const Value* limits = reader.find("edge_limits")) {
            if (!limits->is_array()) {
                reader.fail("edge_limits", "expected an array");
            } else {
                for (const auto& limit_json : *limits) {
                    EdgeLimit limit;
                    detail::StateReader limit_reader(limit_json, "edge_limits", ErrorCode::InvalidConfig);
                    limit_reader.read("from", limit.from);
                    limit_reader.read("to", limit.to);
                    limit_reader.read("max_count", limit.max_count);
                    if (limit_reader.error()) return tl::unexpected(*limit_reader.error());
                    config.edge_limits.push_back(std::move(limit));
                }
            }
        }

        if (const Value* resume = reader.find("resume_stages")) {
            if (!resume->is_object()) {
                reader.fail("resume_stages", "expected an object");
            } else {
                for (auto it = resume->begin(); it != resume->end(); ++it) {
                    auto kind = interrupt_kind_from_string(it.key());
                    if (!kind || !it.value().is_string()) {
                        reader.fail("resume_stages", "invalid entry '" + it.key() + "'");
                        break;
                    }
                    config.resume_stages[*kind] = it.value().get<std::string>();
                }
            }
        }

        if (reader.error()) {
            return tl::unexpected(*reader.error());
        }
        return config;
    }

    bool operator==(const PipelineConfig& other) const {
        return name == other.name &&
               agents == other.agents &&
               default_run_mode == other.default_run_mode &&
               max_iterations == other.max_iterations &&
               max_llm_calls == other.max_llm_calls &&
               max_agent_hops == other.max_agent_hops &&
               default_timeout_seconds == other.default_timeout_seconds &&
               edge_limits == other.edge_limits &&
               default_edge_limit == other.default_edge_limit &&
               max_parallel == other.max_parallel &&
               resume_stages == other.resume_stages;
    }

    bool operator!=(const PipelineConfig& other) const {
        return !(*this == other);
    }

private:
    static tl::unexpected<Error> unknown_reference(const std::string& agent, const std::string& what,
                                                   const std::string& target) {
        return tl::unexpected(Error{
            ErrorCode::UnknownReference,
            "Agent '" + agent + "' " + what + " '" + target + "'",
            target
        });
    }

    // Kahn's algorithm over requires/after edges, seeded in stage order.
    Expected<std::vector<std::string>> topological_sort() const {
        std::map<std::string, int> in_degree;
        std::map<std::string, std::vector<std::string>> dependents;
        for (const auto& agent : agents) {
            in_degree.emplace(agent.name, 0);
        }
        for (const auto& agent : agents) {
            for (const auto& dep : agent.all_dependencies()) {
                if (in_degree.count(dep) == 0) continue;
                dependents[dep].push_back(agent.name);
                ++in_degree[agent.name];
            }
        }

        std::deque<std::string> queue;
        for (const auto& stage : get_stage_order()) {
            if (in_degree[stage] == 0) queue.push_back(stage);
        }

        std::vector<std::string> order;
        order.reserve(agents.size());
        while (!queue.empty()) {
            std::string current = queue.front();
            queue.pop_front();
            order.push_back(current);
            for (const auto& dependent : dependents[current]) {
                if (--in_degree[dependent] == 0) {
                    queue.push_back(dependent);
                }
            }
        }

        if (order.size() != in_degree.size()) {
            std::string involved;
            for (const auto& [stage, degree] : in_degree) {
                if (degree > 0) {
                    if (!involved.empty()) involved += ", ";
                    involved += stage;
                }
            }
            return tl::unexpected(Error{ErrorCode::DependencyCycle, "Dependency cycle detected", involved});
        }
        return order;
    }
};

/**
 * @brief Loads and validates a pipeline definition from a JSON file.
 */
inline Expected<PipelineConfig> load_pipeline_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Cannot open pipeline file", path});
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    Value document;
    try {
        document = Value::parse(buffer.str());
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, std::string("Invalid pipeline JSON: ") + e.what(), path});
    }

    auto config = PipelineConfig::from_json(document);
    if (!config) {
        return config;
    }
    if (auto valid = config->validate(); !valid) {
        return tl::unexpected(valid.error());
    }
    return config;
}

} // namespace conductor
