#pragma once

/**
 * @file conductor.hpp
 * @brief Main convenience header for the Conductor pipeline engine
 *
 * Include this single header to get every public Conductor API.
 *
 * Conductor drives a per-request Envelope through a configured graph of
 * agents. Each agent calls an LLM, runs planned tool steps, or passes
 * through; the Runtime follows routing rules (sequential mode) or
 * dependency readiness (parallel mode) until the graph ends, a bound is
 * exhausted, or an interrupt pauses the run for user input.
 *
 * Quick Start:
 * @code
 * #include <conductor/conductor.hpp>
 *
 * int main() {
 *     auto pipeline = conductor::load_pipeline_config("pipeline.json");
 *     if (!pipeline) {
 *         std::cerr << pipeline.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     conductor::RuntimeDependencies deps;
 *     deps.llm_factory = [](const std::string&) { return make_my_provider(); };
 *     deps.logger = conductor::logging::SpdlogLogger::create();
 *
 *     auto runtime = conductor::Runtime::create(*pipeline, deps);
 *     if (!runtime) {
 *         std::cerr << runtime.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     auto env = conductor::Envelope::create("What changed in v2?");
 *     (*runtime)->run(env);
 *     std::cout << env.to_result_dict().dump(2) << std::endl;
 * }
 * @endcode
 *
 * Key Components:
 * - conductor::Envelope: Per-run state, bounds, interrupts and audit trail
 * - conductor::PipelineConfig / AgentConfig: Declarative pipeline graph
 * - conductor::Agent: One processing unit bound to an AgentConfig
 * - conductor::Runtime: Sequential, parallel and streaming execution
 * - conductor::providers: Interfaces for LLMs, tools, prompts, events,
 *   persistence, metrics and logging
 */

// Core types
#include "types.hpp"
#include "cancellation.hpp"
#include "envelope.hpp"
#include "config.hpp"

// Public API
#include "agent.hpp"
#include "runtime.hpp"

// Capability interfaces
#include "providers/interface.hpp"

// Engine components
#include "engine/json_extractor.hpp"
#include "engine/prompt_registry.hpp"
#include "engine/stage_stream.hpp"
#include "engine/tool_registry.hpp"

// Default adapters
#include "logging/spdlog_logger.hpp"
#include "persistence/in_memory_state_store.hpp"

/**
 * @namespace conductor
 * @brief Main namespace for the Conductor library
 *
 * Nested namespaces:
 * - conductor::providers - Capability interfaces consumed by the engine
 * - conductor::engine - Internal engine components
 * - conductor::logging - spdlog-backed logger
 * - conductor::persistence - State store adapters
 */
