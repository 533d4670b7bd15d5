#pragma once

// Capability interfaces consumed by the engine. Concrete adapters implement
// these outside the core; tests inject the mocks under tests/mocks.
#include "ILLMProvider.hpp"
#include "IToolExecutor.hpp"
#include "IPromptRegistry.hpp"
#include "IEventContext.hpp"
#include "IPersistenceAdapter.hpp"
#include "IMetricsCollector.hpp"
#include "ILogger.hpp"
