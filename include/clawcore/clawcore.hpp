#pragma once

// Core types
#include "clawcore/core/config.hpp"
#include "clawcore/core/errors.hpp"
#include "clawcore/core/message.hpp"
#include "clawcore/core/truncate.hpp"
#include "clawcore/core/types.hpp"
#include "clawcore/core/uuid.hpp"

// Network
#include "clawcore/net/http_client.hpp"

// LLM providers
#include "clawcore/llm/anthropic.hpp"
#include "clawcore/llm/ollama.hpp"
#include "clawcore/llm/openai.hpp"
#include "clawcore/llm/provider.hpp"
#include "clawcore/llm/registry.hpp"

// Tool system
#include "clawcore/tool/builtin/builtins.hpp"
#include "clawcore/tool/dispatcher.hpp"
#include "clawcore/tool/policy.hpp"
#include "clawcore/tool/registry.hpp"
#include "clawcore/tool/tool.hpp"

// Skills and sandbox
#include "clawcore/sandbox/path_guard.hpp"
#include "clawcore/sandbox/process.hpp"
#include "clawcore/skill/skill.hpp"

// Orchestration
#include "clawcore/agent/agent_loop.hpp"
#include "clawcore/runtime.hpp"

namespace clawcore {

// Get version string
std::string version();

}  // namespace clawcore
