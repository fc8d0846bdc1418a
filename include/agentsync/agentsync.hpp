#pragma once

// AgentSync: state, lifecycle and conflict coordination for agent fleets
//
// Tracks each agent's health and activity, enforces an allow-listed
// lifecycle, and reconciles divergent local/remote views of agent state.

// Core
#include "agentsync/types.hpp"
#include "agentsync/identifiers.hpp"
#include "agentsync/exceptions.hpp"
#include "agentsync/config.hpp"
#include "agentsync/logging.hpp"
#include "agentsync/monitor.hpp"

// Agent model
#include "agentsync/agent_metrics.hpp"
#include "agentsync/agent_state.hpp"
#include "agentsync/lifecycle.hpp"

// Conflict engine
#include "agentsync/conflict.hpp"
#include "agentsync/conflict_handler.hpp"
#include "agentsync/conflict_resolver.hpp"

// Fleet facade
#include "agentsync/coordinator.hpp"
