#pragma once

#include "backoff.hpp"      // Strategies and runtime polymorphism
#include "decision.hpp"     // retry_after / halt
#include "execution.hpp"    // Sender/receiver core
#include "log.hpp"          // Logger used by the engines
#include "policies.hpp"     // with_max_attempts, retry_when
#include "retry.hpp"        // Blocking engine
#include "retry_async.hpp"  // Suspension-based engine
#include "step.hpp"         // Strategy consultation shared by both engines
