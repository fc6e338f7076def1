#pragma once

// Minimal sender/receiver core used by retry_async:
//   - concepts.hpp: receivers, operation states, senders, schedulers
//   - stop_token.hpp: stop token queries on environments
//   - factories.hpp: just
//   - then.hpp: value transformation adaptor
//   - timer_loop.hpp: single-threaded loop with a timed scheduler
//   - sync_wait.hpp: blocking consumer

#include "execution/concepts.hpp"    // Core concepts and customization points
#include "execution/factories.hpp"   // Sender factory
#include "execution/stop_token.hpp"  // Stop token support
#include "execution/sync_wait.hpp"   // Synchronization utilities
#include "execution/then.hpp"        // Sender adaptors
#include "execution/timer_loop.hpp"  // Timed scheduler
