#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the dataflow engine.
 * @details These values eliminate magic numbers from the codebase. Override via
 *          config::Loader (environment) or by filling EngineConfig directly.
 */

#include <cstddef>
#include <cstdint>

namespace pulse::config::constants {

// =====================
// Links
// =====================
/// Default bounded queue capacity for a link when connect() is given none.
inline constexpr std::size_t LINK_DEFAULT_CAPACITY = 10;
/// Upper bound accepted from configuration (guards against typos like 1e9).
inline constexpr std::size_t LINK_MAX_CAPACITY     = 1u << 20;

/// Element-type tag used by ports that do not declare one.
inline constexpr const char* PORT_DEFAULT_TYPE = "packet";

// =====================
// Scheduler
// =====================
/// 0 means "one worker per hardware thread".
inline constexpr std::size_t SCHED_DEFAULT_WORKERS  = 0;
/// Fallback when std::thread::hardware_concurrency() reports 0.
inline constexpr std::size_t SCHED_FALLBACK_WORKERS = 2;
/// Hard ceiling on the worker pool.
inline constexpr std::size_t SCHED_MAX_WORKERS      = 256;

/// Pump rounds a single pull may spend in a synchronous cascade before it
/// reports Empty and reschedules its task.
inline constexpr std::uint32_t PULL_DEFAULT_BUDGET = 64;
/// Packets a built-in async processor moves in one poll before yielding.
inline constexpr std::uint32_t POLL_DEFAULT_BUDGET = 128;

// =====================
// Worker pinning (see os/rt_profile.hpp for priorities)
// =====================
inline constexpr bool PIN_WORKERS_DEFAULT = false;
inline constexpr int  PIN_FIRST_CPU       = 0;

} // namespace pulse::config::constants
