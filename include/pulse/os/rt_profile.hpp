#pragma once
/**
 * @file rt_profile.hpp
 * @brief Central defaults for *real-time* priorities used by engine threads.
 *
 * Mechanism lives in pulse::os (affinity + policy application); policy (which
 * priorities to use) lives here so apps can override without touching OS helpers.
 *
 * Worker threads share one priority and use SCHED_RR to avoid starving each
 * other; the timer thread sits slightly above so wake-ups are delivered promptly.
 *
 * Example:
 *   pulse::config::EngineConfig cfg;
 *   cfg.pin_workers = true;
 *   cfg.rt_priority = pulse::os::prio::kWorker;
 */
#include "pulse/os/rt.hpp"

namespace pulse::os::prio {

    /// @brief Scheduler worker threads (run async processor tasks).
    inline constexpr int kWorker = 50;

    /// @brief Timer thread (delivers wake_after deadlines).
    inline constexpr int kTimer  = 60;

} // namespace pulse::os::prio
