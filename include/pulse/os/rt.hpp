#pragma once
/**
 * @file rt.hpp
 * @brief Helpers to apply CPU affinity and RT scheduling to the *current thread*.
 * @note Linux implements affinity + FIFO/RR. Other platforms report false.
 */

#include <cstdint>
#include <optional>

namespace pulse::os {

    /// @brief Real-time scheduling policy.
    /// - Fifo: fixed-priority, run-to-block.
    /// - RoundRobin: fixed-priority, time-sliced among equal priorities.
    enum class RtSchedPolicy : std::uint8_t {
        Fifo = 0,
        RoundRobin = 1
    };

    /// @brief RT configuration for the current thread.
    /// @var cpu -1 to skip pinning; otherwise CPU index to pin to.
    /// @var policy Desired RT policy (FIFO/RR); only applied with a priority.
    /// @var priority RT priority (Linux [1..99]); nullopt keeps the default scheduler.
    struct RtConfig {
        int cpu = -1;
        RtSchedPolicy policy = RtSchedPolicy::RoundRobin;
        std::optional<int> priority{};
    };

    /// @brief Apply CPU affinity (optional) and RT policy/priority (optional) to the current thread.
    /// @return true on success for this platform; false if unsupported or insufficient privileges.
    bool bind_and_prioritize(const RtConfig&);

} // namespace pulse::os
