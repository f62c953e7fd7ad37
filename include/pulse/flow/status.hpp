#pragma once
/**
 * @file status.hpp
 * @brief Flow-control signals, identifiers and error taxonomy of the engine.
 *
 * Taxonomy:
 *  - Empty / Full: expected flow control, never surfaced as failures.
 *  - Closed: expected terminal signal, propagated along links.
 *  - ProcessorFault: a processor threw; isolated to that processor.
 *  - InvariantViolation: a link/port contract broke; fatal.
 */

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pulse::obs {
class Observer;
} // namespace pulse::obs

namespace pulse::flow {

/// Index of a processor in its graph's arena.
using ProcessorId = std::uint32_t;
/// Index of a link in its graph's arena.
using LinkId = std::uint32_t;

inline constexpr ProcessorId kNoProcessor = std::numeric_limits<ProcessorId>::max();
inline constexpr LinkId      kNoLink      = std::numeric_limits<LinkId>::max();

/// Result of a non-blocking enqueue.
enum class PushStatus : std::uint8_t {
  Accepted = 0,  ///< Packet moved into the link
  Full,          ///< Backpressure: caller keeps the packet
  Closed         ///< Consumer gone for good: caller drops with accounting
};

/// Result of a non-blocking dequeue.
enum class PullStatus : std::uint8_t {
  Ready = 0,     ///< A packet was written to the out-parameter
  Empty,         ///< Nothing available yet
  Closed         ///< Producer closed and queue drained
};

/// Result of one poll of an asynchronous processor.
enum class PollStatus : std::uint8_t {
  Pending = 0,   ///< Suspended; a wake has been registered
  Yield,         ///< Runnable but giving the worker back (budget spent)
  Complete       ///< Finished; the engine closes any links still open
};

/// Execution mode tag of a processor.
enum class ProcessorKind : std::uint8_t {
  Sync = 0,
  Async
};

/// Lifecycle of a processor inside a graph.
enum class ProcessorState : std::uint8_t {
  Running = 0,
  Closed,        ///< Completed or torn down; links closed
  Failed         ///< ProcessorFault; links closed
};

std::string_view to_string(PushStatus s) noexcept;
std::string_view to_string(PullStatus s) noexcept;
std::string_view to_string(ProcessorKind k) noexcept;
std::string_view to_string(ProcessorState s) noexcept;

/**
 * @brief Exception processors throw to signal a ProcessorFault.
 * Any exception escaping a processor is treated the same way; values not
 * derived from std::exception are recorded as "unknown exception".
 */
class ProcessorError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Report an InvariantViolation and abort the process.
 * @param what Description of the broken contract.
 * @param observer Graph observer to report to; nullptr uses obs::make_simple_observer().
 */
[[noreturn]] void invariant_violation(std::string_view what,
                                      obs::Observer* observer = nullptr) noexcept;

} // namespace pulse::flow
