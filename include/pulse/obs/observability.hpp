#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: engine events + counters.
 * @details The engine reports processor faults, closures, drops and invariant
 *          violations here. Observers watch; they never take part in the pull protocol.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace pulse::obs {

    /** @enum EventKind
     *  @brief Category of an engine event.
     */
    enum class EventKind : std::uint8_t {
        ProcessorFault = 0,   ///< A processor threw; it was isolated and closed
        ProcessorClosed,      ///< A processor finished or was torn down
        PacketDropped,        ///< Packets discarded with accounting
        InvariantViolation    ///< Link/port contract broken; the process aborts
    };

    /// Stable label for an EventKind (used in log lines).
    std::string_view to_string(EventKind k) noexcept;

    /** @struct Counters
     *  @brief Process-level counters for engine events.
     */
    struct Counters {
        uint64_t faults{0};      ///< ProcessorFault events
        uint64_t closures{0};    ///< ProcessorClosed events
        uint64_t drops{0};       ///< Packets dropped (sum of PacketDropped counts)
        uint64_t violations{0};  ///< InvariantViolation events
    };

    /** @struct EngineEvent
     *  @brief Payload describing a single engine event.
     */
    struct EngineEvent {
        EventKind   kind{EventKind::ProcessorClosed}; ///< Event category
        std::string processor;                        ///< Processor name (may be empty for link-level events)
        uint64_t    count{1};                         ///< Packets affected (drops)
        std::string reason;                           ///< Reason label (for humans/logs)
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single engine event. Must be thread-safe.
        virtual void record(const EngineEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide printf-backed observer (JSON-ish lines on stdout, violations on stderr).
    Observer* make_simple_observer();

    /// Report an invariant violation through the simple observer. Does not abort.
    void report_violation(std::string_view what);

} // namespace pulse::obs
