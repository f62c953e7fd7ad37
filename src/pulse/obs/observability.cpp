/**
* @file observability.cpp
 * @brief Basic printf-backed implementation of Observer for bring-up.
 */
#include "pulse/obs/observability.hpp"
#include <mutex>
#include <cstdio>

namespace pulse::obs {

    std::string_view to_string(EventKind k) noexcept {
        switch (k) {
            case EventKind::ProcessorFault:     return "processor_fault";
            case EventKind::ProcessorClosed:    return "processor_closed";
            case EventKind::PacketDropped:      return "packet_dropped";
            case EventKind::InvariantViolation: return "invariant_violation";
        }
        return "unknown";
    }

    class SimpleObserver : public Observer {
    public:
        void record(const EngineEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            switch (e.kind) {
                case EventKind::ProcessorFault:     ctr_.faults++; break;
                case EventKind::ProcessorClosed:    ctr_.closures++; break;
                case EventKind::PacketDropped:      ctr_.drops += e.count; return; // counted, not logged
                case EventKind::InvariantViolation: ctr_.violations++; break;
            }
            std::FILE* out = e.kind == EventKind::InvariantViolation ? stderr : stdout;
            const auto kind = to_string(e.kind);
            // JSON-ish line (swap for structured logger later)
            std::fprintf(out,
              R"({"event":"%.*s","processor":"%s","reason":"%s"})" "\n",
              static_cast<int>(kind.size()), kind.data(),
              e.processor.c_str(), e.reason.c_str());
            std::fflush(out);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

    void report_violation(std::string_view what) {
        make_simple_observer()->record(EngineEvent{
            EventKind::InvariantViolation, {}, 1, std::string(what)});
    }

} // namespace pulse::obs
