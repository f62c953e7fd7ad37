/**
* @file config_loader.cpp
 * @brief Defaults + PULSE_* environment overrides for EngineConfig.
 */
#include "pulse/config/config_loader.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>
#include <thread>

namespace pulse::config {
    using namespace pulse::config::constants;

    std::string_view to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::NotANumber:  return "not a number";
            case ConfigError::OutOfRange:  return "out of range";
            case ConfigError::InvalidFlag: return "invalid flag";
        }
        return "unknown";
    }

    std::size_t EngineConfig::resolved_workers() const noexcept {
        if (workers != 0) return workers;
        const auto hw = static_cast<std::size_t>(std::thread::hardware_concurrency());
        return hw == 0 ? SCHED_FALLBACK_WORKERS : hw;
    }

    EngineConfig Loader::defaults() noexcept {
        return EngineConfig{};
    }

    namespace {

    pulse_detail::expected<std::uint64_t, ConfigError>
    parse_unsigned(const char* raw, std::uint64_t lo, std::uint64_t hi) {
        const std::string_view s{raw};
        std::uint64_t v = 0;
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) {
            return pulse_detail::unexpected<ConfigError>(ConfigError::NotANumber);
        }
        if (v < lo || v > hi) {
            return pulse_detail::unexpected<ConfigError>(ConfigError::OutOfRange);
        }
        return v;
    }

    pulse_detail::expected<bool, ConfigError> parse_flag(const char* raw) {
        const std::string_view s{raw};
        if (s == "1" || s == "true")  return true;
        if (s == "0" || s == "false") return false;
        return pulse_detail::unexpected<ConfigError>(ConfigError::InvalidFlag);
    }

    const char* system_getenv(const char* name) {
        return std::getenv(name);
    }

    } // namespace

    pulse_detail::expected<EngineConfig, ConfigError> Loader::from_env() {
        return from_lookup(&system_getenv);
    }

    pulse_detail::expected<EngineConfig, ConfigError>
    Loader::from_lookup(const char* (*getenv)(const char*)) {
        EngineConfig cfg = defaults();

        if (const char* v = getenv("PULSE_WORKERS")) {
            auto n = parse_unsigned(v, 0, SCHED_MAX_WORKERS);
            if (!n) return pulse_detail::unexpected<ConfigError>(n.error());
            cfg.workers = static_cast<std::size_t>(*n);
        }
        if (const char* v = getenv("PULSE_LINK_CAPACITY")) {
            auto n = parse_unsigned(v, 1, LINK_MAX_CAPACITY);
            if (!n) return pulse_detail::unexpected<ConfigError>(n.error());
            cfg.default_link_capacity = static_cast<std::size_t>(*n);
        }
        if (const char* v = getenv("PULSE_PULL_BUDGET")) {
            auto n = parse_unsigned(v, 1, UINT32_MAX);
            if (!n) return pulse_detail::unexpected<ConfigError>(n.error());
            cfg.pull_budget = static_cast<std::uint32_t>(*n);
        }
        if (const char* v = getenv("PULSE_POLL_BUDGET")) {
            auto n = parse_unsigned(v, 1, UINT32_MAX);
            if (!n) return pulse_detail::unexpected<ConfigError>(n.error());
            cfg.poll_budget = static_cast<std::uint32_t>(*n);
        }
        if (const char* v = getenv("PULSE_PIN_WORKERS")) {
            auto f = parse_flag(v);
            if (!f) return pulse_detail::unexpected<ConfigError>(f.error());
            cfg.pin_workers = *f;
        }
        return cfg;
    }

} // namespace pulse::config
