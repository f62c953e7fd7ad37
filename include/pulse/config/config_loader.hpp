#pragma once
/**
 * @file config_loader.hpp
 * @brief Engine configuration and its loader (defaults + environment overrides).
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "pulse/compat/expected.hpp"
#include "pulse/config/constants.hpp"

namespace pulse::config {

    /** @enum ConfigError
     *  @brief Reasons a configuration source was rejected.
     */
    enum class ConfigError : std::uint8_t {
        NotANumber = 1,      ///< Value could not be parsed as an unsigned integer
        OutOfRange,          ///< Parsed value outside the accepted range
        InvalidFlag          ///< Boolean flag not one of 0/1/true/false
    };

    /// Human-readable label for a ConfigError.
    std::string_view to_string(ConfigError e) noexcept;

    /** @struct EngineConfig
     *  @brief Runtime knobs of the scheduler and graph builder.
     */
    struct EngineConfig {
        std::size_t   workers{constants::SCHED_DEFAULT_WORKERS};               ///< 0 = hardware concurrency
        std::size_t   default_link_capacity{constants::LINK_DEFAULT_CAPACITY}; ///< Used by connect() without capacity
        std::uint32_t pull_budget{constants::PULL_DEFAULT_BUDGET};             ///< Pump rounds per pull
        std::uint32_t poll_budget{constants::POLL_DEFAULT_BUDGET};             ///< Packets per poll (built-ins)
        bool          pin_workers{constants::PIN_WORKERS_DEFAULT};             ///< Pin worker i to first_cpu + i
        int           first_cpu{constants::PIN_FIRST_CPU};                     ///< First CPU used when pinning
        std::optional<int> rt_priority{};                                      ///< SCHED_RR priority when pinning

        /// Worker count with the 0 = hardware rule applied.
        [[nodiscard]] std::size_t resolved_workers() const noexcept;
    };

    /** @class Loader
     *  @brief Source of engine configuration.
     */
    class Loader {
    public:
        /// Built-in defaults.
        static EngineConfig defaults() noexcept;

        /**
         * @brief Defaults overridden by PULSE_* environment variables.
         * @details Recognized: PULSE_WORKERS, PULSE_LINK_CAPACITY, PULSE_PULL_BUDGET,
         *          PULSE_POLL_BUDGET, PULSE_PIN_WORKERS. Unset variables keep defaults.
         */
        static pulse_detail::expected<EngineConfig, ConfigError> from_env();

        /**
         * @brief Same as from_env() but with a caller-supplied lookup (testable).
         * @param getenv Returns the raw value for a name or nullptr when unset.
         */
        static pulse_detail::expected<EngineConfig, ConfigError>
        from_lookup(const char* (*getenv)(const char*));
    };

} // namespace pulse::config
