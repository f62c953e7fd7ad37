#pragma once
/**
 * @file drop.hpp
 * @brief Random packet loss (Bernoulli), for fault-injection and testing.
 */

#include <cstdint>
#include <memory>
#include <random>
#include <string>

#include "pulse/compat/expected.hpp"
#include "pulse/flow/processor.hpp"
#include "pulse/processors/setup_error.hpp"

namespace pulse::processors {

class Drop final : public flow::SyncProcessor {
public:
  /**
   * @brief Drop each packet with probability @p chance.
   * @param chance In [0, 1]; 1.0 drops everything, 0.0 nothing.
   * @param seed   RNG seed, for reproducible loss patterns.
   */
  static pulse_detail::expected<std::unique_ptr<Drop>, SetupError>
  create(std::string name, double chance, std::uint64_t seed);

  /// @brief Same, seeded from std::random_device.
  static pulse_detail::expected<std::unique_ptr<Drop>, SetupError>
  create(std::string name, double chance);

  void process(mem::Packet&& packet, flow::Emitter& out) override;

  std::uint64_t dropped() const noexcept { return dropped_; }
  std::uint64_t passed() const noexcept { return passed_; }

private:
  Drop(std::string name, double chance, std::uint64_t seed);

  std::mt19937_64             rng_;
  std::bernoulli_distribution dist_;
  std::uint64_t               dropped_{0};
  std::uint64_t               passed_{0};
};

} // namespace pulse::processors
