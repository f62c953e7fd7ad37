#pragma once
/**
 * @file transform.hpp
 * @brief Single-input, single-output synchronous stages.
 */

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "pulse/compat/expected.hpp"
#include "pulse/flow/processor.hpp"
#include "pulse/processors/setup_error.hpp"

namespace pulse::processors {

/// @brief Passes every packet through unchanged.
class Identity final : public flow::SyncProcessor {
public:
  explicit Identity(std::string name = "identity");
  void process(mem::Packet&& packet, flow::Emitter& out) override;
};

/**
 * @brief Applies a user function to every packet.
 * @details Returning std::nullopt filters the packet out (no output is
 *          fabricated; the puller simply pulls upstream again). Throwing
 *          faults the processor.
 */
class Transform final : public flow::SyncProcessor {
public:
  using Fn = std::function<std::optional<mem::Packet>(mem::Packet&&)>;

  static pulse_detail::expected<std::unique_ptr<Transform>, SetupError>
  create(std::string name, Fn fn);

  void process(mem::Packet&& packet, flow::Emitter& out) override;

  std::uint64_t filtered() const noexcept { return filtered_; }

private:
  Transform(std::string name, Fn fn);

  Fn            fn_;
  std::uint64_t filtered_{0};
};

} // namespace pulse::processors
