#pragma once
/**
 * @file setup_error.hpp
 * @brief Construction-time errors of the built-in processors.
 */

#include <cstdint>
#include <string_view>

namespace pulse::processors {

enum class SetupError : std::uint8_t {
  ChanceOutOfRange = 1,   ///< Drop chance outside [0, 1]
  NoOutputs,              ///< Classify/Fork need at least one output
  NoInputs,               ///< Join needs at least one input
  NullFunction,           ///< Classifier or transform function is empty
  NullChannel,            ///< Channel adapters need a channel
  ZeroCapacity,           ///< PacketChannel capacity must be >= 1
  NullStream              ///< Log needs an output stream
};

std::string_view to_string(SetupError e) noexcept;

} // namespace pulse::processors
