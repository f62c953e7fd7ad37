#include "pulse/processors/setup_error.hpp"

namespace pulse::processors {

std::string_view to_string(SetupError e) noexcept {
  switch (e) {
    case SetupError::ChanceOutOfRange: return "chance_out_of_range";
    case SetupError::NoOutputs:        return "no_outputs";
    case SetupError::NoInputs:         return "no_inputs";
    case SetupError::NullFunction:     return "null_function";
    case SetupError::NullChannel:      return "null_channel";
    case SetupError::ZeroCapacity:     return "zero_capacity";
    case SetupError::NullStream:       return "null_stream";
  }
  return "unknown";
}

} // namespace pulse::processors
