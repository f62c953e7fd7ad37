#pragma once
/**
 * @file port.hpp
 * @brief Typed attachment points declared by processors.
 */

#include <cstddef>
#include <string>
#include <vector>

#include "pulse/config/constants.hpp"
#include "pulse/flow/status.hpp"

namespace pulse::flow {

/// @brief One input or output port: a name and the element type it carries.
struct PortSpec {
  std::string name;                                         ///< For stats and error messages
  std::string type{config::constants::PORT_DEFAULT_TYPE};   ///< Must match across a link
};

/// @brief Ports of a processor, fixed for its lifetime.
struct PortLayout {
  std::vector<PortSpec> inputs;
  std::vector<PortSpec> outputs;

  /// @brief @p n_in inputs and @p n_out outputs named in0.., out0.. with one type.
  static PortLayout uniform(std::size_t n_in, std::size_t n_out,
                            const std::string& type = config::constants::PORT_DEFAULT_TYPE);
};

/// @brief A port addressed inside a graph.
struct PortRef {
  ProcessorId node{kNoProcessor};
  std::size_t port{0};
};

/// @brief Output port @p port of @p node.
inline PortRef out(ProcessorId node, std::size_t port = 0) noexcept { return {node, port}; }
/// @brief Input port @p port of @p node.
inline PortRef in(ProcessorId node, std::size_t port = 0) noexcept { return {node, port}; }

} // namespace pulse::flow
