#pragma once
/**
 * @file classify.hpp
 * @brief Fan-out stages: route each packet to one output (Classify) or to all (Fork).
 *
 * Ports hold one link each, so branching is always an explicit processor.
 *  - Classify: the classifier picks exactly one output index per packet;
 *    an index outside [0, outputs) is a processor fault.
 *  - Fork: every packet is cloned to every output, in port order (the last
 *    output receives the original).
 *
 * Both emit into the node's ordered pending list; a full output therefore
 * holds back later emissions to other outputs until it drains.
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "pulse/compat/expected.hpp"
#include "pulse/flow/processor.hpp"
#include "pulse/processors/setup_error.hpp"

namespace pulse::processors {

class Classify final : public flow::SyncProcessor {
public:
  using Fn = std::function<std::size_t(const mem::Packet&)>;

  static pulse_detail::expected<std::unique_ptr<Classify>, SetupError>
  create(std::string name, std::size_t outputs, Fn classifier);

  void process(mem::Packet&& packet, flow::Emitter& out) override;

private:
  Classify(std::string name, std::size_t outputs, Fn classifier);

  Fn classifier_;
};

/// @brief Classifier that routes on PacketMeta::tag: @p tag goes to 0, anything else to 1.
Classify::Fn tag_equals(std::string tag);

class Fork final : public flow::SyncProcessor {
public:
  static pulse_detail::expected<std::unique_ptr<Fork>, SetupError>
  create(std::string name, std::size_t outputs);

  void process(mem::Packet&& packet, flow::Emitter& out) override;

private:
  Fork(std::string name, std::size_t outputs);
};

} // namespace pulse::processors
