#include "pulse/processors/classify.hpp"

#include <string>
#include <utility>

namespace pulse::processors {

pulse_detail::expected<std::unique_ptr<Classify>, SetupError>
Classify::create(std::string name, std::size_t outputs, Fn classifier) {
  if (outputs == 0) {
    return pulse_detail::unexpected<SetupError>(SetupError::NoOutputs);
  }
  if (!classifier) {
    return pulse_detail::unexpected<SetupError>(SetupError::NullFunction);
  }
  return std::unique_ptr<Classify>(new Classify(std::move(name), outputs, std::move(classifier)));
}

Classify::Classify(std::string name, std::size_t outputs, Fn classifier)
  : SyncProcessor(std::move(name), flow::PortLayout::uniform(1, outputs)),
    classifier_(std::move(classifier)) {}

void Classify::process(mem::Packet&& packet, flow::Emitter& out) {
  const std::size_t port = classifier_(packet);
  if (port >= out.outputs()) {
    throw flow::ProcessorError(name() + ": classifier chose output " + std::to_string(port) +
                               " of " + std::to_string(out.outputs()));
  }
  packet.meta().annotations[0] = port;
  out.emit(port, std::move(packet));
}

Classify::Fn tag_equals(std::string tag) {
  return [tag = std::move(tag)](const mem::Packet& p) -> std::size_t {
    return p.meta().tag == tag ? 0 : 1;
  };
}

pulse_detail::expected<std::unique_ptr<Fork>, SetupError>
Fork::create(std::string name, std::size_t outputs) {
  if (outputs == 0) {
    return pulse_detail::unexpected<SetupError>(SetupError::NoOutputs);
  }
  return std::unique_ptr<Fork>(new Fork(std::move(name), outputs));
}

Fork::Fork(std::string name, std::size_t outputs)
  : SyncProcessor(std::move(name), flow::PortLayout::uniform(1, outputs)) {}

void Fork::process(mem::Packet&& packet, flow::Emitter& out) {
  const std::size_t last = out.outputs() - 1;
  for (std::size_t port = 0; port < last; ++port) {
    out.emit(port, packet.clone());
  }
  out.emit(last, std::move(packet));
}

} // namespace pulse::processors
