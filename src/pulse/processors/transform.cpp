#include "pulse/processors/transform.hpp"

#include <utility>

namespace pulse::processors {

Identity::Identity(std::string name)
  : SyncProcessor(std::move(name), flow::PortLayout::uniform(1, 1)) {}

void Identity::process(mem::Packet&& packet, flow::Emitter& out) {
  out.emit(0, std::move(packet));
}

pulse_detail::expected<std::unique_ptr<Transform>, SetupError>
Transform::create(std::string name, Fn fn) {
  if (!fn) {
    return pulse_detail::unexpected<SetupError>(SetupError::NullFunction);
  }
  return std::unique_ptr<Transform>(new Transform(std::move(name), std::move(fn)));
}

Transform::Transform(std::string name, Fn fn)
  : SyncProcessor(std::move(name), flow::PortLayout::uniform(1, 1)), fn_(std::move(fn)) {}

void Transform::process(mem::Packet&& packet, flow::Emitter& out) {
  std::optional<mem::Packet> result = fn_(std::move(packet));
  if (!result) {
    ++filtered_;
    return;
  }
  out.emit(0, std::move(*result));
}

} // namespace pulse::processors
