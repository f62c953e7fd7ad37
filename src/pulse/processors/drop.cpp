#include "pulse/processors/drop.hpp"

#include <utility>

namespace pulse::processors {

pulse_detail::expected<std::unique_ptr<Drop>, SetupError>
Drop::create(std::string name, double chance, std::uint64_t seed) {
  if (!(chance >= 0.0 && chance <= 1.0)) {   // also rejects NaN
    return pulse_detail::unexpected<SetupError>(SetupError::ChanceOutOfRange);
  }
  return std::unique_ptr<Drop>(new Drop(std::move(name), chance, seed));
}

pulse_detail::expected<std::unique_ptr<Drop>, SetupError>
Drop::create(std::string name, double chance) {
  std::random_device rd;
  const std::uint64_t seed = (static_cast<std::uint64_t>(rd()) << 32) | rd();
  return create(std::move(name), chance, seed);
}

Drop::Drop(std::string name, double chance, std::uint64_t seed)
  : SyncProcessor(std::move(name), flow::PortLayout::uniform(1, 1)),
    rng_(seed),
    dist_(chance) {}

void Drop::process(mem::Packet&& packet, flow::Emitter& out) {
  if (dist_(rng_)) {
    ++dropped_;
    return;
  }
  ++passed_;
  out.emit(0, std::move(packet));
}

} // namespace pulse::processors
