#include "pulse/processors/log.hpp"

#include <utility>

namespace pulse::processors {

pulse_detail::expected<std::unique_ptr<Log>, SetupError>
Log::create(std::string name, std::FILE* out) {
  if (out == nullptr) {
    return pulse_detail::unexpected<SetupError>(SetupError::NullStream);
  }
  return std::unique_ptr<Log>(new Log(std::move(name), out));
}

Log::Log(std::string name, std::FILE* out)
  : SyncProcessor(std::move(name), flow::PortLayout::uniform(1, 1)), out_(out) {}

Log::~Log() {
  std::fflush(out_);
}

void Log::process(mem::Packet&& packet, flow::Emitter& out) {
  const auto& m = packet.meta();
  std::fprintf(out_,
    R"({"processor":"%s","seq":%llu,"tag":"%s","ingress_port":%u,"bytes":%zu})" "\n",
    name().c_str(), static_cast<unsigned long long>(m.seq), m.tag.c_str(),
    static_cast<unsigned>(m.ingress_port), packet.size());
  ++logged_;
  out.emit(0, std::move(packet));
}

} // namespace pulse::processors
