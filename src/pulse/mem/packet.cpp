// =============================================================
// File: src/pulse/mem/packet.cpp
// =============================================================
#include "pulse/mem/packet.hpp"

namespace pulse::mem {

Packet make_packet(std::uint64_t seq, std::string tag, std::vector<std::uint8_t> payload) {
  PacketMeta meta;
  meta.ingress_time = std::chrono::steady_clock::now();
  meta.seq          = seq;
  meta.tag          = std::move(tag);
  return Packet(std::move(payload), std::move(meta));
}

} // namespace pulse::mem
