#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace pulse::mem {

/**
 * @file packet.hpp
 * @brief Packet value type moved between processors and links.
 *
 * A Packet is move-only: exactly one processor or link holds it at any
 * instant and handoff transfers ownership. Duplicating a packet (e.g. in a
 * fan-out stage) is explicit through clone().
 */

/// @brief Number of mutable annotation slots carried by every packet.
inline constexpr std::size_t kAnnotationSlots = 4;

/**
 * @brief Structured metadata carried alongside the payload.
 */
struct PacketMeta final {
  /// @brief Time the packet entered the graph.
  std::chrono::steady_clock::time_point ingress_time{};

  /// @brief Ingress port/interface identifier.
  std::uint16_t ingress_port{0};

  /// @brief Sequence number assigned by the creating source.
  std::uint64_t seq{0};

  /// @brief Classification label written by classifier stages.
  std::string tag{};

  /// @brief Scratch slots for classification stages (e.g. output index, flow hash).
  std::array<std::uint64_t, kAnnotationSlots> annotations{};
};

/**
 * @brief Raw bytes plus metadata.
 */
class Packet final {
public:
  Packet() noexcept = default;

  explicit Packet(std::vector<std::uint8_t> payload) noexcept
    : payload_(std::move(payload)) {}

  Packet(std::vector<std::uint8_t> payload, PacketMeta meta) noexcept
    : payload_(std::move(payload)), meta_(std::move(meta)) {}

  Packet(const Packet&)            = delete;
  Packet& operator=(const Packet&) = delete;
  Packet(Packet&&) noexcept            = default;
  Packet& operator=(Packet&&) noexcept = default;

  /// @brief Explicit deep copy (payload + metadata).
  [[nodiscard]] Packet clone() const { return Packet(payload_, meta_); }

  std::vector<std::uint8_t>&       payload() noexcept { return payload_; }
  const std::vector<std::uint8_t>& payload() const noexcept { return payload_; }

  PacketMeta&       meta() noexcept { return meta_; }
  const PacketMeta& meta() const noexcept { return meta_; }

  std::size_t size() const noexcept { return payload_.size(); }

private:
  std::vector<std::uint8_t> payload_{};
  PacketMeta                meta_{};
};

/// @brief Convenience constructor used by sources and tests.
Packet make_packet(std::uint64_t seq, std::string tag = {},
                   std::vector<std::uint8_t> payload = {});

} // namespace pulse::mem
