#pragma once
/**
 * @file sources.hpp
 * @brief Ingress adapters: asynchronous processors with one output and no input.
 *
 * Every source keeps a packet refused with Full and retries it on the next
 * poll; it never drops or spins. Each source stamps PacketMeta::ingress_port
 * with its own port number (default 0). Teardown hands held packets back to the
 * engine through drain_held().
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pulse/compat/expected.hpp"
#include "pulse/flow/processor.hpp"
#include "pulse/processors/channel.hpp"
#include "pulse/processors/setup_error.hpp"

namespace pulse::processors {

/**
 * @brief Emits a fixed list of packets in order.
 * @details With @p linger the source stays open after the last packet
 *          (useful to test teardown); otherwise it completes.
 */
class VectorSource final : public flow::AsyncProcessor {
public:
  VectorSource(std::string name, std::vector<mem::Packet> packets, bool linger = false,
               std::uint16_t ingress_port = 0);

  /// @brief @p count packets with seq 0..count-1 and tag @p tag.
  static std::unique_ptr<VectorSource> sequence(std::string name, std::uint64_t count,
                                                const std::string& tag = {}, bool linger = false,
                                                std::uint16_t ingress_port = 0);

  flow::PollStatus poll(flow::TaskContext& ctx) override;
  void drain_held(std::vector<mem::Packet>& out) override;

  std::uint64_t pushed() const noexcept { return pushed_.load(std::memory_order_relaxed); }
  /// @brief Pushes answered Full.
  std::uint64_t blocked() const noexcept { return blocked_.load(std::memory_order_relaxed); }

private:
  std::deque<mem::Packet>    packets_;
  bool                       linger_;
  std::atomic<std::uint64_t> pushed_{0};
  std::atomic<std::uint64_t> blocked_{0};
};

/// @brief Forwards packets an external thread sends into a PacketChannel.
class ChannelSource final : public flow::AsyncProcessor {
public:
  static pulse_detail::expected<std::unique_ptr<ChannelSource>, SetupError>
  create(std::string name, std::shared_ptr<PacketChannel> channel,
         std::uint16_t ingress_port = 0);

  flow::PollStatus poll(flow::TaskContext& ctx) override;
  void drain_held(std::vector<mem::Packet>& out) override;

private:
  ChannelSource(std::string name, std::shared_ptr<PacketChannel> channel,
                std::uint16_t ingress_port);

  std::shared_ptr<PacketChannel> channel_;
  std::uint16_t                  ingress_port_;
  std::optional<mem::Packet>     held_;
};

/// @brief Emits a packet every @p period, @p count times (0 = until torn down).
class IntervalSource final : public flow::AsyncProcessor {
public:
  IntervalSource(std::string name, std::chrono::nanoseconds period, std::uint64_t count,
                 std::string tag = {}, std::uint16_t ingress_port = 0);

  flow::PollStatus poll(flow::TaskContext& ctx) override;
  void drain_held(std::vector<mem::Packet>& out) override;

  std::uint64_t emitted() const noexcept { return emitted_.load(std::memory_order_relaxed); }

private:
  std::chrono::nanoseconds                             period_;
  std::uint64_t                                        count_;
  std::string                                          tag_;
  std::uint16_t                                        ingress_port_;
  std::optional<std::chrono::steady_clock::time_point> next_due_;
  std::optional<mem::Packet>                           held_;
  std::atomic<std::uint64_t>                           emitted_{0};
};

} // namespace pulse::processors
