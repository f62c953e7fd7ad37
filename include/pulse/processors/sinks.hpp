#pragma once
/**
 * @file sinks.hpp
 * @brief Egress adapters: asynchronous processors with one input and no output.
 *
 * A sink's pulls are the demand that drives the graph; nothing upstream
 * moves unless some sink (or task boundary) asks for it.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "pulse/compat/expected.hpp"
#include "pulse/flow/processor.hpp"
#include "pulse/processors/channel.hpp"
#include "pulse/processors/setup_error.hpp"

namespace pulse::processors {

/**
 * @brief Stores every packet it pulls.
 * @details With permits set, the sink pulls at most that many packets and
 *          then waits for grant(); without, it pulls whenever data arrives.
 *          All observers are thread-safe.
 */
class CollectorSink final : public flow::AsyncProcessor {
public:
  explicit CollectorSink(std::string name = "collector",
                         std::optional<std::size_t> permits = std::nullopt);

  flow::PollStatus poll(flow::TaskContext& ctx) override;

  /// @brief Allow @p n more pulls and wake the sink.
  void grant(std::size_t n);
  /// @brief Drop the permit limit and wake the sink.
  void grant_unlimited();

  std::size_t                size() const;
  std::vector<std::uint64_t> seqs() const;
  std::vector<std::string>   tags() const;
  /// @brief Move the collected packets out.
  std::vector<mem::Packet>   take();
  /// @brief True once the input reported Closed.
  bool closed() const noexcept { return closed_.load(std::memory_order_acquire); }

private:
  void wake_parked(std::unique_lock<std::mutex>& lk);

  mutable std::mutex         mu_;
  std::vector<mem::Packet>   packets_;
  std::optional<std::size_t> permits_;
  flow::Waker                waker_;
  std::atomic<bool>          closed_{false};
};

/// @brief Consumes and discards everything (counts only).
class BlackHoleSink final : public flow::AsyncProcessor {
public:
  explicit BlackHoleSink(std::string name = "black_hole");

  flow::PollStatus poll(flow::TaskContext& ctx) override;

  std::uint64_t consumed() const noexcept { return consumed_.load(std::memory_order_relaxed); }

private:
  std::atomic<std::uint64_t> consumed_{0};
};

/**
 * @brief Delivers packets to an external thread through a PacketChannel.
 * @details A lagging reader fills the channel, which backpressures the graph.
 *          The channel is closed when the input closes, so the reader's
 *          recv() ends after the last packet.
 */
class ChannelSink final : public flow::AsyncProcessor {
public:
  static pulse_detail::expected<std::unique_ptr<ChannelSink>, SetupError>
  create(std::string name, std::shared_ptr<PacketChannel> channel);

  flow::PollStatus poll(flow::TaskContext& ctx) override;
  void drain_held(std::vector<mem::Packet>& out) override;

private:
  ChannelSink(std::string name, std::shared_ptr<PacketChannel> channel);

  std::shared_ptr<PacketChannel> channel_;
  std::optional<mem::Packet>     held_;
};

} // namespace pulse::processors
