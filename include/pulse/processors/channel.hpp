#pragma once
/**
 * @file channel.hpp
 * @brief Bounded, thread-safe packet handoff between external threads and graph tasks.
 *
 * The external side uses the blocking calls (send/recv); the graph side uses
 * the non-blocking ones and passes its Waker, which is stored when the call
 * reports Full/Empty and woken once the condition changes. The check and the
 * registration happen under one lock, so no wake is lost.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "pulse/compat/expected.hpp"
#include "pulse/flow/status.hpp"
#include "pulse/flow/waker.hpp"
#include "pulse/mem/packet.hpp"
#include "pulse/processors/setup_error.hpp"

namespace pulse::processors {

class PacketChannel final {
public:
  static pulse_detail::expected<std::shared_ptr<PacketChannel>, SetupError>
  create(std::size_t capacity);

  explicit PacketChannel(std::size_t capacity);

  PacketChannel(const PacketChannel&)            = delete;
  PacketChannel& operator=(const PacketChannel&) = delete;

  /**
   * @brief Non-blocking send.
   * @param p Moved from only when Accepted.
   * @param w Stored and woken when space frees up, if the result is Full.
   */
  flow::PushStatus try_send(mem::Packet&& p, const flow::Waker& w = nullptr);

  /// @brief Non-blocking receive; @p w is stored for "data available" when Empty.
  flow::PullStatus try_recv(mem::Packet& out, const flow::Waker& w = nullptr);

  /// @brief Block until there is room. @return false if the channel is closed (packet dropped).
  bool send(mem::Packet&& p);

  /// @brief Block until a packet arrives. nullopt once closed and drained.
  std::optional<mem::Packet> recv();

  /// @brief recv() bounded by @p timeout. nullopt on timeout or closed-and-drained.
  std::optional<mem::Packet> recv_for(std::chrono::nanoseconds timeout);

  /// @brief No more sends; receivers drain what is queued, then see Closed.
  void close() noexcept;

  bool        closed() const;
  std::size_t size() const;
  std::size_t capacity() const noexcept { return capacity_; }

private:
  void notify_data(std::unique_lock<std::mutex>& lk);
  void notify_space(std::unique_lock<std::mutex>& lk);

  const std::size_t       capacity_;
  mutable std::mutex      mu_;
  std::condition_variable data_cv_;
  std::condition_variable space_cv_;
  std::deque<mem::Packet> queue_;
  bool                    closed_{false};
  flow::Waker             data_waker_;
  flow::Waker             space_waker_;
};

} // namespace pulse::processors
