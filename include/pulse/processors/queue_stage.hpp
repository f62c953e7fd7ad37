#pragma once
/**
 * @file queue_stage.hpp
 * @brief Asynchronous task boundary with an optional per-packet transform.
 *
 * Splits a synchronous chain in two: everything upstream runs on this
 * stage's task, everything downstream on the task of whoever pulls it.
 */

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pulse/flow/processor.hpp"
#include "pulse/processors/transform.hpp"

namespace pulse::processors {

class QueueStage final : public flow::AsyncProcessor {
public:
  explicit QueueStage(std::string name = "queue", Transform::Fn fn = {});

  flow::PollStatus poll(flow::TaskContext& ctx) override;
  void drain_held(std::vector<mem::Packet>& out) override;

  std::uint64_t forwarded() const noexcept { return forwarded_; }

private:
  Transform::Fn              fn_;
  std::optional<mem::Packet> held_;   ///< Refused by a full output
  std::uint64_t              forwarded_{0};
};

} // namespace pulse::processors
