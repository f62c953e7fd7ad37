#pragma once
/**
 * @file join.hpp
 * @brief Fan-in: merges N inputs into one output.
 *
 * Pull order is round-robin, resuming after the input that delivered last,
 * so a busy input cannot starve the others. Inputs that report Closed are
 * skipped; the join completes once all of them have closed.
 */

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pulse/compat/expected.hpp"
#include "pulse/flow/processor.hpp"
#include "pulse/processors/setup_error.hpp"

namespace pulse::processors {

class Join final : public flow::AsyncProcessor {
public:
  static pulse_detail::expected<std::unique_ptr<Join>, SetupError>
  create(std::string name, std::size_t inputs);

  flow::PollStatus poll(flow::TaskContext& ctx) override;
  void drain_held(std::vector<mem::Packet>& out) override;

private:
  Join(std::string name, std::size_t inputs);

  std::optional<mem::Packet> held_;
  std::vector<bool>          closed_;
  std::size_t                next_{0};   ///< First input to try on the next pull
};

} // namespace pulse::processors
