#pragma once
/**
 * @file log.hpp
 * @brief Passthrough stage that writes one line per packet.
 *
 * Line format (JSON-ish, like the observer's):
 *   {"processor":"<name>","seq":N,"tag":"<tag>","ingress_port":P,"bytes":B}
 *
 * The stream is borrowed and must outlive the graph; it is flushed when the
 * stage is destroyed.
 */

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

#include "pulse/compat/expected.hpp"
#include "pulse/flow/processor.hpp"
#include "pulse/processors/setup_error.hpp"

namespace pulse::processors {

class Log final : public flow::SyncProcessor {
public:
  static pulse_detail::expected<std::unique_ptr<Log>, SetupError>
  create(std::string name, std::FILE* out);

  ~Log() override;

  void process(mem::Packet&& packet, flow::Emitter& out) override;

  std::uint64_t logged() const noexcept { return logged_; }

private:
  Log(std::string name, std::FILE* out);

  std::FILE*    out_;
  std::uint64_t logged_{0};
};

} // namespace pulse::processors
