#pragma once
#include <cstddef>
#include <fstream>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "lsim/sinks.hpp"

namespace lsim {

inline constexpr int kReplaySchemaVersion = 1;

// JSON Lines writer: one header line, then one line per published tick.
//   {"type":"header","schema_version":1,"metadata":{...}}
//   {"type":"tick","schema_version":1,"payload":{...}}
class ReplayWriter final : public TickSink {
public:
  ReplayWriter(const std::string& path, std::map<std::string, std::string> metadata = {});

  void on_tick(std::shared_ptr<const TickPayload> payload) override;

  std::size_t ticks_written() const noexcept { return written_; }
  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
  std::ofstream out_;
  std::size_t written_{0};
};

struct ReplayTick {
  Tick tick{};
  nlohmann::json payload{};
};

// Reads a replay log back. Any line with another schema version, an unexpected
// type, a missing field or malformed JSON raises ReplayMismatch; nothing is
// skipped or guessed.
class ReplayReader {
public:
  explicit ReplayReader(const std::string& path);

  const std::map<std::string, std::string>& metadata() const noexcept { return metadata_; }

  // Next tick record, or nullopt at end of file.
  std::optional<ReplayTick> next();

  std::size_t line_number() const noexcept { return line_no_; }

private:
  std::ifstream in_;
  std::map<std::string, std::string> metadata_{};
  std::size_t line_no_{0};
};

} // namespace lsim
