#include "lsim/replay_log.hpp"

#include <stdexcept>

#include "lsim/errors.hpp"
#include "lsim/json.hpp"
#include "lsim/log.hpp"

namespace lsim {

using json = nlohmann::json;

namespace {

std::string where(std::size_t line) { return "line " + std::to_string(line) + ": "; }

json parse_record(const std::string& text, const char* type, std::size_t line) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ReplayMismatch(where(line) + "malformed JSON (" + e.what() + ")");
  }
  if (!j.is_object()) throw ReplayMismatch(where(line) + "record is not a JSON object");

  try {
    const auto version = j.at("schema_version").get<int64_t>();
    if (version != kReplaySchemaVersion) {
      throw ReplayMismatch(where(line) + "schema_version " + std::to_string(version) +
                           " does not match reader version " + std::to_string(kReplaySchemaVersion));
    }
    const auto got = j.at("type").get<std::string>();
    if (got != type) throw ReplayMismatch(where(line) + "expected " + type + " record, got " + got);
  } catch (const json::exception& e) {
    // out_of_range for a missing key, type_error for a wrongly typed one
    throw ReplayMismatch(where(line) + e.what());
  }
  return j;
}

} // namespace

ReplayWriter::ReplayWriter(const std::string& path, std::map<std::string, std::string> metadata)
  : path_(path), out_(path, std::ios::binary | std::ios::trunc) {
  if (!out_) throw std::runtime_error("cannot open replay log for writing: " + path);

  out_ << "{\"type\":\"header\",\"schema_version\":" << kReplaySchemaVersion
       << ",\"metadata\":" << to_json(metadata) << "}\n";
  out_.flush();
  logger()->info("replay log opened: {}", path_);
}

void ReplayWriter::on_tick(std::shared_ptr<const TickPayload> payload) {
  out_ << "{\"type\":\"tick\",\"schema_version\":" << kReplaySchemaVersion
       << ",\"payload\":" << to_json(*payload) << "}\n";
  out_.flush();
  if (!out_) throw std::runtime_error("write failed on replay log " + path_);
  ++written_;
}

ReplayReader::ReplayReader(const std::string& path) : in_(path, std::ios::binary) {
  if (!in_) throw std::runtime_error("cannot open replay log: " + path);

  std::string line;
  if (!std::getline(in_, line)) throw ReplayMismatch("replay log is empty: " + path);
  ++line_no_;

  const auto header = parse_record(line, "header", line_no_);
  try {
    metadata_ = header.at("metadata").get<std::map<std::string, std::string>>();
  } catch (const json::exception& e) {
    throw ReplayMismatch(where(line_no_) + "bad metadata (" + e.what() + ")");
  }
}

std::optional<ReplayTick> ReplayReader::next() {
  std::string line;
  while (std::getline(in_, line)) {
    ++line_no_;
    if (line.empty()) continue;

    auto j = parse_record(line, "tick", line_no_);
    ReplayTick t{};
    try {
      t.payload = std::move(j.at("payload"));
      t.tick = t.payload.at("tick").get<Tick>();
    } catch (const json::exception& e) {
      throw ReplayMismatch(where(line_no_) + "bad tick payload (" + e.what() + ")");
    }
    return t;
  }
  return std::nullopt;
}

} // namespace lsim
