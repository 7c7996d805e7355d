#include "lsim/memory_log.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "lsim/errors.hpp"
#include "lsim/json.hpp"
#include "lsim/log.hpp"

namespace lsim {

using json = nlohmann::json;

namespace {

MemoryKind kind_from(const std::string& s) {
  for (auto k : {MemoryKind::Observation, MemoryKind::Plan, MemoryKind::Reflection, MemoryKind::Action}) {
    if (to_string(k) == s) return k;
  }
  throw ReplayMismatch("unknown memory kind: " + s);
}

} // namespace

MemoryLogWriter::MemoryLogWriter(const std::string& path)
  : path_(path), out_(path, std::ios::binary | std::ios::app) {
  if (!out_) throw std::runtime_error("cannot open memory log for writing: " + path);
  logger()->info("memory log opened: {}", path_);
}

void MemoryLogWriter::on_memory(const AgentId& agent, const MemoryRecord& record) {
  out_ << "{\"agent_id\":" << json_string(agent) << ",\"record\":" << to_json(record) << "}\n";
  out_.flush();
  if (!out_) throw std::runtime_error("write failed on memory log " + path_);
  ++written_;
}

std::vector<MemoryLogEntry> read_memory_log(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open memory log: " + path);

  std::vector<MemoryLogEntry> out;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;

    try {
      const auto j = json::parse(line);
      const auto& r = j.at("record");

      MemoryLogEntry e{};
      e.agent_id = j.at("agent_id").get<AgentId>();
      e.record.id = r.at("id").get<MemoryId>();
      e.record.kind = kind_from(r.at("kind").get<std::string>());
      e.record.description = r.at("description").get<std::string>();
      e.record.created_at = r.at("created_at").get<Tick>();
      e.record.last_accessed_at = r.at("last_accessed_at").get<Tick>();
      e.record.importance = r.at("importance").get<int>();
      for (const auto& id : r.at("links")) e.record.links.insert(id.get<MemoryId>());
      out.push_back(std::move(e));
    } catch (const json::exception& e) {
      throw ReplayMismatch("memory log line " + std::to_string(line_no) + ": " + e.what());
    }
  }
  return out;
}

} // namespace lsim
