#pragma once
#include <cstddef>
#include <fstream>
#include <string>
#include <vector>

#include "lsim/sinks.hpp"

namespace lsim {

// Append-only JSON Lines log of memory records, one line per record:
//   {"agent_id":"ada","record":{"id":1,"kind":"observation",...}}
// Embeddings are not written. Opening an existing file appends to it.
class MemoryLogWriter final : public MemorySink {
public:
  explicit MemoryLogWriter(const std::string& path);

  void on_memory(const AgentId& agent, const MemoryRecord& record) override;

  std::size_t records_written() const noexcept { return written_; }

private:
  std::string path_;
  std::ofstream out_;
  std::size_t written_{0};
};

struct MemoryLogEntry {
  AgentId agent_id{};
  MemoryRecord record{};
};

// Whole log in file order. Throws ReplayMismatch on a malformed line.
std::vector<MemoryLogEntry> read_memory_log(const std::string& path);

} // namespace lsim
