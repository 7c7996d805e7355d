#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lsim/types.hpp"

namespace lsim {

enum class MemoryKind : uint8_t { Observation = 0, Plan = 1, Reflection = 2, Action = 3 };

std::string_view to_string(MemoryKind k) noexcept;

inline constexpr int kMinImportance = 1;
inline constexpr int kMaxImportance = 10;

struct MemoryRecord {
  MemoryId id{};
  std::string description{};
  Tick created_at{};
  Tick last_accessed_at{};          // the only field that changes after append
  int importance{kMinImportance};   // [1,10]
  MemoryKind kind{MemoryKind::Observation};
  std::set<MemoryId> links{};       // reflections only
  std::vector<double> embedding{};

  bool operator==(const MemoryRecord&) const = default;
};

struct RetrievalConfig {
  double decay_rate{0.01};
  std::size_t k{3};
  std::size_t context_budget_chars{2000};  // total description length of a result set
};

// Raw and min-max normalised component scores for one candidate.
struct ScoredMemory {
  std::size_t index{};  // position in the stream
  double recency_raw{};
  double relevance_raw{};
  double importance_raw{};
  double recency{};
  double relevance{};
  double importance{};

  double score() const noexcept { return recency + relevance + importance; }
};

double cosine_similarity(std::span<const double> a, std::span<const double> b) noexcept;

// In-place min-max normalisation; a degenerate component (max == min) becomes 0.
void minmax_normalize(std::vector<double>& values);

// Append-only per-agent log. Records are never reordered or removed.
class MemoryStream {
public:
  explicit MemoryStream(RetrievalConfig cfg = {});

  // Importance is clamped to [1,10]; created_at = last_accessed_at = now.
  const MemoryRecord& append(std::string description, MemoryKind kind, int importance,
                             std::vector<double> embedding, Tick now,
                             std::set<MemoryId> links = {});

  // Scores every record against the query (no side effects).
  std::vector<ScoredMemory> score_all(std::span<const double> query_embedding, Tick now) const;

  // Top-k by score (ties: older record first) that fit the context budget.
  // Selected records get last_accessed_at = now.
  std::vector<MemoryRecord> retrieve(std::span<const double> query_embedding, Tick now);

  const std::vector<MemoryRecord>& records() const noexcept { return records_; }
  std::span<const MemoryRecord> since(std::size_t index) const noexcept;
  const MemoryRecord* find(MemoryId id) const noexcept;
  std::size_t size() const noexcept { return records_.size(); }
  bool empty() const noexcept { return records_.empty(); }

  const RetrievalConfig& config() const noexcept { return cfg_; }

  bool operator==(const MemoryStream& o) const noexcept { return records_ == o.records_; }

private:
  RetrievalConfig cfg_{};
  std::vector<MemoryRecord> records_{};
  MemoryId next_id_{1};
};

} // namespace lsim
