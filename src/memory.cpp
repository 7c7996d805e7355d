#include "lsim/memory.hpp"

#include <algorithm>
#include <cmath>

#include "lsim/errors.hpp"

namespace lsim {

std::string_view to_string(MemoryKind k) noexcept {
  switch (k) {
    case MemoryKind::Observation: return "observation";
    case MemoryKind::Plan:        return "plan";
    case MemoryKind::Reflection:  return "reflection";
    case MemoryKind::Action:      return "action";
  }
  return "unknown";
}

double cosine_similarity(std::span<const double> a, std::span<const double> b) noexcept {
  const std::size_t n = std::min(a.size(), b.size());
  if (n == 0) return 0.0;

  double dot = 0.0, na = 0.0, nb = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    dot += a[i] * b[i];
    na += a[i] * a[i];
    nb += b[i] * b[i];
  }
  if (na == 0.0 || nb == 0.0) return 0.0;
  return dot / (std::sqrt(na) * std::sqrt(nb));
}

void minmax_normalize(std::vector<double>& values) {
  if (values.empty()) return;
  const auto [mn, mx] = std::minmax_element(values.begin(), values.end());
  const double lo = *mn;
  const double hi = *mx;
  if (hi == lo) {
    std::fill(values.begin(), values.end(), 0.0);
    return;
  }
  for (auto& v : values) v = (v - lo) / (hi - lo);
}

MemoryStream::MemoryStream(RetrievalConfig cfg) : cfg_(cfg) {
  if (cfg_.k == 0) throw ConfigError("retrieval k must be > 0");
  if (cfg_.decay_rate < 0.0) throw ConfigError("retrieval decay_rate must be >= 0");
}

const MemoryRecord& MemoryStream::append(std::string description, MemoryKind kind, int importance,
                                         std::vector<double> embedding, Tick now,
                                         std::set<MemoryId> links) {
  MemoryRecord r{};
  r.id = next_id_++;
  r.description = std::move(description);
  r.created_at = now;
  r.last_accessed_at = now;
  r.importance = std::clamp(importance, kMinImportance, kMaxImportance);
  r.kind = kind;
  r.links = std::move(links);
  r.embedding = std::move(embedding);

  records_.push_back(std::move(r));
  return records_.back();
}

std::vector<ScoredMemory> MemoryStream::score_all(std::span<const double> query_embedding, Tick now) const {
  const std::size_t n = records_.size();
  std::vector<ScoredMemory> out(n);
  std::vector<double> rec(n), rel(n), imp(n);

  for (std::size_t i = 0; i < n; ++i) {
    const auto& r = records_[i];
    const double age = static_cast<double>(now - r.last_accessed_at);
    rec[i] = std::exp(-cfg_.decay_rate * age);
    rel[i] = cosine_similarity(query_embedding, r.embedding);
    imp[i] = static_cast<double>(r.importance - kMinImportance) / static_cast<double>(kMaxImportance - kMinImportance);

    out[i].index = i;
    out[i].recency_raw = rec[i];
    out[i].relevance_raw = rel[i];
    out[i].importance_raw = imp[i];
  }

  minmax_normalize(rec);
  minmax_normalize(rel);
  minmax_normalize(imp);

  for (std::size_t i = 0; i < n; ++i) {
    out[i].recency = rec[i];
    out[i].relevance = rel[i];
    out[i].importance = imp[i];
  }
  return out;
}

std::vector<MemoryRecord> MemoryStream::retrieve(std::span<const double> query_embedding, Tick now) {
  auto scored = score_all(query_embedding, now);
  std::stable_sort(scored.begin(), scored.end(), [](const ScoredMemory& a, const ScoredMemory& b) {
    return a.score() > b.score();
  });

  std::vector<MemoryRecord> out;
  out.reserve(std::min(cfg_.k, scored.size()));
  std::size_t used = 0;

  for (const auto& s : scored) {
    if (out.size() >= cfg_.k) break;
    auto& r = records_[s.index];
    if (used + r.description.size() > cfg_.context_budget_chars) continue;  // try smaller ones

    used += r.description.size();
    r.last_accessed_at = now;
    out.push_back(r);
  }
  return out;
}

std::span<const MemoryRecord> MemoryStream::since(std::size_t index) const noexcept {
  if (index >= records_.size()) return {};
  return std::span<const MemoryRecord>(records_).subspan(index);
}

const MemoryRecord* MemoryStream::find(MemoryId id) const noexcept {
  // ids are assigned in append order, so the stream is sorted by id
  auto it = std::lower_bound(records_.begin(), records_.end(), id,
                             [](const MemoryRecord& r, MemoryId v) { return r.id < v; });
  if (it == records_.end() || it->id != id) return nullptr;
  return &*it;
}

} // namespace lsim
