#include "lsim/reflection.hpp"

#include "lsim/errors.hpp"
#include "lsim/log.hpp"

namespace lsim {

ReflectionTracker::ReflectionTracker(ReflectionConfig cfg) : cfg_(cfg) {
  if (cfg_.threshold <= 0.0) throw ConfigError("reflection threshold must be > 0");
  if (cfg_.max_insights == 0 || cfg_.min_insights > cfg_.max_insights) {
    throw ConfigError("reflection insight bounds must satisfy 0 < min <= max");
  }
}

std::vector<MemoryId> ReflectionTracker::reflect(MemoryStream& stream, InsightGenerator& gen,
                                                 ImportanceRater& rater, Embedder& embedder, Tick now) {
  std::vector<MemoryId> out;
  if (!should_reflect()) return out;

  auto insights = gen.reflect(stream.since(window_start_));
  if (insights.size() > cfg_.max_insights) insights.resize(cfg_.max_insights);
  if (insights.size() < cfg_.min_insights) {
    logger()->warn("insight generator returned {} insights (expected {}..{})",
                   insights.size(), cfg_.min_insights, cfg_.max_insights);
  }

  // New reflections open the next window.
  window_start_ = stream.size();
  since_last_ = 0.0;
  ++reflections_;

  out.reserve(insights.size());
  for (auto& ins : insights) {
    std::set<MemoryId> links;
    for (const auto id : ins.supporting_ids) {
      if (stream.find(id)) links.insert(id);
    }

    const int importance = rater.rate(ins.text);
    auto embedding = embedder.embed(ins.text);
    const auto& rec = stream.append(std::move(ins.text), MemoryKind::Reflection, importance,
                                    std::move(embedding), now, std::move(links));
    observe(rec);
    out.push_back(rec.id);
  }
  return out;
}

} // namespace lsim
