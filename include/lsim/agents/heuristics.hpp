#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "lsim/collaborators.hpp"
#include "lsim/planning.hpp"

namespace lsim::agents {

// Bag-of-words embedding: each lower-cased token is FNV-1a hashed into one of
// `dim` buckets, then the vector is L2-normalised. Same text, same vector.
class HashEmbedder final : public Embedder {
public:
  explicit HashEmbedder(std::size_t dim = 16);

  std::vector<double> embed(std::string_view text) override;

  static uint64_t fnv1a(std::string_view s) noexcept;

private:
  std::size_t dim_{16};
};

// Starts at a base score and adds the weight of every keyword found in the
// description, clamped to [1,10].
class KeywordImportanceRater final : public ImportanceRater {
public:
  KeywordImportanceRater();
  KeywordImportanceRater(int base, std::map<std::string, int> weights);

  int rate(std::string_view description) override;

private:
  int base_{2};
  std::map<std::string, int> weights_{};
};

// Produces up to three insights over fixed slices of the recent window,
// citing the ids it summarised.
class TemplateInsightGenerator final : public InsightGenerator {
public:
  std::vector<Insight> reflect(std::span<const MemoryRecord> recent) override;
};

struct RoutePlannerConfig {
  // Areas each agent visits during the day, in order. An agent without a
  // route plans to stay where it is.
  std::map<AgentId, std::vector<NodeId>> routes{};
  Tick item_ticks{4};
};

// Day plan with one item of item_ticks per route stop, back to back from the
// start tick.
class RoutePlanner final : public Planner {
public:
  explicit RoutePlanner(RoutePlannerConfig cfg);

  std::vector<PlanItem> plan_day(const AgentRuntime& agent, const WorldTree& tree, Tick start) override;

private:
  RoutePlannerConfig cfg_{};
};

} // namespace lsim::agents
