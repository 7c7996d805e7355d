#pragma once
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lsim/actions.hpp"
#include "lsim/belief.hpp"
#include "lsim/memory.hpp"
#include "lsim/perception.hpp"
#include "lsim/planning.hpp"

namespace lsim {

// Everything a policy may look at for one agent and one tick. Owned by value
// so an abandoned (timed out) call never reads kernel state.
struct DecisionRequest {
  Tick tick{};
  AgentId agent_id{};
  std::string agent_name{};
  PerceptionSlice perception{};
  BeliefState belief{};
  std::vector<MemoryRecord> memory_excerpt{};
  ValidTargets valid_targets{};
  std::optional<PlanItem> plan{};  // active plan step, if the agent has one
};

// Returns exactly one action per call. With parallel decide enabled, decide()
// is called concurrently for different agents and must be thread-safe.
class DecisionPolicy {
public:
  virtual ~DecisionPolicy() = default;
  virtual Action decide(const DecisionRequest& req) = 0;
};

class ImportanceRater {
public:
  virtual ~ImportanceRater() = default;
  virtual int rate(std::string_view description) = 0;  // [1,10]
};

// Same embedding for queries and stored descriptions; fixed length.
class Embedder {
public:
  virtual ~Embedder() = default;
  virtual std::vector<double> embed(std::string_view text) = 0;
};

struct Insight {
  std::string text{};
  std::set<MemoryId> supporting_ids{};
};

class InsightGenerator {
public:
  virtual ~InsightGenerator() = default;
  virtual std::vector<Insight> reflect(std::span<const MemoryRecord> recent) = 0;
};

// ---- failure containment ----
// The kernel never lets a rater or embedder exception escape a tick: failures
// are logged and replaced by a fixed fallback.

class GuardedRater final : public ImportanceRater {
public:
  GuardedRater(std::shared_ptr<ImportanceRater> inner, int fallback = 3);

  int rate(std::string_view description) override;  // always within [1,10]

  std::size_t failures() const noexcept { return failures_; }

private:
  std::shared_ptr<ImportanceRater> inner_;
  int fallback_{3};
  std::size_t failures_{0};
};

class GuardedEmbedder final : public Embedder {
public:
  explicit GuardedEmbedder(std::shared_ptr<Embedder> inner);

  // Empty vector on failure; cosine similarity against it is 0.
  std::vector<double> embed(std::string_view text) override;

  std::size_t failures() const noexcept { return failures_; }

private:
  std::shared_ptr<Embedder> inner_;
  std::size_t failures_{0};
};

} // namespace lsim
