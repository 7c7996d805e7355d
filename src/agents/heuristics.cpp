#include "lsim/agents/heuristics.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "lsim/errors.hpp"

namespace lsim::agents {

namespace {

std::vector<std::string> tokenize(std::string_view text) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : text) {
    const auto u = static_cast<unsigned char>(c);
    if (std::isalnum(u)) {
      cur += static_cast<char>(std::tolower(u));
    } else if (!cur.empty()) {
      out.push_back(std::move(cur));
      cur.clear();
    }
  }
  if (!cur.empty()) out.push_back(std::move(cur));
  return out;
}

} // namespace

HashEmbedder::HashEmbedder(std::size_t dim) : dim_(dim) {
  if (dim_ == 0) throw ConfigError("HashEmbedder: dimension must be > 0");
}

uint64_t HashEmbedder::fnv1a(std::string_view s) noexcept {
  uint64_t h = 0xcbf29ce484222325ULL;
  for (char c : s) {
    h ^= static_cast<unsigned char>(c);
    h *= 0x100000001b3ULL;
  }
  return h;
}

std::vector<double> HashEmbedder::embed(std::string_view text) {
  std::vector<double> v(dim_, 0.0);
  for (const auto& tok : tokenize(text)) {
    v[fnv1a(tok) % dim_] += 1.0;
  }

  double norm = 0.0;
  for (double x : v) norm += x * x;
  if (norm > 0.0) {
    norm = std::sqrt(norm);
    for (double& x : v) x /= norm;
  }
  return v;
}

KeywordImportanceRater::KeywordImportanceRater()
  : KeywordImportanceRater(2, {
      {"said", 2}, {"heard", 2}, {"opened", 1}, {"closed", 1},
      {"took", 2}, {"turned", 1}, {"weather", 1}, {"empty", 3},
      {"full", 2}, {"moved", 1},
    }) {}

KeywordImportanceRater::KeywordImportanceRater(int base, std::map<std::string, int> weights)
  : base_(base), weights_(std::move(weights)) {}

int KeywordImportanceRater::rate(std::string_view description) {
  int score = base_;
  for (const auto& tok : tokenize(description)) {
    auto it = weights_.find(tok);
    if (it != weights_.end()) score += it->second;
  }
  return std::clamp(score, kMinImportance, kMaxImportance);
}

std::vector<Insight> TemplateInsightGenerator::reflect(std::span<const MemoryRecord> recent) {
  std::vector<Insight> out;
  if (recent.empty()) return out;

  auto summarise = [&](std::size_t from, std::size_t to, const char* lead) {
    to = std::min(to, recent.size());
    if (from >= to) return;
    Insight in{};
    in.text = lead;
    for (std::size_t i = from; i < to; ++i) {
      if (i > from) in.text += "; ";
      in.text += recent[i].description;
      in.supporting_ids.insert(recent[i].id);
    }
    out.push_back(std::move(in));
  };

  summarise(0, 2, "Earlier: ");
  summarise(2, 4, "Then: ");
  summarise(recent.size() >= 2 ? recent.size() - 2 : 0, recent.size(), "Lately: ");
  return out;
}

RoutePlanner::RoutePlanner(RoutePlannerConfig cfg) : cfg_(std::move(cfg)) {
  if (cfg_.item_ticks <= 0) throw ConfigError("RoutePlanner: item_ticks must be > 0");
}

std::vector<PlanItem> RoutePlanner::plan_day(const AgentRuntime& agent, const WorldTree& tree, Tick start) {
  std::vector<NodeId> stops{agent.location_id};
  if (auto it = cfg_.routes.find(agent.id); it != cfg_.routes.end() && !it->second.empty()) {
    stops = it->second;
  }

  std::vector<PlanItem> day;
  day.reserve(stops.size());
  Tick t = start;
  for (std::size_t i = 0; i < stops.size(); ++i) {
    const auto* n = tree.find(stops[i]);
    const std::string where = n ? n->name : stops[i];

    PlanItem item{};
    item.start_tick = t;
    item.end_tick = t + cfg_.item_ticks;
    item.location_id = stops[i];
    if (i == 0) item.description = agent.name + " starts the day at " + where + ".";
    else if (i + 1 == stops.size()) item.description = agent.name + " wraps up the day at " + where + ".";
    else item.description = agent.name + " heads to " + where + " and spends some time there.";
    day.push_back(std::move(item));
    t += cfg_.item_ticks;
  }
  return day;
}

} // namespace lsim::agents
