#include "lsim/collaborators.hpp"

#include <algorithm>
#include <exception>
#include <string>

#include "lsim/errors.hpp"
#include "lsim/log.hpp"

namespace lsim {

GuardedRater::GuardedRater(std::shared_ptr<ImportanceRater> inner, int fallback)
  : inner_(std::move(inner)), fallback_(std::clamp(fallback, kMinImportance, kMaxImportance)) {
  if (!inner_) throw ConfigError("importance rater must not be null");
}

int GuardedRater::rate(std::string_view description) {
  try {
    return std::clamp(inner_->rate(description), kMinImportance, kMaxImportance);
  } catch (const std::exception& e) {
    ++failures_;
    logger()->warn("importance rater failed ({}); using {}", e.what(), fallback_);
    return fallback_;
  }
}

GuardedEmbedder::GuardedEmbedder(std::shared_ptr<Embedder> inner) : inner_(std::move(inner)) {
  if (!inner_) throw ConfigError("embedder must not be null");
}

std::vector<double> GuardedEmbedder::embed(std::string_view text) {
  try {
    return inner_->embed(text);
  } catch (const std::exception& e) {
    ++failures_;
    logger()->warn("embedder failed ({}); using an empty embedding", e.what());
    return {};
  }
}

} // namespace lsim
