#include "ensemble/ensemble_aggregator.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <set>

#include "core/errors.h"
#include "core/log.h"

namespace feedback_engine {

namespace {

constexpr double kStackingAgreementThreshold = 0.66;
constexpr double kStackingAgreementBoost = 1.2;
constexpr double kStackingStdThreshold = 15.0;
constexpr double kStackingDisagreementPenalty = 0.85;
constexpr std::array<Action, 3> kActions = {Action::kBuy, Action::kSell,
                                            Action::kHold};

std::size_t ActionIndex(Action action) {
  switch (action) {
    case Action::kBuy:
      return 0;
    case Action::kSell:
      return 1;
    case Action::kHold:
      return 2;
  }
  return 2;
}

double ClampConfidence(double confidence) {
  return std::clamp(confidence, 0.0, 100.0);
}

/// 在 `candidates` 中选出优先级最高（在已排序 votes 中最早出现）的动作。
Action FirstByPriority(const std::vector<ProviderVote>& votes,
                       const std::set<Action>& candidates) {
  for (const auto& vote : votes) {
    if (candidates.count(vote.action) > 0) {
      return vote.action;
    }
  }
  return Action::kHold;
}

std::array<int, 3> CountActions(const std::vector<ProviderVote>& votes) {
  std::array<int, 3> counts{0, 0, 0};
  for (const auto& vote : votes) {
    ++counts[ActionIndex(vote.action)];
  }
  return counts;
}

double MeanConfidence(const std::vector<ProviderVote>& votes,
                      std::optional<Action> only_action = std::nullopt) {
  double sum = 0.0;
  int count = 0;
  for (const auto& vote : votes) {
    if (only_action.has_value() && vote.action != *only_action) {
      continue;
    }
    sum += vote.confidence;
    ++count;
  }
  return count > 0 ? sum / count : 0.0;
}

}  // namespace

EnsembleAggregator::EnsembleAggregator(EnsembleConfig config)
    : config_(std::move(config)) {}

std::size_t EnsembleAggregator::Priority(const std::string& provider_id) const {
  const auto it =
      std::find(config_.providers.begin(), config_.providers.end(), provider_id);
  return static_cast<std::size_t>(std::distance(config_.providers.begin(), it));
}

std::vector<ProviderVote> EnsembleAggregator::ValidVotes(
    const std::vector<ProviderVote>& votes) const {
  std::vector<ProviderVote> valid;
  std::set<std::string> seen;
  for (const auto& vote : votes) {
    if (vote.provider_id.empty() || !std::isfinite(vote.confidence) ||
        vote.confidence < 0.0 || vote.confidence > 100.0) {
      LogWarn("丢弃非法投票: provider=" + vote.provider_id);
      continue;
    }
    if (!seen.insert(vote.provider_id).second) {
      LogWarn("丢弃重复投票: provider=" + vote.provider_id);
      continue;
    }
    valid.push_back(vote);
  }
  // 未配置的 provider 排在所有已配置 provider 之后，保持出现顺序。
  std::stable_sort(valid.begin(), valid.end(),
                   [this](const ProviderVote& lhs, const ProviderVote& rhs) {
                     return Priority(lhs.provider_id) < Priority(rhs.provider_id);
                   });
  return valid;
}

std::map<std::string, double> EnsembleAggregator::StaticWeights() const {
  std::map<std::string, double> weights;
  if (config_.providers.empty()) {
    return weights;
  }
  const double equal = 1.0 / static_cast<double>(config_.providers.size());
  for (const auto& id : config_.providers) {
    const auto it = config_.provider_weights.find(id);
    weights[id] = it != config_.provider_weights.end() ? it->second : equal;
  }
  return weights;
}

std::map<std::string, double> EnsembleAggregator::NormalizeWeights(
    const std::vector<ProviderVote>& votes,
    const std::map<std::string, double>& weights) const {
  std::map<std::string, double> out;
  double total = 0.0;
  for (const auto& vote : votes) {
    const auto it = weights.find(vote.provider_id);
    const double weight =
        it != weights.end() && std::isfinite(it->second) && it->second > 0.0
            ? it->second
            : 0.0;
    out[vote.provider_id] = weight;
    total += weight;
  }
  if (total <= 0.0) {
    for (auto& [id, weight] : out) {
      weight = 1.0 / static_cast<double>(out.size());
    }
    return out;
  }
  for (auto& [id, weight] : out) {
    weight /= total;
  }
  return out;
}

EnsembleAggregator::TierResult EnsembleAggregator::Weighted(
    const std::vector<ProviderVote>& votes,
    const std::map<std::string, double>& weights) const {
  std::array<double, 3> power{0.0, 0.0, 0.0};
  std::array<double, 3> weight_sum{0.0, 0.0, 0.0};
  std::array<double, 3> weighted_confidence{0.0, 0.0, 0.0};
  for (const auto& vote : votes) {
    const double weight = weights.at(vote.provider_id);
    const std::size_t index = ActionIndex(vote.action);
    power[index] += weight * vote.confidence / 100.0;
    weight_sum[index] += weight;
    weighted_confidence[index] += weight * vote.confidence;
  }
  // 全部零置信度时按权重本身计票。
  if (power[0] + power[1] + power[2] <= 0.0) {
    power = weight_sum;
  }
  const double best = *std::max_element(power.begin(), power.end());
  std::set<Action> tied;
  for (const auto action : kActions) {
    if (std::fabs(power[ActionIndex(action)] - best) <= 1e-12) {
      tied.insert(action);
    }
  }
  TierResult result;
  result.action = FirstByPriority(votes, tied);
  const std::size_t index = ActionIndex(result.action);
  result.confidence = weight_sum[index] > 0.0
                          ? weighted_confidence[index] / weight_sum[index]
                          : MeanConfidence(votes, result.action);
  return result;
}

std::optional<EnsembleAggregator::TierResult> EnsembleAggregator::Majority(
    const std::vector<ProviderVote>& votes) const {
  const auto counts = CountActions(votes);
  const int best = *std::max_element(counts.begin(), counts.end());
  if (std::count(counts.begin(), counts.end(), best) != 1) {
    return std::nullopt;
  }
  TierResult result;
  for (const auto action : kActions) {
    if (counts[ActionIndex(action)] == best) {
      result.action = action;
    }
  }
  result.confidence = MeanConfidence(votes, result.action);
  return result;
}

EnsembleAggregator::TierResult EnsembleAggregator::Stacking(
    const std::vector<ProviderVote>& votes,
    const std::map<std::string, double>& weights) const {
  const auto counts = CountActions(votes);
  const int best = *std::max_element(counts.begin(), counts.end());
  std::set<Action> tied;
  for (const auto action : kActions) {
    if (counts[ActionIndex(action)] == best) {
      tied.insert(action);
    }
  }
  const Action dominant = FirstByPriority(votes, tied);
  const double agreement =
      static_cast<double>(best) / static_cast<double>(votes.size());
  const double mean = MeanConfidence(votes);
  double variance = 0.0;
  for (const auto& vote : votes) {
    variance += (vote.confidence - mean) * (vote.confidence - mean);
  }
  const double stddev = std::sqrt(variance / static_cast<double>(votes.size()));

  if (agreement > kStackingAgreementThreshold) {
    return TierResult{dominant, std::min(100.0, mean * kStackingAgreementBoost)};
  }
  if (stddev < kStackingStdThreshold) {
    return TierResult{dominant, mean};
  }
  TierResult result = Weighted(votes, weights);
  result.confidence *= kStackingDisagreementPenalty;
  return result;
}

EnsembleAggregator::TierResult EnsembleAggregator::Average(
    const std::vector<ProviderVote>& votes) const {
  const auto counts = CountActions(votes);
  const int best = *std::max_element(counts.begin(), counts.end());
  double best_mean = -1.0;
  std::set<Action> candidates;
  for (const auto action : kActions) {
    if (counts[ActionIndex(action)] != best) {
      continue;
    }
    const double mean = MeanConfidence(votes, action);
    if (mean > best_mean + 1e-12) {
      best_mean = mean;
      candidates = {action};
    } else if (std::fabs(mean - best_mean) <= 1e-12) {
      candidates.insert(action);
    }
  }
  return TierResult{FirstByPriority(votes, candidates),
                    MeanConfidence(votes) * config_.tier3_confidence_factor};
}

EnsembleAggregator::TierResult EnsembleAggregator::Single(
    const std::vector<ProviderVote>& votes) const {
  // votes 已按优先级排序，严格大于保证平票时保留高优先级。
  const ProviderVote* best = &votes.front();
  for (const auto& vote : votes) {
    if (vote.confidence > best->confidence) {
      best = &vote;
    }
  }
  return TierResult{best->action,
                    best->confidence * config_.tier4_confidence_factor};
}

DecisionDraft EnsembleAggregator::Aggregate(
    const std::string& asset_pair,
    std::int64_t timestamp,
    MarketRegime regime,
    const std::vector<ProviderVote>& votes,
    const std::map<std::string, double>& weights,
    const std::vector<std::string>& failed_providers) const {
  const std::vector<ProviderVote> valid = ValidVotes(votes);
  if (valid.empty()) {
    throw InsufficientProvidersError(
        "no usable provider votes for " + asset_pair + " at " +
        std::to_string(timestamp) + " (failed providers: " +
        std::to_string(failed_providers.size()) + ")");
  }

  const auto normalized = NormalizeWeights(valid, weights);
  const std::size_t count = valid.size();
  const std::size_t required =
      static_cast<std::size_t>(std::max(1, config_.min_providers_required));

  std::optional<TierResult> result;
  AggregationTier tier = AggregationTier::kPrimary;
  std::string strategy_used = ToString(config_.voting_strategy);
  if (count >= required) {
    switch (config_.voting_strategy) {
      case VotingStrategy::kWeighted:
        result = Weighted(valid, normalized);
        break;
      case VotingStrategy::kMajority:
        result = Majority(valid);
        break;
      case VotingStrategy::kStacking:
        if (count >= 3) {
          result = Stacking(valid, normalized);
        }
        break;
    }
  }
  if (!result.has_value() && count >= 2) {
    result = Majority(valid);
    tier = AggregationTier::kMajority;
    strategy_used = "majority_fallback";
  }
  if (!result.has_value() && count >= 2) {
    result = Average(valid);
    tier = AggregationTier::kAverage;
    strategy_used = "average_fallback";
  }
  if (!result.has_value()) {
    result = Single(valid);
    tier = AggregationTier::kSingle;
    strategy_used = "single_fallback";
  }
  if (tier != AggregationTier::kPrimary) {
    LogWarn("集成聚合降级: asset=" + asset_pair + " tier=" +
            std::to_string(TierNumber(tier)) + " votes=" +
            std::to_string(count));
  }

  DecisionDraft draft;
  draft.asset_pair = asset_pair;
  draft.timestamp = timestamp;
  draft.action = result->action;
  draft.confidence = ClampConfidence(result->confidence);
  draft.tier = tier;
  draft.strategy_used = strategy_used;
  draft.regime = regime;
  draft.contributing_votes = valid;
  draft.failed_providers = failed_providers;
  draft.applied_weights = normalized;

  int agreeing = 0;
  double size_sum = 0.0;
  int size_count = 0;
  for (const auto& vote : valid) {
    if (vote.action != draft.action) {
      continue;
    }
    ++agreeing;
    if (vote.suggested_size.has_value() && std::isfinite(*vote.suggested_size)) {
      size_sum += *vote.suggested_size;
      ++size_count;
    }
  }
  draft.agreement_score =
      static_cast<double>(agreeing) / static_cast<double>(count);
  if (size_count > 0) {
    draft.suggested_size = size_sum / size_count;
  }
  return draft;
}

}  // namespace feedback_engine
