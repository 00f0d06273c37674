#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/types.h"

namespace feedback_engine {

/**
 * @brief 多 provider 投票聚合器（四级渐进降级）
 *
 * 层级：
 * 1. Tier 1：有效票数 >= max(1, min_providers_required) 时执行配置策略
 *    （weighted / majority / stacking；stacking 至少 3 票）；
 * 2. Tier 2：>= 2 票且存在唯一多数动作，按一人一票取多数；
 * 3. Tier 3：>= 2 票，平均置信度并乘以 tier3 系数；
 * 4. Tier 4：取置信度最高的一票并乘以 tier4 系数。
 * 零有效票时抛出 InsufficientProvidersError。
 *
 * weighted 置信度：仅在胜出动作的投票上做权重归一化平均，
 * 即 sum(w_i * c_i) / sum(w_i)。所有平票按 provider 优先级裁决。
 */
class EnsembleAggregator {
 public:
  explicit EnsembleAggregator(EnsembleConfig config);

  /**
   * @brief 聚合投票
   *
   * @param votes 各 provider 投票（顺序不限，内部按优先级排序）
   * @param weights 动态或静态权重；缺失或总和 <= 0 时退化为等权
   * @throws InsufficientProvidersError 没有任何有效投票
   */
  DecisionDraft Aggregate(const std::string& asset_pair,
                          std::int64_t timestamp,
                          MarketRegime regime,
                          const std::vector<ProviderVote>& votes,
                          const std::map<std::string, double>& weights,
                          const std::vector<std::string>& failed_providers = {}) const;

  /// 在参与投票的 provider 上重新归一化权重。
  std::map<std::string, double> NormalizeWeights(
      const std::vector<ProviderVote>& votes,
      const std::map<std::string, double>& weights) const;

  /// 静态兜底权重（未配置的 provider 取等权）。
  std::map<std::string, double> StaticWeights() const;

  const EnsembleConfig& config() const { return config_; }

 private:
  struct TierResult {
    Action action{Action::kHold};
    double confidence{0.0};
  };

  std::size_t Priority(const std::string& provider_id) const;
  std::vector<ProviderVote> ValidVotes(const std::vector<ProviderVote>& votes) const;

  TierResult Weighted(const std::vector<ProviderVote>& votes,
                      const std::map<std::string, double>& weights) const;
  std::optional<TierResult> Majority(const std::vector<ProviderVote>& votes) const;
  TierResult Stacking(const std::vector<ProviderVote>& votes,
                      const std::map<std::string, double>& weights) const;
  TierResult Average(const std::vector<ProviderVote>& votes) const;
  TierResult Single(const std::vector<ProviderVote>& votes) const;

  EnsembleConfig config_;
};

}  // namespace feedback_engine
