#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace feedback_engine {

/// 决策动作。
enum class Action {
  kBuy,
  kSell,
  kHold,
};

/// 持仓方向：BUY 对应多头，SELL 对应空头，HOLD 无方向。
enum class PositionType {
  kLong,
  kShort,
  kNone,
};

/// 资产类别：决定交易时段规则与新鲜度阈值。
enum class AssetType {
  kCrypto,
  kForex,
  kStock,
};

/// 市场状态三桶（权重学习与交易结果标签共用）。
enum class MarketRegime {
  kTrending,
  kRanging,
  kVolatile,
};

/// 聚合层级：1 为配置策略，依次降级到 4（单票兜底）。
enum class AggregationTier {
  kNone = 0,  ///< 未经过聚合（如在途拒绝），落盘为 null。
  kPrimary = 1,
  kMajority = 2,
  kAverage = 3,
  kSingle = 4,
};

/// 一级聚合策略。
enum class VotingStrategy {
  kWeighted,
  kMajority,
  kStacking,
};

inline const char* ToString(Action action) {
  switch (action) {
    case Action::kBuy:
      return "BUY";
    case Action::kSell:
      return "SELL";
    case Action::kHold:
      return "HOLD";
  }
  return "HOLD";
}

inline const char* ToString(PositionType type) {
  switch (type) {
    case PositionType::kLong:
      return "LONG";
    case PositionType::kShort:
      return "SHORT";
    case PositionType::kNone:
      return "NONE";
  }
  return "NONE";
}

inline const char* ToString(AssetType type) {
  switch (type) {
    case AssetType::kCrypto:
      return "crypto";
    case AssetType::kForex:
      return "forex";
    case AssetType::kStock:
      return "stock";
  }
  return "crypto";
}

inline const char* ToString(MarketRegime regime) {
  switch (regime) {
    case MarketRegime::kTrending:
      return "trending";
    case MarketRegime::kRanging:
      return "ranging";
    case MarketRegime::kVolatile:
      return "volatile";
  }
  return "ranging";
}

inline const char* ToString(VotingStrategy strategy) {
  switch (strategy) {
    case VotingStrategy::kWeighted:
      return "weighted";
    case VotingStrategy::kMajority:
      return "majority";
    case VotingStrategy::kStacking:
      return "stacking";
  }
  return "weighted";
}

inline int TierNumber(AggregationTier tier) { return static_cast<int>(tier); }

/// 动作到持仓方向的映射。
inline PositionType PositionTypeFor(Action action) {
  switch (action) {
    case Action::kBuy:
      return PositionType::kLong;
    case Action::kSell:
      return PositionType::kShort;
    case Action::kHold:
      return PositionType::kNone;
  }
  return PositionType::kNone;
}

/// 行情快照：按资产/周期/时间戳生成，生成后只读。
struct MarketSnapshot {
  std::string asset_pair{"BTCUSD"};
  AssetType asset_type{AssetType::kCrypto};
  std::string timeframe{"1h"};
  std::int64_t timestamp{0};  // UTC unix 秒。
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
  std::map<std::string, double> indicators;  // 有序，保证哈希稳定。
};

/// 单个 provider 的投票（一次性）。
struct ProviderVote {
  std::string provider_id;
  Action action{Action::kHold};
  double confidence{0.0};  // [0, 100]
  std::string rationale;
  double latency_ms{0.0};
  std::optional<double> suggested_size;  ///< 相对基准仓位的比例（可选）。

  bool operator==(const ProviderVote&) const = default;
};

/// 仓位计算结果；signal-only 决策中整体缺失。
struct PositionSizing {
  double recommended_position_size{0.0};
  double entry_price{0.0};
  double stop_loss_pct{0.0};
  double risk_pct{0.0};
  double stop_loss_price{0.0};
};

/// 风控结论：总是作为返回值，不以异常表达。
struct RiskVerdict {
  bool allow{true};
  std::string reason{"approved"};
  std::string triggered_rule;
  std::vector<std::string> warnings;
  double size_multiplier{1.0};  ///< 相关性缩量系数（仅用于审计）。
};

/// 执行层回报。
struct ExecutionResult {
  bool success{false};
  double fill_price{0.0};
  double filled_size{0.0};
  double fees{0.0};
  std::string message;
};

/// 聚合器输出的决策草稿（尚未定仓/风控），也是 DecisionCache 的缓存单元。
struct DecisionDraft {
  std::string asset_pair;
  std::int64_t timestamp{0};
  Action action{Action::kHold};
  double confidence{0.0};
  AggregationTier tier{AggregationTier::kPrimary};
  std::string strategy_used;
  double agreement_score{0.0};
  std::optional<double> suggested_size;
  std::vector<ProviderVote> contributing_votes;
  std::vector<std::string> failed_providers;
  std::map<std::string, double> applied_weights;
  MarketRegime regime{MarketRegime::kRanging};

  bool operator==(const DecisionDraft&) const = default;
};

/**
 * @brief 最终决策
 *
 * 生命周期：聚合+定仓后创建 -> 风控 -> 执行时写入一次 `execution`
 * -> 持仓平仓后转为 TradeOutcome。
 *
 * `signal_only` 为显式判别位：为 true 时 `sizing` 必为空；
 * HOLD 决策同样不带 sizing，但不属于 signal-only。
 */
struct Decision {
  std::string id;
  std::string asset_pair;
  std::int64_t timestamp{0};
  Action action{Action::kHold};
  double confidence{0.0};
  PositionType position_type{PositionType::kNone};
  bool signal_only{false};
  std::optional<PositionSizing> sizing;
  AggregationTier tier{AggregationTier::kPrimary};
  std::string strategy_used;
  std::vector<ProviderVote> contributing_votes;
  std::vector<std::string> failed_providers;
  std::map<std::string, double> applied_weights;
  MarketRegime regime{MarketRegime::kRanging};
  double correlation_factor{1.0};
  bool from_cache{false};
  std::optional<RiskVerdict> verdict;
  std::optional<ExecutionResult> execution;
};

/// 平仓后的交易结果，创建后不可变。
struct TradeOutcome {
  std::string trade_id;
  std::string decision_id;
  std::string asset_pair;
  PositionType position_type{PositionType::kLong};
  std::int64_t entry_timestamp{0};
  std::int64_t exit_timestamp{0};
  double entry_price{0.0};
  double exit_price{0.0};
  double size{0.0};
  double fees{0.0};
  double realized_pnl{0.0};
  double pnl_pct{0.0};
  double holding_hours{0.0};
  double confidence{0.0};
  MarketRegime regime{MarketRegime::kRanging};
  std::vector<std::string> contributing_providers;
  bool was_profitable{false};

  bool operator==(const TradeOutcome&) const = default;
};

}  // namespace feedback_engine
