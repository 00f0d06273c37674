#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/types.h"
#include "risk/correlation_matrix.h"
#include "risk/exposure_reservation.h"
#include "risk/market_schedule.h"

namespace feedback_engine {

/// 风控判定所需的组合上下文（调用方在决策时刻构造）。
struct RiskContext {
  AssetType asset_type{AssetType::kCrypto};
  std::string timeframe{"1h"};  ///< 快照周期，决定新鲜度阈值。
  std::optional<std::int64_t> replay_timestamp;  ///< 有值即回放模式。
  std::int64_t live_now_ts{0};  ///< 实盘当前时间；0 表示取系统时钟。
  double equity{0.0};
  double trailing_drawdown{0.0};       ///< 0~1。
  std::vector<double> recent_returns;  ///< VaR 样本。
  std::map<std::string, double> holdings;  ///< asset -> 带方向的名义敞口。
  const CorrelationMatrix* correlations{nullptr};  ///< 不持有所有权。
  double committed_exposure{0.0};      ///< 已持仓名义敞口绝对值之和。
  double current_position{0.0};        ///< 本资产带方向持仓数量。
  std::optional<double> volatility;    ///< 快照波动率（可选）。
};

/**
 * @brief 风控闸门
 *
 * 按固定顺序快速失败：
 * 1. 交易时段（回放中同样生效；低流动性只告警）；
 * 2. 数据新鲜度（仅实盘）；
 * 3. 相关性缩量（只缩不拒，最多缩 `max_correlation_reduction`）；
 * 4. 回撤 / VaR / 高波动低置信度（只拒绝增加风险的交易）；
 * 5. 风险预算原子预占。
 *
 * 结果永远以 RiskVerdict 返回，不抛异常。
 */
class RiskGatekeeper {
 public:
  /**
   * @param reservations 预占管理器，生命周期由外部管理（不持有所有权）
   */
  RiskGatekeeper(RiskConfig risk, FreshnessConfig freshness,
                 ExposureReservationManager* reservations);

  /**
   * @brief 计算相关性缩量系数
   *
   * c 为与现有持仓（不含自身）的最大绝对相关系数，
   * c <= threshold 时返回 1；否则 1 - reduction * (c - t) / (1 - t)。
   */
  double CorrelationFactor(const std::string& asset_pair,
                           const RiskContext& context) const;

  /**
   * @brief 校验决策
   *
   * 第 3 步会把 `decision` 的仓位按最新相关性系数重新缩放（幂等）；
   * 第 5 步成功时以 decision.id 占用额度，调用方负责 Commit/Rollback。
   */
  RiskVerdict Validate(Decision* decision,
                       const RiskContext& context) const;

  /// 是否为增加风险的动作（开仓或加仓）。
  static bool IsRiskIncreasing(Action action, double current_position);

 private:
  std::int64_t EffectiveTime(const RiskContext& context) const;
  int FreshnessThreshold(const std::string& timeframe) const;

  RiskConfig risk_;
  FreshnessConfig freshness_;
  MarketSchedule schedule_;
  ExposureReservationManager* reservations_{nullptr};
};

}  // namespace feedback_engine
