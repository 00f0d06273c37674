#pragma once

#include <cstdint>
#include <vector>

#include "core/types.h"

namespace feedback_engine {

/// 单次回放的汇总指标。
struct BacktestMetrics {
  double initial_balance{0.0};
  double final_balance{0.0};
  double net_return{0.0};      ///< (final - initial) / initial。
  int total_trades{0};
  int winning_trades{0};
  double win_rate{0.0};
  double sharpe_ratio{0.0};    ///< 按 bar 收益年化。
  double max_drawdown{0.0};    ///< 0~1，峰值回撤。
  double total_fees{0.0};
  int decisions{0};
  int denied_decisions{0};
  std::uint64_t cache_hits{0};
  std::uint64_t cache_misses{0};
};

/**
 * @brief 权益曲线的年化 Sharpe
 *
 * 使用逐 bar 简单收益（无风险利率取 0）；样本不足 2 个或标准差为 0 时返回 0。
 */
double SharpeFromEquity(const std::vector<double>& equity_curve,
                        double periods_per_year);

/// 权益曲线的最大峰值回撤（0~1）。
double MaxDrawdown(const std::vector<double>& equity_curve);

/**
 * @brief 汇总回放指标
 *
 * `decisions`/`denied_decisions`/缓存计数由调用方另行填写。
 */
BacktestMetrics ComputeMetrics(double initial_balance,
                               const std::vector<double>& equity_curve,
                               const std::vector<TradeOutcome>& trades,
                               double periods_per_year);

}  // namespace feedback_engine
