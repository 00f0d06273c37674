#include "backtest/performance_metrics.h"

#include <algorithm>
#include <cmath>

#include "risk/var_calculator.h"

namespace feedback_engine {

double SharpeFromEquity(const std::vector<double>& equity_curve,
                        double periods_per_year) {
  const std::vector<double> returns = ReturnsFromEquity(equity_curve);
  if (returns.size() < 2) {
    return 0.0;
  }
  double mean = 0.0;
  for (const double r : returns) {
    mean += r;
  }
  mean /= static_cast<double>(returns.size());
  double variance = 0.0;
  for (const double r : returns) {
    variance += (r - mean) * (r - mean);
  }
  variance /= static_cast<double>(returns.size() - 1);
  const double stddev = std::sqrt(variance);
  if (stddev <= 1e-12) {
    return 0.0;
  }
  return mean / stddev * std::sqrt(std::max(periods_per_year, 1.0));
}

double MaxDrawdown(const std::vector<double>& equity_curve) {
  double peak = 0.0;
  double worst = 0.0;
  for (const double equity : equity_curve) {
    peak = std::max(peak, equity);
    if (peak > 0.0) {
      worst = std::max(worst, (peak - equity) / peak);
    }
  }
  return worst;
}

BacktestMetrics ComputeMetrics(double initial_balance,
                               const std::vector<double>& equity_curve,
                               const std::vector<TradeOutcome>& trades,
                               double periods_per_year) {
  BacktestMetrics metrics;
  metrics.initial_balance = initial_balance;
  metrics.final_balance =
      equity_curve.empty() ? initial_balance : equity_curve.back();
  if (initial_balance > 0.0) {
    metrics.net_return =
        (metrics.final_balance - initial_balance) / initial_balance;
  }
  metrics.total_trades = static_cast<int>(trades.size());
  for (const auto& trade : trades) {
    if (trade.was_profitable) {
      ++metrics.winning_trades;
    }
    metrics.total_fees += trade.fees;
  }
  if (metrics.total_trades > 0) {
    metrics.win_rate =
        static_cast<double>(metrics.winning_trades) / metrics.total_trades;
  }
  metrics.sharpe_ratio = SharpeFromEquity(equity_curve, periods_per_year);
  metrics.max_drawdown = MaxDrawdown(equity_curve);
  return metrics;
}

}  // namespace feedback_engine
