#pragma once

#include <vector>

namespace feedback_engine {

/**
 * @brief 历史模拟法 VaR
 *
 * 收益样本升序排列后取 round(n * (1 - confidence)) 位置的绝对值。
 * 样本数不足 `min_samples` 时返回 0（不足以给出可信估计）。
 */
double HistoricalVar(const std::vector<double>& returns,
                     double confidence,
                     int min_samples = 30);

/// 由权益曲线计算当前回撤（相对历史峰值，0~1）。
double TrailingDrawdown(const std::vector<double>& equity_curve);

/// 由权益曲线计算逐期简单收益率。
std::vector<double> ReturnsFromEquity(const std::vector<double>& equity_curve);

}  // namespace feedback_engine
