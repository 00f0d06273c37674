#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

#include "backtest/performance_metrics.h"
#include "backtest/replay_engine.h"
#include "core/config.h"
#include "ensemble/weight_optimizer.h"
#include "memory/portfolio_memory.h"

namespace feedback_engine {

/// 过拟合严重度。
enum class OverfittingSeverity {
  kNone,
  kLow,
  kMedium,
  kHigh,
};

const char* ToString(OverfittingSeverity severity);

/// 半开区间 [begin, end) 的 bar 下标。
struct WindowRange {
  std::size_t train_begin{0};
  std::size_t train_end{0};
  std::size_t test_begin{0};
  std::size_t test_end{0};
};

/// 单个窗口的训练/测试指标对比。
struct WalkForwardWindow {
  int index{0};
  WindowRange range;
  std::int64_t train_start_ts{0};
  std::int64_t test_end_ts{0};
  BacktestMetrics train;
  BacktestMetrics test;
  double sharpe_ratio_change{0.0};    ///< test/train 比值（见 PerformanceRatio）。
  double win_rate_ratio_change{0.0};
  OverfittingSeverity severity{OverfittingSeverity::kNone};
};

struct WalkForwardReport {
  std::vector<WalkForwardWindow> windows;
  OverfittingSeverity overall{OverfittingSeverity::kNone};  ///< 各窗口最差值。
  double avg_train_sharpe{0.0};
  double avg_test_sharpe{0.0};
  double avg_test_win_rate{0.0};
  double avg_test_drawdown{0.0};
  std::vector<std::string> recommendations;
  bool cancelled{false};
};

/**
 * @brief 训练/测试指标比值
 *
 * - train > 0：test / train
 * - train < 0 且 test < 0：train / test（两者都亏时，亏得少视为改善）
 * - train < 0 <= test：1.0
 * - train == 0：0.0
 */
double PerformanceRatio(double train_value, double test_value);

/// 比值分级：> 0.8 NONE，> 0.5 LOW，> 0.3 MEDIUM，其余 HIGH。
OverfittingSeverity ClassifyRatio(double ratio);

/// 每个严重度对应的建议文本。
std::vector<std::string> RecommendationsFor(OverfittingSeverity severity);

/**
 * @brief Walk-forward 滚动切分与执行
 *
 * 每个窗口：快照记忆与权重 -> 回放训练段（学习）-> 记忆只读 ->
 * 回放测试段（冻结学习）-> 恢复快照 -> 前进 `step_bars`。
 * 取消请求只在窗口边界生效，此时记忆总处于已恢复状态。
 */
class WalkForwardSplitter {
 public:
  explicit WalkForwardSplitter(WalkForwardConfig config) : config_(config) {}

  /// 计算 `bar_count` 根 bar 上的全部窗口；没有完整窗口时报错。
  bool Split(std::size_t bar_count,
             std::vector<WindowRange>* out_windows,
             std::string* out_error) const;

  /**
   * @brief 执行 walk-forward
   *
   * `memory` 不能为空；`optimizer` 可为空。二者应与 `engine` 注入的是同一实例。
   */
  bool Run(const std::vector<MarketSnapshot>& series,
           BacktestReplayEngine* engine,
           PortfolioMemory* memory,
           WeightOptimizer* optimizer,
           const std::atomic<bool>* cancel,
           WalkForwardReport* out_report,
           std::string* out_error) const;

 private:
  WalkForwardConfig config_;
};

}  // namespace feedback_engine
