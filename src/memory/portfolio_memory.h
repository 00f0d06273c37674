#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "core/types.h"

namespace feedback_engine {

/// 按 provider 或 regime 聚合的交易统计。
struct PerformanceBucket {
  int trades{0};
  int wins{0};
  double total_pnl{0.0};

  double win_rate() const { return trades > 0 ? static_cast<double>(wins) / trades : 0.0; }
  bool operator==(const PerformanceBucket&) const = default;
};

/// AnalyzePerformance 输出。win_rate 为 0~1，max_drawdown 为金额。
struct PerformanceReport {
  int total_trades{0};
  int winning_trades{0};
  int losing_trades{0};
  double win_rate{0.0};
  double total_pnl{0.0};
  double avg_win{0.0};
  double avg_loss{0.0};
  double profit_factor{0.0};
  double max_drawdown{0.0};
  double sharpe_ratio{0.0};
  double sortino_ratio{0.0};
};

/// 全部累计状态的深拷贝；与 live 实例不共享任何可变数据。
struct PortfolioMemorySnapshot {
  std::vector<TradeOutcome> outcomes;
  std::map<std::string, PerformanceBucket> provider_performance;
  std::map<std::string, PerformanceBucket> regime_performance;

  bool operator==(const PortfolioMemorySnapshot&) const = default;
};

/**
 * @brief 交易结果账本
 *
 * 1. 只追加；trade_id 唯一；
 * 2. 只读状态下 RecordTradeOutcome 抛出 ReadOnlyViolationError，绝不静默忽略；
 * 3. Snapshot/Restore 为值拷贝，walk-forward 与 Monte Carlo 依赖其隔离性；
 * 4. 配置了 `state_path` 时每次写入后原子落盘，启动时文件损坏默认失败。
 */
class PortfolioMemory {
 public:
  explicit PortfolioMemory(std::string state_path = "",
                           bool allow_fresh_start = false)
      : state_path_(std::move(state_path)),
        allow_fresh_start_(allow_fresh_start) {}

  PortfolioMemory(const PortfolioMemory&) = delete;
  PortfolioMemory& operator=(const PortfolioMemory&) = delete;

  bool Initialize(std::string* out_error);

  /**
   * @brief 追加一条交易结果
   *
   * @throws ReadOnlyViolationError 只读状态
   * @return false trade_id 重复或数值非法（`out_error` 给出原因）
   */
  bool RecordTradeOutcome(const TradeOutcome& outcome, std::string* out_error);

  PortfolioMemorySnapshot Snapshot() const;
  /// 整体替换 live 状态；不改变只读标记。
  void Restore(const PortfolioMemorySnapshot& snapshot);

  void SetReadonly(bool readonly);
  bool readonly() const;

  PerformanceReport AnalyzePerformance() const;
  std::map<std::string, PerformanceBucket> ProviderPerformance() const;
  std::map<std::string, PerformanceBucket> RegimePerformance() const;

  /// 以 initial_balance 为起点、按平仓顺序累加已实现盈亏的权益曲线。
  std::vector<double> EquityCurve(double initial_balance) const;

  std::vector<TradeOutcome> RecentOutcomes(std::size_t limit) const;
  std::size_t size() const;

  bool SaveToFile(const std::string& file_path, std::string* out_error) const;
  bool LoadFromFile(const std::string& file_path, std::string* out_error);

 private:
  static void Accumulate(const TradeOutcome& outcome,
                         PortfolioMemorySnapshot* state);

  std::string state_path_;
  bool allow_fresh_start_{false};
  mutable std::mutex mutex_;
  PortfolioMemorySnapshot state_;
  std::unordered_set<std::string> trade_ids_;
  bool readonly_{false};
};

}  // namespace feedback_engine
