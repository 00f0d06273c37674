#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "backtest/performance_metrics.h"
#include "cache/decision_cache.h"
#include "core/config.h"
#include "core/types.h"
#include "ensemble/weight_optimizer.h"
#include "memory/portfolio_memory.h"
#include "provider/provider_pool.h"
#include "risk/correlation_matrix.h"

namespace feedback_engine {

/// 单次回放选项。
struct ReplayOptions {
  bool learn{true};      ///< false 时平仓结果不写入记忆/权重（测试窗口）。
  bool use_cache{true};  ///< 命中缓存时跳过全部 provider 调用。
  const std::atomic<bool>* cancel{nullptr};  ///< 在 bar 边界检查。
};

/// 回放产物。
struct BacktestResult {
  BacktestMetrics metrics;
  std::vector<double> equity_curve;  ///< 首元素为初始资金，其后每 bar 一个点。
  std::vector<TradeOutcome> trades;
  std::vector<Decision> decisions;
  bool cancelled{false};
};

/**
 * @brief 确定性历史回放引擎
 *
 * 每根 bar 严格按时间顺序：止损检查 -> 决策流水线（回放模式，跳过新鲜度）
 * -> 模拟成交（手续费/滑点）-> 记录权益；平仓生成 TradeOutcome。
 *
 * 持仓规则：单资产至多一笔持仓；反向信号平仓，不在同一 bar 反手；
 * 同向信号视为维持持仓，直接释放在途状态，不记执行；
 * 止损按 bar 最低/最高价触发；回放结束时按最后收盘价强制平仓。
 *
 * trade_id 带回放序号（开始时记忆中的结果数），同一份记忆上多次回放不会冲突。
 *
 * 相同输入、相同种子、相同初始记忆/权重状态时结果逐位一致。
 * 依赖均为外部注入，不持有所有权；`optimizer` 可为空（静态权重）。
 */
class BacktestReplayEngine {
 public:
  BacktestReplayEngine(const EngineConfig& config,
                       ProviderPool* pool,
                       WeightOptimizer* optimizer,
                       DecisionCache* cache,
                       PortfolioMemory* memory,
                       const CorrelationMatrix* correlations = nullptr);

  /**
   * @brief 回放一段快照序列
   *
   * 交易结果写入记忆失败时返回 false，该结果不参与权重学习。
   *
   * @throws InsufficientProvidersError 某根 bar 没有任何有效投票
   * @throws ReadOnlyViolationError `learn` 为 true 但记忆处于只读
   */
  bool Run(const std::vector<MarketSnapshot>& series,
           const ReplayOptions& options,
           BacktestResult* out_result,
           std::string* out_error);

  const EngineConfig& config() const { return config_; }

 private:
  EngineConfig config_;
  ProviderPool* pool_{nullptr};
  WeightOptimizer* optimizer_{nullptr};
  DecisionCache* cache_{nullptr};
  PortfolioMemory* memory_{nullptr};
  const CorrelationMatrix* correlations_{nullptr};
};

}  // namespace feedback_engine
