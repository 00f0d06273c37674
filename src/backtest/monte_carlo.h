#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/types.h"
#include "ensemble/weight_optimizer.h"
#include "memory/portfolio_memory.h"
#include "provider/provider_pool.h"

namespace feedback_engine {

/// Monte Carlo 汇总结果（金额口径为期末权益）。
struct MonteCarloReport {
  int num_simulations{0};
  int completed_paths{0};
  std::vector<double> final_balances;  ///< 按路径下标排列。
  double p5{0.0};
  double p25{0.0};
  double p50{0.0};
  double p75{0.0};
  double p95{0.0};
  double var_confidence{0.95};
  double value_at_risk{0.0};   ///< initial - percentile(1 - confidence)。
  double expected_return{0.0}; ///< mean(final) / initial - 1。
  double worst_final{0.0};
  double best_final{0.0};
  double std_final{0.0};
  bool cancelled{false};
};

/**
 * @brief 价格扰动 Monte Carlo 模拟器
 *
 * 每条路径：对历史序列逐 bar 施加同一乘性噪声 (1 + N(0, std))，
 * 在私有的记忆与权重副本上完整回放。路径之间不共享任何可变状态，
 * 也不使用决策缓存；路径在有界线程池上并行执行。
 *
 * 噪声种子为 `monte_carlo.seed + path_index + 1`，权重采样种子为
 * `weights.seed`；std 为 0 时所有路径结果逐位一致。
 */
class MonteCarloSimulator {
 public:
  MonteCarloSimulator(const EngineConfig& config, ProviderPool* pool)
      : config_(config), pool_(pool) {}

  /**
   * @brief 执行全部路径
   *
   * `base_optimizer` 为空时使用静态权重。取消请求在路径开始前检查。
   *
   * @throws InsufficientProvidersError 任一路径出现无有效投票的 bar
   */
  bool Run(const std::vector<MarketSnapshot>& series,
           const PortfolioMemory& base_memory,
           const WeightOptimizer* base_optimizer,
           const std::atomic<bool>* cancel,
           MonteCarloReport* out_report,
           std::string* out_error) const;

  /// 生成一条扰动路径；乘性因子下限为 0.01，指标字段保持不变。
  static std::vector<MarketSnapshot> PerturbSeries(
      const std::vector<MarketSnapshot>& series,
      double noise_std,
      std::uint64_t seed);

  /// 已排序样本的线性插值分位数，q 取 [0, 1]。
  static double Percentile(const std::vector<double>& sorted_values, double q);

 private:
  EngineConfig config_;
  ProviderPool* pool_{nullptr};
};

}  // namespace feedback_engine
