#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/random/mersenne_twister.hpp>

#include "core/config.h"
#include "core/types.h"

namespace feedback_engine {

/// 单个 provider 的 Beta 后验与分 regime 乘子。
struct ProviderWeightState {
  double alpha{1.0};
  double beta{1.0};
  int wins{0};
  int losses{0};
  std::array<double, 3> regime_multipliers{1.0, 1.0, 1.0};  ///< trending/ranging/volatile
};

/// 全部学习状态的深拷贝（walk-forward 快照、Monte Carlo 私有副本）。
struct WeightOptimizerState {
  std::map<std::string, ProviderWeightState> providers;
};

/**
 * @brief Thompson 采样权重学习器
 *
 * 设计边界：
 * 1. provider 集合在构造时固定，顺序即优先级；
 * 2. 每个 provider 的读改写在自身锁内完成（单写者）；
 * 3. 配置了 `state_path` 时每次更新后原子落盘；
 * 4. 采样使用 Boost.Random，给定种子在任意平台上可复现。
 */
class WeightOptimizer {
 public:
  WeightOptimizer(std::vector<std::string> provider_ids,
                  WeightOptimizerConfig config);

  WeightOptimizer(const WeightOptimizer&) = delete;
  WeightOptimizer& operator=(const WeightOptimizer&) = delete;

  /**
   * @brief 从 `state_path` 加载历史状态
   *
   * 文件不存在视为首次启动；文件损坏时默认失败，
   * 仅当 `allow_fresh_start` 为 true 时重置为先验并继续。
   */
  bool Initialize(std::string* out_error);

  /// 按一次交易结果更新 provider 后验与 regime 乘子，并持久化。
  bool UpdateWeightsFromOutcome(const std::string& provider_id,
                                bool won,
                                MarketRegime regime,
                                std::string* out_error);

  /// 每个 provider 采样一次并乘以 regime 乘子，归一化后和为 1。
  std::map<std::string, double> SampleWeights(MarketRegime regime);

  /// alpha / (alpha + beta)，确定性，用于监控收敛。
  std::map<std::string, double> ExpectedWeights() const;

  /// (alpha - 1) / (wins + losses)，无历史时 0.5。
  std::map<std::string, double> WinRates() const;

  WeightOptimizerState ExportState() const;
  bool RestoreState(const WeightOptimizerState& state, std::string* out_error);

  void ResetProvider(const std::string& provider_id);
  void ResetAll();

  /// 重置随机源（回放/测试复现用）。
  void Reseed(std::uint64_t seed);

  /// 关闭后不再写盘（私有副本使用）。
  void DisablePersistence() { persistence_enabled_ = false; }

  /// 手动落盘。
  bool Save(std::string* out_error) const;

  const std::vector<std::string>& provider_ids() const { return provider_ids_; }

 private:
  struct Slot {
    mutable std::mutex mutex;
    ProviderWeightState state;
  };

  static std::size_t RegimeIndex(MarketRegime regime);
  bool ValidateState(const ProviderWeightState& state, std::string* out_error) const;
  bool LoadFromFile(std::string* out_error);

  WeightOptimizerConfig config_;
  std::vector<std::string> provider_ids_;                 ///< 优先级顺序。
  std::map<std::string, std::unique_ptr<Slot>> slots_;    ///< 构造后键集合不变。
  mutable std::mutex rng_mutex_;
  boost::random::mt19937_64 rng_;
  mutable std::mutex save_mutex_;
  bool persistence_enabled_{true};
};

}  // namespace feedback_engine
