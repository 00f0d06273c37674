#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/types.h"

namespace feedback_engine {

/// 集成投票参数。`providers` 的顺序即平票时的优先级。
struct EnsembleConfig {
  std::vector<std::string> providers;
  std::map<std::string, double> provider_weights;  ///< 静态兜底权重。
  VotingStrategy voting_strategy{VotingStrategy::kWeighted};
  int min_providers_required{1};
  bool adaptive_weights{true};  ///< true 时使用 Thompson 采样权重。
  double tier3_confidence_factor{0.9};
  double tier4_confidence_factor{0.8};
};

/// Thompson 采样权重学习参数。
struct WeightOptimizerConfig {
  std::uint64_t seed{42};
  std::string state_path;        ///< 为空时不落盘。
  bool allow_fresh_start{false}; ///< 状态文件损坏时是否允许从先验重新开始。
  double multiplier_min{0.1};
  double multiplier_max{10.0};
  double win_multiplier{1.1};
  double loss_multiplier{0.95};
};

/// Provider 扇出参数。
struct ProviderPoolConfig {
  int timeout_ms{10000};
  int max_threads{4};
};

/// 风控门限。
struct RiskConfig {
  double max_drawdown{0.05};
  double correlation_threshold{0.7};
  double max_correlation_reduction{0.5};
  double max_var_pct{0.05};
  double var_confidence{0.95};
  int min_var_samples{30};
  double volatility_threshold{0.05};
  double min_confidence_in_volatile{80.0};
  double max_total_exposure_pct{1.0};  ///< 名义敞口预算 = 权益 * 该比例。
  int reservation_ttl_s{300};
};

/// 行情新鲜度阈值（仅实盘生效）。
struct FreshnessConfig {
  int intraday_max_age_s{900};
  int daily_max_age_s{93600};
};

/// 仓位计算参数。
struct SizingConfig {
  double risk_pct{0.01};
  double stop_loss_pct{0.02};
  bool use_dynamic_stop_loss{false};
  double atr_multiplier{2.0};
  double min_stop_loss_pct{0.01};
  double max_stop_loss_pct{0.05};
  double min_confidence_factor{0.5};
};

/// 持久化路径；为空表示纯内存。
struct PersistenceConfig {
  std::string decisions_path;
  std::string cache_path;
  std::string memory_path;
  bool memory_allow_fresh_start{false};
};

/// Regime 识别参数（EWMA 收益/波动）。
struct RegimeConfig {
  bool enabled{true};
  int warmup_ticks{20};
  double ewma_alpha{0.1};
  double trend_threshold{0.002};
  double volatility_threshold{0.02};
  double extreme_threshold{0.05};
  int switch_confirm_ticks{2};
};

/// 回放撮合与指标参数。
struct BacktestConfig {
  double initial_balance{10000.0};
  double fee_pct{0.001};
  double slippage_pct{0.0001};
  double commission_per_trade{0.0};
  bool allow_short{true};
  double periods_per_year{252.0};
};

/// Walk-forward 参数。`step_bars == 0` 时步长等于测试段长度。
struct WalkForwardConfig {
  double train_ratio{0.7};
  int window_bars{100};
  int step_bars{0};
};

/// Monte Carlo 参数。
struct MonteCarloConfig {
  int num_simulations{1000};
  double price_noise_std{0.001};
  std::uint64_t seed{7};
  int max_threads{4};
};

/// 引擎总配置。
struct EngineConfig {
  EnsembleConfig ensemble;
  WeightOptimizerConfig weights;
  ProviderPoolConfig provider_pool;
  RiskConfig risk;
  FreshnessConfig freshness;
  SizingConfig sizing;
  PersistenceConfig persistence;
  RegimeConfig regime;
  BacktestConfig backtest;
  WalkForwardConfig walk_forward;
  MonteCarloConfig monte_carlo;
};

/// 校验配置取值范围；失败时 `out_error` 给出首个违规字段。
bool ValidateEngineConfig(const EngineConfig& config, std::string* out_error);

/**
 * @brief 从轻量 YAML 文件加载配置
 *
 * 仅支持项目使用的子集：两级缩进的 section/subsection、标量、
 * 行内列表 `[a, b]`、行尾 `#` 注释。未知键忽略。
 * `out_config` 的原值作为默认值；加载结果会经过 ValidateEngineConfig。
 */
bool LoadEngineConfigFromYaml(const std::string& file_path,
                              EngineConfig* out_config,
                              std::string* out_error);

bool ParseVotingStrategy(const std::string& text, VotingStrategy* out_strategy);

}  // namespace feedback_engine
