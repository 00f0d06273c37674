#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/types.h"
#include "memory/portfolio_memory.h"

namespace feedback_engine {

/// 达到 60% 滚动胜率所需的交易数与学习速度。
struct SampleEfficiency {
  std::optional<int> trades_to_threshold;  ///< 未达到时为空。
  double learning_speed_per_100_trades{0.0};
};

/// 事后最优 provider 与累计遗憾。
struct CumulativeRegret {
  std::string optimal_provider;  ///< 无 provider 数据时为空。
  double optimal_avg_pnl{0.0};
  double total_regret{0.0};
  double avg_regret_per_trade{0.0};
};

/// 五等分时间窗口胜率的离散度。
struct ConceptDrift {
  bool sufficient_data{false};  ///< 少于 100 笔时为 false，其余字段为 0。
  double drift_score{0.0};
  std::vector<double> window_win_rates;
  std::string severity{"LOW"};  ///< HIGH / MEDIUM / LOW
};

/// 探索与利用的平衡。
struct ThompsonDiagnostics {
  double exploration_rate{0.0};
  double exploitation_convergence{0.0};
  std::string dominant_provider;
  std::map<std::string, int> provider_distribution;
};

/// 首尾四分位的表现对比。
struct LearningCurve {
  bool sufficient_data{false};  ///< 少于 40 笔时为 false。
  double first_win_rate{0.0};
  double first_avg_pnl{0.0};
  double last_win_rate{0.0};
  double last_avg_pnl{0.0};
  double win_rate_improvement_pct{0.0};
  double pnl_improvement_pct{0.0};
  bool learning_detected{false};
};

struct LearningValidationReport {
  std::string asset_pair;  ///< 未过滤时为 "ALL"。
  int total_trades{0};
  SampleEfficiency sample_efficiency;
  CumulativeRegret cumulative_regret;
  ConceptDrift concept_drift;
  ThompsonDiagnostics thompson;
  LearningCurve learning_curve;
};

/**
 * @brief 从已平仓交易评估学习效果
 *
 * 结果按时间顺序处理；一笔交易对每个 contributing provider 各计一次。
 * `asset_pair` 为空表示全部资产。过滤后没有交易时返回 false。
 */
bool ComputeLearningValidation(const std::vector<TradeOutcome>& outcomes,
                               const std::string& asset_pair,
                               LearningValidationReport* out_report,
                               std::string* out_error);

/// 对记忆的当前快照计算。
bool ComputeLearningValidation(const PortfolioMemory& memory,
                               const std::string& asset_pair,
                               LearningValidationReport* out_report,
                               std::string* out_error);

}  // namespace feedback_engine
