#pragma once

#include <string>
#include <unordered_map>

#include "core/config.h"
#include "core/types.h"

namespace feedback_engine {

/// Regime 运行态快照。
struct RegimeState {
  std::string asset_pair;
  MarketRegime regime{MarketRegime::kRanging};
  double instant_return{0.0};    // 当前 bar 简单收益率。
  double trend_strength{0.0};    // EWMA 收益（带方向）。
  double volatility_level{0.0};  // EWMA 绝对收益。
  bool warmup{true};             // 样本不足时按 ranging 处理。
};

/**
 * @brief 基于收盘价的轻量 Regime 识别器
 *
 * 1. 只依赖按时间顺序输入的快照，不看未来数据；
 * 2. 同输入回放两次输出一致；
 * 3. 新 Regime 需连续 `switch_confirm_ticks` 根 bar 确认后才切换。
 */
class RegimeEngine {
 public:
  explicit RegimeEngine(RegimeConfig config = {}) : config_(config) {}

  RegimeState OnSnapshot(const MarketSnapshot& snapshot);

  /// 清空全部资产状态（每段回放开始时调用）。
  void Reset() { asset_state_.clear(); }

 private:
  struct AssetState {
    bool has_last_close{false};
    double last_close{0.0};
    int samples{0};
    double ewma_return{0.0};
    double ewma_abs_return{0.0};
    bool has_confirmed{false};
    MarketRegime confirmed{MarketRegime::kRanging};
    MarketRegime pending{MarketRegime::kRanging};
    int pending_ticks{0};
  };

  MarketRegime Classify(const AssetState& state, double instant_return) const;

  RegimeConfig config_;
  std::unordered_map<std::string, AssetState> asset_state_;
};

}  // namespace feedback_engine
