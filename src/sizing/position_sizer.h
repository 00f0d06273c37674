#pragma once

#include <optional>
#include <string>

#include "core/config.h"
#include "core/types.h"

namespace feedback_engine {

/// 定仓输入。`balance` 缺失/非正/非有限时进入 signal-only。
struct SizingRequest {
  Action action{Action::kHold};
  double confidence{0.0};
  std::optional<double> balance;
  double entry_price{0.0};
  double correlation_factor{1.0};   ///< 来自 RiskGatekeeper::CorrelationFactor。
  std::optional<double> atr;        ///< 启用动态止损时使用。
  std::optional<double> risk_pct;       ///< 覆盖配置（>1 视为百分数）。
  std::optional<double> stop_loss_pct;  ///< 覆盖配置（>1 视为百分数）。
};

/// 定仓结果。signal_only 为 true 时 sizing 必为空。
struct SizingResult {
  PositionType position_type{PositionType::kNone};
  bool signal_only{false};
  std::optional<PositionSizing> sizing;
};

/**
 * @brief 风险定额仓位计算
 *
 * base  = balance * risk_pct / (entry_price * stop_loss_pct)
 * final = base * correlation_factor * max(min_confidence_factor, confidence / 100)
 *
 * entry_price <= 0 或计算出负仓位时返回校验错误，不做兜底。
 */
class PositionSizer {
 public:
  explicit PositionSizer(SizingConfig config) : config_(config) {}

  bool Size(const SizingRequest& request,
            SizingResult* out_result,
            std::string* out_error) const;

  /// 纯公式，供测试与回放复用。
  static double BaseSize(double balance, double risk_pct, double entry_price,
                         double stop_loss_pct);

  /// ATR 动态止损比例（夹在配置上下限内）。
  double DynamicStopLoss(double atr, double price) const;

 private:
  static double NormalizePercent(double value);

  SizingConfig config_;
};

}  // namespace feedback_engine
