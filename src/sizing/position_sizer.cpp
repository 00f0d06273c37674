#include "sizing/position_sizer.h"

#include <algorithm>
#include <cmath>

namespace feedback_engine {

namespace {

bool Fail(const std::string& message, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

}  // namespace

double PositionSizer::NormalizePercent(double value) {
  // 兼容旧配置中的整数百分比（如 2 表示 2%）。
  return value > 1.0 ? value / 100.0 : value;
}

double PositionSizer::BaseSize(double balance, double risk_pct,
                               double entry_price, double stop_loss_pct) {
  return (balance * risk_pct) / (entry_price * stop_loss_pct);
}

double PositionSizer::DynamicStopLoss(double atr, double price) const {
  const double raw = atr * config_.atr_multiplier / price;
  return std::clamp(raw, config_.min_stop_loss_pct, config_.max_stop_loss_pct);
}

bool PositionSizer::Size(const SizingRequest& request,
                         SizingResult* out_result,
                         std::string* out_error) const {
  if (out_result == nullptr) {
    return Fail("out_result 为空", out_error);
  }
  SizingResult result;
  result.position_type = PositionTypeFor(request.action);
  if (request.action == Action::kHold) {
    *out_result = result;
    return true;
  }
  if (!std::isfinite(request.entry_price) || request.entry_price <= 0.0) {
    return Fail("entry_price must be > 0, got " +
                    std::to_string(request.entry_price),
                out_error);
  }
  if (!std::isfinite(request.confidence) || request.confidence < 0.0 ||
      request.confidence > 100.0) {
    return Fail("confidence must be within [0, 100]", out_error);
  }
  if (!std::isfinite(request.correlation_factor) ||
      request.correlation_factor <= 0.0 || request.correlation_factor > 1.0) {
    return Fail("correlation_factor must be within (0, 1]", out_error);
  }

  const bool balance_usable = request.balance.has_value() &&
                              std::isfinite(*request.balance) &&
                              *request.balance > 0.0;
  if (!balance_usable) {
    result.signal_only = true;
    *out_result = result;
    return true;
  }

  const double risk_pct =
      NormalizePercent(request.risk_pct.value_or(config_.risk_pct));
  double stop_loss_pct =
      NormalizePercent(request.stop_loss_pct.value_or(config_.stop_loss_pct));
  if (config_.use_dynamic_stop_loss && request.atr.has_value() &&
      std::isfinite(*request.atr) && *request.atr > 0.0) {
    stop_loss_pct = DynamicStopLoss(*request.atr, request.entry_price);
  }
  if (!std::isfinite(risk_pct) || risk_pct <= 0.0) {
    return Fail("risk_pct must be > 0", out_error);
  }
  if (!std::isfinite(stop_loss_pct) || stop_loss_pct <= 0.0) {
    return Fail("stop_loss_pct must be > 0", out_error);
  }

  const double base = BaseSize(*request.balance, risk_pct, request.entry_price,
                               stop_loss_pct);
  const double confidence_factor =
      std::max(config_.min_confidence_factor, request.confidence / 100.0);
  const double final_size = base * request.correlation_factor * confidence_factor;
  if (!std::isfinite(final_size) || final_size < 0.0) {
    return Fail("computed position size is invalid: " +
                    std::to_string(final_size),
                out_error);
  }

  PositionSizing sizing;
  sizing.recommended_position_size = final_size;
  sizing.entry_price = request.entry_price;
  sizing.stop_loss_pct = stop_loss_pct;
  sizing.risk_pct = risk_pct;
  sizing.stop_loss_price = result.position_type == PositionType::kLong
                               ? request.entry_price * (1.0 - stop_loss_pct)
                               : request.entry_price * (1.0 + stop_loss_pct);
  result.sizing = sizing;
  *out_result = result;
  return true;
}

}  // namespace feedback_engine
