#include "risk/risk_gatekeeper.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>

#include "risk/var_calculator.h"

namespace feedback_engine {

namespace {

RiskVerdict Deny(RiskVerdict verdict, std::string rule, std::string reason) {
  verdict.allow = false;
  verdict.triggered_rule = std::move(rule);
  verdict.reason = std::move(reason);
  return verdict;
}

std::string Percent(double ratio) {
  std::ostringstream oss;
  oss.precision(2);
  oss << std::fixed << ratio * 100.0 << '%';
  return oss.str();
}

}  // namespace

RiskGatekeeper::RiskGatekeeper(RiskConfig risk, FreshnessConfig freshness,
                               ExposureReservationManager* reservations)
    : risk_(risk), freshness_(freshness), reservations_(reservations) {}

bool RiskGatekeeper::IsRiskIncreasing(Action action, double current_position) {
  switch (action) {
    case Action::kBuy:
      return current_position >= 0.0;
    case Action::kSell:
      return current_position <= 0.0;
    case Action::kHold:
      return false;
  }
  return false;
}

std::int64_t RiskGatekeeper::EffectiveTime(const RiskContext& context) const {
  if (context.replay_timestamp.has_value()) {
    return *context.replay_timestamp;
  }
  if (context.live_now_ts > 0) {
    return context.live_now_ts;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

int RiskGatekeeper::FreshnessThreshold(const std::string& timeframe) const {
  if (timeframe == "1d" || timeframe == "1D" || timeframe == "d" ||
      timeframe == "daily") {
    return freshness_.daily_max_age_s;
  }
  return freshness_.intraday_max_age_s;
}

double RiskGatekeeper::CorrelationFactor(const std::string& asset_pair,
                                         const RiskContext& context) const {
  if (context.correlations == nullptr) {
    return 1.0;
  }
  double max_correlation = 0.0;
  for (const auto& [held_asset, notional] : context.holdings) {
    if (held_asset == asset_pair || std::fabs(notional) <= 0.0) {
      continue;
    }
    if (const auto correlation = context.correlations->Get(asset_pair, held_asset)) {
      max_correlation = std::max(max_correlation, std::fabs(*correlation));
    }
  }
  const double threshold = risk_.correlation_threshold;
  if (max_correlation <= threshold) {
    return 1.0;
  }
  const double excess = (std::min(max_correlation, 1.0) - threshold) / (1.0 - threshold);
  return 1.0 - risk_.max_correlation_reduction * excess;
}

RiskVerdict RiskGatekeeper::Validate(Decision* decision,
                                     const RiskContext& context) const {
  RiskVerdict verdict;
  if (decision == nullptr) {
    return Deny(verdict, "input", "decision is null");
  }
  const std::int64_t now = EffectiveTime(context);

  // 1. 交易时段：以决策时间戳为准（回放即历史时刻）。
  const std::int64_t decision_time =
      context.replay_timestamp.has_value() ? decision->timestamp : now;
  const MarketStatus status =
      schedule_.GetStatus(context.asset_type, decision_time);
  verdict.warnings.insert(verdict.warnings.end(), status.warnings.begin(),
                          status.warnings.end());
  if (!status.is_open) {
    return Deny(verdict, "market_schedule",
                std::string("market closed: ") + ToString(context.asset_type) +
                    " session " + status.session);
  }

  // 2. 数据新鲜度：回放模式跳过。决策时间戳即快照时间戳。
  if (!context.replay_timestamp.has_value()) {
    const std::int64_t age = now - decision->timestamp;
    const int threshold = FreshnessThreshold(context.timeframe);
    if (age > threshold) {
      return Deny(verdict, "data_freshness",
                  "stale market data: age " + std::to_string(age) +
                      "s exceeds " + std::to_string(threshold) + "s");
    }
  }

  // 3. 相关性：只缩量，不拒绝。
  const double factor = CorrelationFactor(decision->asset_pair, context);
  verdict.size_multiplier = factor;
  if (factor < 1.0) {
    verdict.warnings.push_back("correlated holdings: size scaled by " +
                               Percent(factor));
  }
  if (decision->sizing.has_value() && decision->correlation_factor > 0.0 &&
      std::fabs(decision->correlation_factor - factor) > 1e-12) {
    decision->sizing->recommended_position_size *=
        factor / decision->correlation_factor;
  }
  decision->correlation_factor = factor;

  const bool risk_increasing =
      IsRiskIncreasing(decision->action, context.current_position);

  // 4. 回撤 / VaR / 波动：只拦截增加风险的交易。
  if (risk_increasing) {
    if (context.trailing_drawdown > risk_.max_drawdown) {
      return Deny(verdict, "max_drawdown",
                  "trailing drawdown " + Percent(context.trailing_drawdown) +
                      " exceeds limit " + Percent(risk_.max_drawdown));
    }
    const double var = HistoricalVar(context.recent_returns,
                                     risk_.var_confidence, risk_.min_var_samples);
    if (var > risk_.max_var_pct) {
      return Deny(verdict, "value_at_risk",
                  "VaR " + Percent(var) + " exceeds limit " +
                      Percent(risk_.max_var_pct));
    }
    if (context.volatility.has_value() &&
        *context.volatility > risk_.volatility_threshold &&
        decision->confidence < risk_.min_confidence_in_volatile) {
      return Deny(verdict, "volatility",
                  "high volatility " + Percent(*context.volatility) +
                      " requires confidence >= " +
                      std::to_string(static_cast<int>(
                          risk_.min_confidence_in_volatile)));
    }
  }

  // 5. 风险预算预占：只对有仓位的增险交易生效。
  if (!risk_increasing) {
    return verdict;
  }
  if (!decision->sizing.has_value()) {
    if (decision->signal_only) {
      verdict.warnings.push_back("signal-only decision: no exposure reserved");
    }
    return verdict;
  }
  if (reservations_ == nullptr) {
    return Deny(verdict, "exposure_reservation",
                "reservation manager unavailable");
  }
  const double notional = decision->sizing->recommended_position_size *
                          decision->sizing->entry_price;
  const double budget =
      std::max(0.0, context.equity) * risk_.max_total_exposure_pct;
  std::string reserve_error;
  if (!reservations_->TryReserve(decision->id, decision->asset_pair, notional,
                                 context.committed_exposure, budget, now,
                                 &reserve_error)) {
    return Deny(verdict, "exposure_reservation", reserve_error);
  }
  return verdict;
}

}  // namespace feedback_engine
