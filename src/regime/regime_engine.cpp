#include "regime/regime_engine.h"

#include <algorithm>
#include <cmath>

namespace feedback_engine {

namespace {

constexpr double kEpsilon = 1e-12;

}  // namespace

MarketRegime RegimeEngine::Classify(const AssetState& state,
                                    double instant_return) const {
  if (std::fabs(instant_return) >= config_.extreme_threshold ||
      state.ewma_abs_return >= config_.volatility_threshold) {
    return MarketRegime::kVolatile;
  }
  if (std::fabs(state.ewma_return) >= config_.trend_threshold) {
    return MarketRegime::kTrending;
  }
  return MarketRegime::kRanging;
}

RegimeState RegimeEngine::OnSnapshot(const MarketSnapshot& snapshot) {
  RegimeState out;
  out.asset_pair = snapshot.asset_pair;
  if (!config_.enabled) {
    out.warmup = false;
    return out;
  }

  AssetState& state = asset_state_[snapshot.asset_pair];
  if (!state.has_last_close || state.last_close <= kEpsilon ||
      snapshot.close <= kEpsilon) {
    state.has_last_close = true;
    state.last_close = snapshot.close;
    state.samples = 1;
    return out;
  }

  const double instant_return =
      (snapshot.close - state.last_close) / state.last_close;
  state.last_close = snapshot.close;
  ++state.samples;

  const double alpha = std::clamp(config_.ewma_alpha, 1e-6, 1.0);
  state.ewma_return = (1.0 - alpha) * state.ewma_return + alpha * instant_return;
  state.ewma_abs_return =
      (1.0 - alpha) * state.ewma_abs_return + alpha * std::fabs(instant_return);

  out.instant_return = instant_return;
  out.trend_strength = state.ewma_return;
  out.volatility_level = state.ewma_abs_return;
  out.warmup = state.samples < std::max(0, config_.warmup_ticks);
  if (out.warmup) {
    return out;
  }

  const MarketRegime raw = Classify(state, instant_return);
  const int confirm_ticks = std::max(1, config_.switch_confirm_ticks);
  if (!state.has_confirmed || confirm_ticks <= 1) {
    state.has_confirmed = true;
    state.confirmed = raw;
    state.pending = raw;
    state.pending_ticks = 0;
  } else if (raw == state.confirmed) {
    state.pending = raw;
    state.pending_ticks = 0;
  } else {
    if (state.pending != raw) {
      state.pending = raw;
      state.pending_ticks = 1;
    } else {
      ++state.pending_ticks;
    }
    if (state.pending_ticks >= confirm_ticks) {
      state.confirmed = raw;
      state.pending_ticks = 0;
    }
  }
  out.regime = state.confirmed;
  return out;
}

}  // namespace feedback_engine
