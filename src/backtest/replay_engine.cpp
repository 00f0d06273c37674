#include "backtest/replay_engine.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>

#include "core/log.h"
#include "market/market_snapshot.h"
#include "regime/regime_engine.h"
#include "risk/exposure_reservation.h"
#include "risk/var_calculator.h"
#include "system/decision_pipeline.h"

namespace feedback_engine {

namespace {

constexpr std::size_t kMaxReturnSamples = 250;
constexpr double kSizeEpsilon = 1e-12;

struct OpenPosition {
  PositionType type{PositionType::kLong};
  double size{0.0};
  double entry_price{0.0};  ///< 含滑点的成交价。
  double entry_fee{0.0};
  std::int64_t entry_ts{0};
  double stop_price{0.0};
  std::string decision_id;
  double confidence{0.0};
  MarketRegime regime{MarketRegime::kRanging};
  std::vector<std::string> providers;
};

// 单次回放的现金与持仓账本。
class ReplayLedger {
 public:
  /// `run_tag` 区分同一份记忆上的多次回放，决策 id 每次回放从 1 重新编号。
  ReplayLedger(const BacktestConfig& config, std::string run_tag)
      : config_(config), cash_(config.initial_balance), run_tag_(std::move(run_tag)) {}

  double Equity(double mark_price) const {
    if (!position_.has_value()) {
      return cash_;
    }
    const double sign = position_->type == PositionType::kLong ? 1.0 : -1.0;
    return cash_ + sign * position_->size * mark_price;
  }

  double SignedSize() const {
    if (!position_.has_value()) {
      return 0.0;
    }
    return position_->type == PositionType::kLong ? position_->size
                                                  : -position_->size;
  }

  const std::optional<OpenPosition>& position() const { return position_; }

  ExecutionResult Open(const Decision& decision, const MarketSnapshot& bar,
                       MarketRegime regime) {
    ExecutionResult result;
    const double size = decision.sizing->recommended_position_size;
    if (size <= kSizeEpsilon) {
      result.message = "zero position size";
      return result;
    }
    const bool is_long = decision.action == Action::kBuy;
    const double fill = FillPrice(bar.close, is_long);
    const double fee = Fee(size * fill);
    cash_ += is_long ? -(size * fill + fee) : (size * fill - fee);

    OpenPosition position;
    position.type = is_long ? PositionType::kLong : PositionType::kShort;
    position.size = size;
    position.entry_price = fill;
    position.entry_fee = fee;
    position.entry_ts = bar.timestamp;
    position.stop_price = decision.sizing->stop_loss_price;
    position.decision_id = decision.id;
    position.confidence = decision.confidence;
    position.regime = regime;
    for (const auto& vote : decision.contributing_votes) {
      if (vote.action == decision.action) {
        position.providers.push_back(vote.provider_id);
      }
    }
    position_ = std::move(position);

    result.success = true;
    result.fill_price = fill;
    result.filled_size = size;
    result.fees = fee;
    result.message = is_long ? "opened long" : "opened short";
    return result;
  }

  /// 以参考价平仓，返回交易结果；无持仓时返回空。
  std::optional<TradeOutcome> Close(double reference_price, std::int64_t ts,
                                    ExecutionResult* out_execution) {
    if (!position_.has_value()) {
      return std::nullopt;
    }
    const OpenPosition position = std::move(*position_);
    position_.reset();

    const bool is_long = position.type == PositionType::kLong;
    const double fill = FillPrice(reference_price, !is_long);
    const double fee = Fee(position.size * fill);
    cash_ += is_long ? (position.size * fill - fee) : -(position.size * fill + fee);

    const double gross = is_long ? (fill - position.entry_price) * position.size
                                 : (position.entry_price - fill) * position.size;
    TradeOutcome outcome;
    outcome.trade_id = "trade-" + run_tag_ + "-" + position.decision_id;
    outcome.decision_id = position.decision_id;
    outcome.position_type = position.type;
    outcome.entry_timestamp = position.entry_ts;
    outcome.exit_timestamp = ts;
    outcome.entry_price = position.entry_price;
    outcome.exit_price = fill;
    outcome.size = position.size;
    outcome.fees = position.entry_fee + fee;
    outcome.realized_pnl = gross - outcome.fees;
    const double cost_basis = position.entry_price * position.size;
    outcome.pnl_pct = cost_basis > 0.0 ? outcome.realized_pnl / cost_basis : 0.0;
    outcome.holding_hours = static_cast<double>(ts - position.entry_ts) / 3600.0;
    outcome.confidence = position.confidence;
    outcome.regime = position.regime;
    outcome.contributing_providers = position.providers;
    outcome.was_profitable = outcome.realized_pnl > 0.0;

    if (out_execution != nullptr) {
      out_execution->success = true;
      out_execution->fill_price = fill;
      out_execution->filled_size = position.size;
      out_execution->fees = fee;
      out_execution->message = is_long ? "closed long" : "closed short";
    }
    return outcome;
  }

 private:
  double FillPrice(double price, bool is_buy) const {
    return is_buy ? price * (1.0 + config_.slippage_pct)
                  : price * (1.0 - config_.slippage_pct);
  }

  double Fee(double notional) const {
    return notional * config_.fee_pct + config_.commission_per_trade;
  }

  BacktestConfig config_;
  double cash_{0.0};
  std::string run_tag_;
  std::optional<OpenPosition> position_;
};

// 止损触发价；跳空越过止损时按开盘价成交。
std::optional<double> StopExitPrice(const OpenPosition& position,
                                    const MarketSnapshot& bar) {
  if (position.stop_price <= 0.0) {
    return std::nullopt;
  }
  if (position.type == PositionType::kLong && bar.low <= position.stop_price) {
    return std::min(position.stop_price, bar.open);
  }
  if (position.type == PositionType::kShort && bar.high >= position.stop_price) {
    return std::max(position.stop_price, bar.open);
  }
  return std::nullopt;
}

}  // namespace

BacktestReplayEngine::BacktestReplayEngine(const EngineConfig& config,
                                           ProviderPool* pool,
                                           WeightOptimizer* optimizer,
                                           DecisionCache* cache,
                                           PortfolioMemory* memory,
                                           const CorrelationMatrix* correlations)
    : config_(config),
      pool_(pool),
      optimizer_(optimizer),
      cache_(cache),
      memory_(memory),
      correlations_(correlations) {}

bool BacktestReplayEngine::Run(const std::vector<MarketSnapshot>& series,
                               const ReplayOptions& options,
                               BacktestResult* out_result,
                               std::string* out_error) {
  if (out_result == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_result 为空";
    }
    return false;
  }
  if (!ValidateSnapshotSeries(series, out_error)) {
    return false;
  }

  const DecisionCacheStats cache_before =
      cache_ != nullptr ? cache_->Stats() : DecisionCacheStats{};
  ExposureReservationManager reservations(config_.risk.reservation_ttl_s);
  DecisionPipeline pipeline(config_, pool_, optimizer_, cache_, &reservations);
  RegimeEngine regime_engine(config_.regime);
  const std::size_t recorded_before = memory_ != nullptr ? memory_->size() : 0;
  ReplayLedger ledger(config_.backtest, "r" + std::to_string(recorded_before));

  BacktestResult result;
  result.equity_curve.push_back(config_.backtest.initial_balance);
  int denied = 0;

  // 记忆写入失败时不学习，并终止回放：同一结果不能只进权重不进记忆。
  auto record_outcome = [&](TradeOutcome outcome) -> bool {
    outcome.asset_pair = series.front().asset_pair;
    if (options.learn) {
      if (memory_ != nullptr) {
        std::string memory_error;
        if (!memory_->RecordTradeOutcome(outcome, &memory_error)) {
          LogError("REPLAY_OUTCOME_NOT_RECORDED: trade=" + outcome.trade_id +
                   ", error=" + memory_error);
          if (out_error != nullptr) {
            *out_error = "交易结果写入记忆失败: " + memory_error;
          }
          return false;
        }
      }
      std::string learn_error;
      if (!pipeline.LearnFromOutcome(outcome, &learn_error)) {
        LogWarn("REPLAY_WEIGHT_UPDATE_FAILED: trade=" + outcome.trade_id +
                ", error=" + learn_error);
      }
    }
    result.trades.push_back(std::move(outcome));
    return true;
  };

  for (const MarketSnapshot& bar : series) {
    if (options.cancel != nullptr && options.cancel->load()) {
      result.cancelled = true;
      LogInfo("REPLAY_CANCELLED: asset=" + bar.asset_pair +
              ", ts=" + std::to_string(bar.timestamp));
      break;
    }
    const MarketRegime regime = config_.regime.enabled
                                    ? regime_engine.OnSnapshot(bar).regime
                                    : MarketRegime::kRanging;

    if (ledger.position().has_value()) {
      if (const auto stop = StopExitPrice(*ledger.position(), bar)) {
        if (auto outcome = ledger.Close(*stop, bar.timestamp, nullptr)) {
          if (!record_outcome(std::move(*outcome))) {
            return false;
          }
        }
      }
    }

    DecisionRequest request;
    request.snapshot = bar;
    request.regime = regime;
    request.replay_timestamp = bar.timestamp;
    request.correlations = correlations_;
    request.use_cache = options.use_cache;
    const double equity = ledger.Equity(bar.close);
    if (equity > 0.0) {
      request.portfolio.balance = equity;
    }
    request.portfolio.trailing_drawdown = TrailingDrawdown(result.equity_curve);
    std::vector<double> returns = ReturnsFromEquity(result.equity_curve);
    if (returns.size() > kMaxReturnSamples) {
      returns.erase(returns.begin(),
                    returns.end() - static_cast<std::ptrdiff_t>(kMaxReturnSamples));
    }
    request.portfolio.recent_returns = std::move(returns);
    request.portfolio.current_position = ledger.SignedSize();
    if (std::fabs(ledger.SignedSize()) > kSizeEpsilon) {
      const double notional = ledger.SignedSize() * bar.close;
      request.portfolio.holdings[bar.asset_pair] = notional;
      request.portfolio.committed_exposure = std::fabs(notional);
    }

    Decision decision;
    if (!pipeline.Decide(request, &decision, out_error)) {
      return false;
    }
    const bool allowed = decision.verdict.has_value() && decision.verdict->allow;
    if (!allowed) {
      ++denied;
    }

    const auto& position = ledger.position();
    const bool same_direction =
        position.has_value() &&
        ((position->type == PositionType::kLong && decision.action == Action::kBuy) ||
         (position->type == PositionType::kShort && decision.action == Action::kSell));
    if (allowed && same_direction && decision.sizing.has_value()) {
      // 已有同向持仓：信号只是维持持仓，不进入执行，也不算执行失败。
      pipeline.ReleaseDecision(decision.id);
      LogInfo("REPLAY_SIGNAL_HELD: id=" + decision.id);
    } else if (allowed && decision.action != Action::kHold &&
               decision.sizing.has_value()) {
      ExecutionResult execution;
      if (position.has_value()) {
        if (auto outcome = ledger.Close(bar.close, bar.timestamp, &execution)) {
          if (!record_outcome(std::move(*outcome))) {
            pipeline.ReleaseDecision(decision.id);
            return false;
          }
        }
      } else if (decision.action == Action::kSell && !config_.backtest.allow_short) {
        execution.message = "short selling disabled";
      } else {
        execution = ledger.Open(decision, bar, regime);
      }
      decision.execution = execution;
      std::string complete_error;
      if (!pipeline.CompleteExecution(decision.id, execution, &complete_error)) {
        LogWarn("REPLAY_COMPLETE_EXECUTION_FAILED: " + complete_error);
      }
    }

    result.decisions.push_back(std::move(decision));
    result.equity_curve.push_back(ledger.Equity(bar.close));
  }

  if (ledger.position().has_value() && !result.decisions.empty()) {
    const std::int64_t last_ts = result.decisions.back().timestamp;
    const auto last = std::find_if(series.begin(), series.end(),
                                   [last_ts](const MarketSnapshot& bar) {
                                     return bar.timestamp == last_ts;
                                   });
    if (last != series.end()) {
      if (auto outcome = ledger.Close(last->close, last->timestamp, nullptr)) {
        if (!record_outcome(std::move(*outcome))) {
          return false;
        }
      }
      result.equity_curve.back() = ledger.Equity(last->close);
    }
  }

  result.metrics = ComputeMetrics(config_.backtest.initial_balance,
                                  result.equity_curve, result.trades,
                                  config_.backtest.periods_per_year);
  result.metrics.decisions = static_cast<int>(result.decisions.size());
  result.metrics.denied_decisions = denied;
  if (cache_ != nullptr) {
    const DecisionCacheStats cache_after = cache_->Stats();
    result.metrics.cache_hits = cache_after.hits - cache_before.hits;
    result.metrics.cache_misses = cache_after.misses - cache_before.misses;
  }
  *out_result = std::move(result);
  return true;
}

}  // namespace feedback_engine
