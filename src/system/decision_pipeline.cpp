#include "system/decision_pipeline.h"

#include <utility>

#include "core/errors.h"
#include "core/log.h"
#include "storage/record_codec.h"

namespace feedback_engine {

namespace {

std::optional<double> Indicator(const MarketSnapshot& snapshot,
                                const std::string& name) {
  const auto it = snapshot.indicators.find(name);
  if (it == snapshot.indicators.end()) {
    return std::nullopt;
  }
  return it->second;
}

RiskContext BuildRiskContext(const DecisionRequest& request) {
  RiskContext context;
  context.asset_type = request.snapshot.asset_type;
  context.timeframe = request.snapshot.timeframe;
  context.replay_timestamp = request.replay_timestamp;
  context.live_now_ts = request.live_now_ts;
  context.equity = request.portfolio.balance.value_or(0.0);
  context.trailing_drawdown = request.portfolio.trailing_drawdown;
  context.recent_returns = request.portfolio.recent_returns;
  context.holdings = request.portfolio.holdings;
  context.correlations = request.correlations;
  context.committed_exposure = request.portfolio.committed_exposure;
  context.current_position = request.portfolio.current_position;
  context.volatility = Indicator(request.snapshot, "volatility");
  return context;
}

Decision DecisionFromDraft(const DecisionDraft& draft) {
  Decision decision;
  decision.asset_pair = draft.asset_pair;
  decision.timestamp = draft.timestamp;
  decision.action = draft.action;
  decision.confidence = draft.confidence;
  decision.position_type = PositionTypeFor(draft.action);
  decision.tier = draft.tier;
  decision.strategy_used = draft.strategy_used;
  decision.contributing_votes = draft.contributing_votes;
  decision.failed_providers = draft.failed_providers;
  decision.applied_weights = draft.applied_weights;
  decision.regime = draft.regime;
  return decision;
}

}  // namespace

DecisionPipeline::DecisionPipeline(const EngineConfig& config,
                                   ProviderPool* pool,
                                   WeightOptimizer* optimizer,
                                   DecisionCache* cache,
                                   ExposureReservationManager* reservations,
                                   const JournalStore* decision_log)
    : config_(config),
      pool_(pool),
      optimizer_(optimizer),
      cache_(cache),
      reservations_(reservations),
      decision_log_(decision_log),
      aggregator_(config.ensemble),
      sizer_(config.sizing),
      gatekeeper_(config.risk, config.freshness, reservations) {}

std::mutex& DecisionPipeline::AssetMutex(const std::string& asset_pair) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto& slot = asset_mutexes_[asset_pair];
  if (!slot) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

std::string DecisionPipeline::NextDecisionId(const MarketSnapshot& snapshot) {
  const std::uint64_t seq = ++sequence_;
  return snapshot.asset_pair + "-" + std::to_string(snapshot.timestamp) + "-" +
         std::to_string(seq);
}

DecisionDraft DecisionPipeline::BuildDraft(const DecisionRequest& request,
                                           bool* out_from_cache) {
  const MarketSnapshot& snapshot = request.snapshot;
  *out_from_cache = false;
  std::string cache_key;
  const bool cache_enabled = request.use_cache && cache_ != nullptr;
  if (cache_enabled) {
    std::string key_error;
    if (!DecisionCache::BuildKey(snapshot, &cache_key, &key_error)) {
      LogWarn("DECISION_CACHE_KEY_FAILED: asset=" + snapshot.asset_pair +
              ", error=" + key_error);
      cache_key.clear();
    } else if (auto cached = cache_->Get(cache_key)) {
      *out_from_cache = true;
      return *cached;
    }
  }

  if (pool_ == nullptr) {
    throw InsufficientProvidersError("provider pool unavailable for " +
                                     snapshot.asset_pair);
  }
  const ProviderPoolResult collected = pool_->CollectVotes(snapshot);
  std::map<std::string, double> weights;
  if (config_.ensemble.adaptive_weights && optimizer_ != nullptr) {
    weights = optimizer_->SampleWeights(request.regime);
  } else {
    weights = aggregator_.StaticWeights();
  }
  DecisionDraft draft =
      aggregator_.Aggregate(snapshot.asset_pair, snapshot.timestamp,
                            request.regime, collected.votes, weights,
                            collected.failed_providers);
  if (!cache_key.empty()) {
    if (!cache_->Put(cache_key, draft)) {
      LogWarn("DECISION_CACHE_PUT_FAILED: key=" + cache_key);
    }
  }
  return draft;
}

bool DecisionPipeline::Decide(const DecisionRequest& request,
                              Decision* out_decision,
                              std::string* out_error) {
  if (out_decision == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_decision 为空";
    }
    return false;
  }
  const MarketSnapshot& snapshot = request.snapshot;
  std::lock_guard<std::mutex> asset_lock(AssetMutex(snapshot.asset_pair));

  // 在途拒绝同样是一条决策，与正常决策一样落盘。
  Decision denied;
  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    const auto it = in_flight_.find(snapshot.asset_pair);
    if (it != in_flight_.end()) {
      denied.id = NextDecisionId(snapshot);
      denied.asset_pair = snapshot.asset_pair;
      denied.timestamp = snapshot.timestamp;
      denied.regime = request.regime;
      denied.tier = AggregationTier::kNone;
      RiskVerdict verdict;
      verdict.allow = false;
      verdict.triggered_rule = "in_flight";
      verdict.reason = "decision " + it->second + " still in flight";
      denied.verdict = verdict;
    }
  }
  if (denied.verdict.has_value()) {
    LogInfo("DECISION_DENIED: id=" + denied.id + ", rule=in_flight, reason=" +
            denied.verdict->reason);
    if (!AppendToLog(denied, out_error)) {
      return false;
    }
    *out_decision = std::move(denied);
    return true;
  }

  bool from_cache = false;
  const DecisionDraft draft = BuildDraft(request, &from_cache);

  Decision decision = DecisionFromDraft(draft);
  decision.id = NextDecisionId(snapshot);
  decision.from_cache = from_cache;

  const RiskContext context = BuildRiskContext(request);
  const double factor = gatekeeper_.CorrelationFactor(snapshot.asset_pair, context);

  SizingRequest sizing_request;
  sizing_request.action = decision.action;
  sizing_request.confidence = decision.confidence;
  sizing_request.balance = request.portfolio.balance;
  sizing_request.entry_price = snapshot.close;
  sizing_request.correlation_factor = factor;
  sizing_request.atr = Indicator(snapshot, "atr");
  SizingResult sized;
  if (!sizer_.Size(sizing_request, &sized, out_error)) {
    return false;
  }
  decision.position_type = sized.position_type;
  decision.signal_only = sized.signal_only;
  decision.sizing = sized.sizing;
  decision.correlation_factor = factor;

  decision.verdict = gatekeeper_.Validate(&decision, context);
  const bool allowed = decision.verdict->allow;
  if (!allowed) {
    LogInfo("DECISION_DENIED: id=" + decision.id +
            ", rule=" + decision.verdict->triggered_rule +
            ", reason=" + decision.verdict->reason);
  }

  const bool needs_execution = allowed && decision.action != Action::kHold &&
                               decision.sizing.has_value();
  if (needs_execution) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_[decision.asset_pair] = decision.id;
  }

  if (!AppendToLog(decision, out_error)) {
    if (needs_execution) {
      ReleaseDecision(decision.id);
    }
    return false;
  }

  *out_decision = std::move(decision);
  return true;
}

bool DecisionPipeline::AppendToLog(const Decision& decision,
                                   std::string* out_error) {
  if (decision_log_ == nullptr) {
    return true;
  }
  std::string log_error;
  bool appended = false;
  {
    std::lock_guard<std::mutex> lock(log_mutex_);
    appended = decision_log_->Append(DecisionToRecord(decision), &log_error);
  }
  if (!appended) {
    LogError("DECISION_LOG_APPEND_FAILED: id=" + decision.id +
             ", error=" + log_error);
    if (out_error != nullptr) {
      *out_error = "决策日志写入失败: " + log_error;
    }
    return false;
  }
  return true;
}

bool DecisionPipeline::CompleteExecution(const std::string& decision_id,
                                         const ExecutionResult& result,
                                         std::string* out_error) {
  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    auto it = in_flight_.begin();
    for (; it != in_flight_.end(); ++it) {
      if (it->second == decision_id) {
        break;
      }
    }
    if (it == in_flight_.end()) {
      if (out_error != nullptr) {
        *out_error = "决策不在执行中: " + decision_id;
      }
      return false;
    }
    in_flight_.erase(it);
  }
  if (reservations_ != nullptr) {
    // 减险交易没有预占，Commit/Rollback 找不到记录属正常。
    const bool released = result.success ? reservations_->Commit(decision_id)
                                          : reservations_->Rollback(decision_id);
    if (!released) {
      LogInfo("EXECUTION_WITHOUT_RESERVATION: id=" + decision_id);
    }
  }
  if (!result.success) {
    LogWarn("EXECUTION_FAILED: id=" + decision_id + ", message=" + result.message);
  }
  return true;
}

void DecisionPipeline::ReleaseDecision(const std::string& decision_id) {
  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    for (auto it = in_flight_.begin(); it != in_flight_.end(); ++it) {
      if (it->second == decision_id) {
        in_flight_.erase(it);
        break;
      }
    }
  }
  if (reservations_ != nullptr) {
    reservations_->Rollback(decision_id);
  }
}

bool DecisionPipeline::LearnFromOutcome(const TradeOutcome& outcome,
                                        std::string* out_error) {
  if (optimizer_ == nullptr) {
    return true;
  }
  for (const auto& provider_id : outcome.contributing_providers) {
    std::string update_error;
    if (!optimizer_->UpdateWeightsFromOutcome(provider_id, outcome.was_profitable,
                                              outcome.regime, &update_error)) {
      if (out_error != nullptr) {
        *out_error = update_error;
      }
      return false;
    }
  }
  return true;
}

bool DecisionPipeline::IsInFlight(const std::string& asset_pair) const {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  return in_flight_.count(asset_pair) > 0;
}

}  // namespace feedback_engine
