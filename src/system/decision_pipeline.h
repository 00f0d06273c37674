#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cache/decision_cache.h"
#include "core/config.h"
#include "core/types.h"
#include "ensemble/ensemble_aggregator.h"
#include "ensemble/weight_optimizer.h"
#include "provider/provider_pool.h"
#include "risk/correlation_matrix.h"
#include "risk/exposure_reservation.h"
#include "risk/risk_gatekeeper.h"
#include "sizing/position_sizer.h"
#include "storage/journal_store.h"

namespace feedback_engine {

/// 决策时刻的组合视图（实盘来自执行层，回放由引擎维护）。
struct PortfolioView {
  std::optional<double> balance;       ///< 缺失时产生 signal-only 决策。
  double trailing_drawdown{0.0};
  std::vector<double> recent_returns;
  std::map<std::string, double> holdings;
  double committed_exposure{0.0};
  double current_position{0.0};        ///< 本资产带方向持仓数量。
};

/// 单次决策请求。
struct DecisionRequest {
  MarketSnapshot snapshot;
  MarketRegime regime{MarketRegime::kRanging};
  std::optional<std::int64_t> replay_timestamp;  ///< 有值即回放模式。
  std::int64_t live_now_ts{0};
  PortfolioView portfolio;
  const CorrelationMatrix* correlations{nullptr};
  bool use_cache{false};
};

/**
 * @brief 决策流水线编排器
 *
 * 责任边界：
 * 1. Cache -> ProviderPool -> EnsembleAggregator(+WeightOptimizer)
 *    -> PositionSizer -> RiskGatekeeper；
 * 2. 同一资产的决策串行执行；资产存在在途决策时新决策直接被拒绝；
 * 3. 执行回报驱动预占 Commit/Rollback 并释放在途状态；
 * 4. 平仓结果回灌 WeightOptimizer。
 *
 * 非职责：
 * - 不撮合、不维护持仓（由执行层或回放引擎负责）。
 *
 * 所有依赖均为外部注入，生命周期由调用方管理（不持有所有权）。
 */
class DecisionPipeline {
 public:
  DecisionPipeline(const EngineConfig& config,
                   ProviderPool* pool,
                   WeightOptimizer* optimizer,
                   DecisionCache* cache,
                   ExposureReservationManager* reservations,
                   const JournalStore* decision_log = nullptr);

  /**
   * @brief 产出一条最终决策
   *
   * 风控拒绝是正常结果（`out_decision->verdict->allow == false`），返回 true。
   * 定仓校验失败或决策日志写入失败时返回 false。
   *
   * @throws InsufficientProvidersError 所有 provider 均未给出有效投票
   */
  bool Decide(const DecisionRequest& request,
              Decision* out_decision,
              std::string* out_error);

  /// 执行回报：成功则 Commit 预占，失败则 Rollback；随后释放在途状态。
  bool CompleteExecution(const std::string& decision_id,
                         const ExecutionResult& result,
                         std::string* out_error);

  /// 放弃执行：回滚预占并释放在途状态。
  void ReleaseDecision(const std::string& decision_id);

  /// 把平仓结果记入投票支持该方向的 provider。
  bool LearnFromOutcome(const TradeOutcome& outcome, std::string* out_error);

  bool IsInFlight(const std::string& asset_pair) const;

  const EnsembleAggregator& aggregator() const { return aggregator_; }
  const RiskGatekeeper& gatekeeper() const { return gatekeeper_; }

 private:
  std::mutex& AssetMutex(const std::string& asset_pair);
  DecisionDraft BuildDraft(const DecisionRequest& request, bool* out_from_cache);
  std::string NextDecisionId(const MarketSnapshot& snapshot);
  /// 未配置决策日志时直接成功；写入失败记 ERROR 并返回 false。
  bool AppendToLog(const Decision& decision, std::string* out_error);

  EngineConfig config_;
  ProviderPool* pool_{nullptr};
  WeightOptimizer* optimizer_{nullptr};
  DecisionCache* cache_{nullptr};
  ExposureReservationManager* reservations_{nullptr};
  const JournalStore* decision_log_{nullptr};
  EnsembleAggregator aggregator_;
  PositionSizer sizer_;
  RiskGatekeeper gatekeeper_;

  std::mutex registry_mutex_;
  std::unordered_map<std::string, std::unique_ptr<std::mutex>> asset_mutexes_;
  mutable std::mutex in_flight_mutex_;
  std::unordered_map<std::string, std::string> in_flight_;  ///< asset -> decision_id
  std::mutex log_mutex_;  ///< 串行化决策日志追加。
  std::atomic<std::uint64_t> sequence_{0};
};

}  // namespace feedback_engine
