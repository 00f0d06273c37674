#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "backtest/learning_validation.h"
#include "backtest/monte_carlo.h"
#include "backtest/performance_metrics.h"
#include "backtest/replay_engine.h"
#include "backtest/walk_forward.h"
#include "cache/decision_cache.h"
#include "core/config.h"
#include "core/errors.h"
#include "ensemble/weight_optimizer.h"
#include "memory/portfolio_memory.h"
#include "provider/provider_pool.h"

namespace {

// 覆盖回放链路：撮合模型/止损/确定性/缓存/walk-forward/Monte Carlo。
bool NearlyEqual(double lhs, double rhs, double eps = 1e-6) {
  return std::fabs(lhs - rhs) < eps;
}

// 2024-01-03（周三）00:00 UTC。
constexpr std::int64_t kStartTs = 1704240000;
constexpr std::int64_t kBarSeconds = 3600;

feedback_engine::MarketSnapshot Bar(int index, double open, double high,
                                    double low, double close) {
  feedback_engine::MarketSnapshot bar;
  bar.asset_pair = "BTCUSD";
  bar.asset_type = feedback_engine::AssetType::kCrypto;
  bar.timeframe = "1h";
  bar.timestamp = kStartTs + index * kBarSeconds;
  bar.open = open;
  bar.high = high;
  bar.low = low;
  bar.close = close;
  bar.volume = 100.0;
  return bar;
}

// 平盘序列：价格恒为 100，止损永不触发。
std::vector<feedback_engine::MarketSnapshot> FlatSeries(int count) {
  std::vector<feedback_engine::MarketSnapshot> series;
  for (int i = 0; i < count; ++i) {
    series.push_back(Bar(i, 100.0, 100.5, 99.5, 100.0));
  }
  return series;
}

// 正弦走势序列，用于多 provider 分歧场景。
std::vector<feedback_engine::MarketSnapshot> WaveSeries(int count) {
  std::vector<feedback_engine::MarketSnapshot> series;
  double previous = 100.0;
  for (int i = 0; i < count; ++i) {
    const double close = 100.0 + 4.0 * std::sin(i / 4.0) + 0.05 * i;
    const double high = std::max(previous, close) * 1.002;
    const double low = std::min(previous, close) * 0.998;
    series.push_back(Bar(i, previous, high, low, close));
    previous = close;
  }
  return series;
}

// 每两根 bar 交替给出 BUY/SELL：B B S S B B S S ...
class ScheduledProvider : public feedback_engine::DecisionProvider {
 public:
  ScheduledProvider(std::string id, double confidence)
      : id_(std::move(id)), confidence_(confidence) {}

  std::string id() const override { return id_; }

  std::optional<feedback_engine::ProviderVote> Vote(
      const feedback_engine::MarketSnapshot& snapshot) override {
    const std::int64_t index = (snapshot.timestamp - kStartTs) / kBarSeconds;
    feedback_engine::ProviderVote vote;
    vote.action = index % 4 < 2 ? feedback_engine::Action::kBuy
                                : feedback_engine::Action::kSell;
    vote.confidence = confidence_;
    return vote;
  }

 private:
  std::string id_;
  double confidence_;
};

class ConstantProvider : public feedback_engine::DecisionProvider {
 public:
  ConstantProvider(std::string id, feedback_engine::Action action, double confidence)
      : id_(std::move(id)), action_(action), confidence_(confidence) {}

  std::string id() const override { return id_; }

  std::optional<feedback_engine::ProviderVote> Vote(
      const feedback_engine::MarketSnapshot&) override {
    feedback_engine::ProviderVote vote;
    vote.action = action_;
    vote.confidence = confidence_;
    return vote;
  }

 private:
  std::string id_;
  feedback_engine::Action action_;
  double confidence_;
};

// 收阳给 BUY，收阴给 SELL；contrarian 时反向。带调用计数。
class MomentumProvider : public feedback_engine::DecisionProvider {
 public:
  MomentumProvider(std::string id, double confidence, bool contrarian)
      : id_(std::move(id)), confidence_(confidence), contrarian_(contrarian) {}

  std::string id() const override { return id_; }

  std::optional<feedback_engine::ProviderVote> Vote(
      const feedback_engine::MarketSnapshot& snapshot) override {
    calls_.fetch_add(1);
    const bool rising = snapshot.close >= snapshot.open;
    feedback_engine::ProviderVote vote;
    vote.action = rising != contrarian_ ? feedback_engine::Action::kBuy
                                        : feedback_engine::Action::kSell;
    vote.confidence = confidence_;
    return vote;
  }

  int calls() const { return calls_.load(); }

 private:
  std::string id_;
  double confidence_;
  bool contrarian_;
  std::atomic<int> calls_{0};
};

class SilentProvider : public feedback_engine::DecisionProvider {
 public:
  std::string id() const override { return "silent"; }
  std::optional<feedback_engine::ProviderVote> Vote(
      const feedback_engine::MarketSnapshot&) override {
    return std::nullopt;
  }
};

feedback_engine::EngineConfig SingleProviderConfig() {
  feedback_engine::EngineConfig config;
  config.ensemble.providers = {"a"};
  config.ensemble.adaptive_weights = false;
  config.provider_pool.max_threads = 2;
  config.regime.enabled = false;
  return config;
}

feedback_engine::EngineConfig EnsembleConfig() {
  feedback_engine::EngineConfig config;
  config.ensemble.providers = {"trend", "contra", "idle"};
  config.ensemble.adaptive_weights = true;
  config.weights.seed = 42;
  config.provider_pool.max_threads = 3;
  return config;
}

struct EnsembleProviders {
  std::shared_ptr<MomentumProvider> trend;
  std::vector<std::shared_ptr<feedback_engine::DecisionProvider>> all;
};

EnsembleProviders MakeEnsembleProviders() {
  EnsembleProviders providers;
  providers.trend = std::make_shared<MomentumProvider>("trend", 72.0, false);
  providers.all = {providers.trend,
                   std::make_shared<MomentumProvider>("contra", 58.0, true),
                   std::make_shared<ConstantProvider>(
                       "idle", feedback_engine::Action::kHold, 40.0)};
  return providers;
}

}  // namespace

int main() {
  {
    // 撮合模型：滑点与手续费、持仓翻转规则、回放结束强制平仓。
    const auto config = SingleProviderConfig();
    feedback_engine::ProviderPool pool(
        {std::make_shared<ScheduledProvider>("a", 80.0)}, config.provider_pool);
    feedback_engine::PortfolioMemory memory;
    feedback_engine::BacktestReplayEngine engine(config, &pool, nullptr, nullptr,
                                                 &memory);
    feedback_engine::BacktestResult result;
    std::string error;
    if (!engine.Run(FlatSeries(8), feedback_engine::ReplayOptions{}, &result, &error)) {
      std::cerr << "回放失败: " << error << "\n";
      return 1;
    }
    if (result.trades.size() != 4 || memory.size() != 4) {
      std::cerr << "预期 4 笔交易（含结束强平），实际 " << result.trades.size()
                << "\n";
      return 1;
    }
    const auto& first = result.trades.front();
    // 10000 * 1% / (100 * 2%) = 50，置信度 80 -> 40 单位。
    if (first.position_type != feedback_engine::PositionType::kLong ||
        !NearlyEqual(first.size, 40.0) ||
        !NearlyEqual(first.entry_price, 100.01) ||
        !NearlyEqual(first.exit_price, 99.99) ||
        !NearlyEqual(first.fees, 8.0) ||
        !NearlyEqual(first.realized_pnl, -8.8) || first.was_profitable) {
      std::cerr << "首笔交易撮合结果不符合预期，pnl=" << first.realized_pnl << "\n";
      return 1;
    }
    if (first.exit_timestamp - first.entry_timestamp != 2 * kBarSeconds ||
        !NearlyEqual(first.holding_hours, 2.0) ||
        first.contributing_providers != std::vector<std::string>{"a"} ||
        first.asset_pair != "BTCUSD") {
      std::cerr << "首笔交易元数据不符合预期\n";
      return 1;
    }
    if (result.trades[1].position_type != feedback_engine::PositionType::kShort ||
        result.trades.back().exit_timestamp != kStartTs + 7 * kBarSeconds) {
      std::cerr << "预期第二笔为空头且末笔在最后一根 bar 强平\n";
      return 1;
    }
    if (result.equity_curve.size() != 9 ||
        !NearlyEqual(result.equity_curve.front(), 10000.0) ||
        result.metrics.total_trades != 4 || result.metrics.winning_trades != 0 ||
        result.metrics.final_balance >= 10000.0 ||
        !NearlyEqual(result.metrics.final_balance, result.equity_curve.back())) {
      std::cerr << "权益曲线或指标不符合预期\n";
      return 1;
    }
    double fees = 0.0;
    for (const auto& trade : result.trades) {
      fees += trade.fees;
    }
    if (!NearlyEqual(result.metrics.total_fees, fees) ||
        !NearlyEqual(result.metrics.final_balance,
                     10000.0 + [&result]() {
                       double pnl = 0.0;
                       for (const auto& trade : result.trades) {
                         pnl += trade.realized_pnl;
                       }
                       return pnl;
                     }())) {
      std::cerr << "预期期末权益等于初始资金加已实现盈亏\n";
      return 1;
    }
    if (result.decisions.size() != 8 || result.decisions[1].execution.has_value() ||
        !result.decisions[1].verdict->allow) {
      std::cerr << "预期已有同向持仓时不重复开仓，也不记执行\n";
      return 1;
    }
    // 同向信号释放在途状态：后续 bar 不会被 in_flight 拒绝。
    if (result.metrics.denied_decisions != 0 ||
        result.decisions[2].verdict->triggered_rule == "in_flight") {
      std::cerr << "预期维持持仓的信号不阻塞后续决策\n";
      return 1;
    }
  }

  {
    // 同一份记忆与权重上连续回放：每笔平仓都写入记忆并参与学习。
    auto config = SingleProviderConfig();
    config.ensemble.adaptive_weights = true;
    feedback_engine::ProviderPool pool(
        {std::make_shared<ScheduledProvider>("a", 80.0)}, config.provider_pool);
    feedback_engine::WeightOptimizer optimizer(config.ensemble.providers,
                                               config.weights);
    feedback_engine::PortfolioMemory memory;
    feedback_engine::BacktestReplayEngine engine(config, &pool, &optimizer, nullptr,
                                                 &memory);
    std::vector<std::string> trade_ids;
    for (int run = 0; run < 2; ++run) {
      feedback_engine::BacktestResult result;
      std::string error;
      if (!engine.Run(FlatSeries(8), feedback_engine::ReplayOptions{}, &result,
                      &error)) {
        std::cerr << "第 " << run + 1 << " 次回放失败: " << error << "\n";
        return 1;
      }
      for (const auto& trade : result.trades) {
        trade_ids.push_back(trade.trade_id);
      }
    }
    const auto state = optimizer.ExportState().providers.at("a");
    if (memory.size() != 8 || trade_ids.size() != 8 ||
        state.wins + state.losses != 8) {
      std::cerr << "预期两次回放共 8 笔交易全部写入记忆并学习，实际记忆 "
                << memory.size() << " 笔，学习 " << state.wins + state.losses
                << " 次\n";
      return 1;
    }
    std::sort(trade_ids.begin(), trade_ids.end());
    if (std::adjacent_find(trade_ids.begin(), trade_ids.end()) != trade_ids.end()) {
      std::cerr << "预期多次回放的 trade_id 互不相同\n";
      return 1;
    }

    // 记忆只读时无法写入结果，回放失败且不学习。
    memory.SetReadonly(true);
    feedback_engine::BacktestResult blocked;
    std::string error;
    bool failed = false;
    try {
      failed = !engine.Run(FlatSeries(8), feedback_engine::ReplayOptions{}, &blocked,
                           &error);
    } catch (const feedback_engine::ReadOnlyViolationError&) {
      failed = true;
    }
    memory.SetReadonly(false);
    const auto after = optimizer.ExportState().providers.at("a");
    if (!failed || after.wins + after.losses != 8) {
      std::cerr << "预期记忆写入失败时回放失败且权重不变\n";
      return 1;
    }
  }

  {
    // 禁止做空：SELL 只平多，不开空。
    auto config = SingleProviderConfig();
    config.backtest.allow_short = false;
    feedback_engine::ProviderPool pool(
        {std::make_shared<ScheduledProvider>("a", 80.0)}, config.provider_pool);
    feedback_engine::PortfolioMemory memory;
    feedback_engine::BacktestReplayEngine engine(config, &pool, nullptr, nullptr,
                                                 &memory);
    feedback_engine::BacktestResult result;
    std::string error;
    if (!engine.Run(FlatSeries(8), feedback_engine::ReplayOptions{}, &result, &error)) {
      std::cerr << "回放失败: " << error << "\n";
      return 1;
    }
    if (result.trades.size() != 2) {
      std::cerr << "预期禁止做空时只有 2 笔多头交易\n";
      return 1;
    }
    for (const auto& trade : result.trades) {
      if (trade.position_type != feedback_engine::PositionType::kLong) {
        std::cerr << "预期禁止做空时不出现空头\n";
        return 1;
      }
    }
  }

  {
    // 止损：bar 最低价触及止损即按止损价平仓。
    const auto config = SingleProviderConfig();
    feedback_engine::ProviderPool pool(
        {std::make_shared<ConstantProvider>("a", feedback_engine::Action::kBuy, 80.0)},
        config.provider_pool);
    feedback_engine::PortfolioMemory memory;
    feedback_engine::BacktestReplayEngine engine(config, &pool, nullptr, nullptr,
                                                 &memory);
    const std::vector<feedback_engine::MarketSnapshot> series = {
        Bar(0, 100.0, 100.5, 99.5, 100.0),
        Bar(1, 99.5, 100.0, 97.0, 99.0),
        Bar(2, 99.0, 99.5, 98.8, 99.2)};
    feedback_engine::BacktestResult result;
    std::string error;
    if (!engine.Run(series, feedback_engine::ReplayOptions{}, &result, &error)) {
      std::cerr << "回放失败: " << error << "\n";
      return 1;
    }
    if (result.trades.size() != 2) {
      std::cerr << "预期止损平仓后重新开仓，共 2 笔交易\n";
      return 1;
    }
    const auto& stopped = result.trades.front();
    if (stopped.exit_timestamp != kStartTs + kBarSeconds ||
        !NearlyEqual(stopped.exit_price, 98.0 * (1.0 - 0.0001)) ||
        stopped.was_profitable) {
      std::cerr << "预期按 98 止损价平仓，实际 " << stopped.exit_price << "\n";
      return 1;
    }
  }

  {
    // 确定性：相同输入、种子与初始状态，逐位一致。
    std::vector<feedback_engine::BacktestResult> runs;
    for (int run = 0; run < 2; ++run) {
      const auto config = EnsembleConfig();
      auto providers = MakeEnsembleProviders();
      feedback_engine::ProviderPool pool(providers.all, config.provider_pool);
      feedback_engine::WeightOptimizer optimizer(config.ensemble.providers,
                                                 config.weights);
      feedback_engine::PortfolioMemory memory;
      feedback_engine::BacktestReplayEngine engine(config, &pool, &optimizer,
                                                   nullptr, &memory);
      feedback_engine::BacktestResult result;
      std::string error;
      if (!engine.Run(WaveSeries(120), feedback_engine::ReplayOptions{}, &result,
                      &error)) {
        std::cerr << "回放失败: " << error << "\n";
        return 1;
      }
      if (memory.size() != result.trades.size()) {
        std::cerr << "预期每笔平仓都写入记忆\n";
        return 1;
      }
      runs.push_back(std::move(result));
    }
    if (runs[0].trades.empty()) {
      std::cerr << "预期多 provider 回放产生交易\n";
      return 1;
    }
    if (runs[0].equity_curve != runs[1].equity_curve ||
        runs[0].trades != runs[1].trades) {
      std::cerr << "预期两次回放结果逐位一致\n";
      return 1;
    }
    for (const auto& decision : runs[0].decisions) {
      if (decision.confidence < 0.0 || decision.confidence > 100.0) {
        std::cerr << "决策置信度越界\n";
        return 1;
      }
    }
  }

  {
    // 缓存：重复回放全部命中，不再调用 provider，结果一致。
    const auto config = EnsembleConfig();
    auto providers = MakeEnsembleProviders();
    feedback_engine::ProviderPool pool(providers.all, config.provider_pool);
    feedback_engine::DecisionCache cache;
    const auto series = WaveSeries(60);
    std::vector<feedback_engine::BacktestResult> runs;
    std::vector<int> calls;
    for (int run = 0; run < 2; ++run) {
      feedback_engine::WeightOptimizer optimizer(config.ensemble.providers,
                                                 config.weights);
      feedback_engine::PortfolioMemory memory;
      feedback_engine::BacktestReplayEngine engine(config, &pool, &optimizer,
                                                   &cache, &memory);
      feedback_engine::BacktestResult result;
      std::string error;
      if (!engine.Run(series, feedback_engine::ReplayOptions{}, &result, &error)) {
        std::cerr << "回放失败: " << error << "\n";
        return 1;
      }
      runs.push_back(std::move(result));
      calls.push_back(providers.trend->calls());
    }
    if (runs[0].metrics.cache_misses != 60 || runs[0].metrics.cache_hits != 0 ||
        runs[1].metrics.cache_hits != 60 || runs[1].metrics.cache_misses != 0) {
      std::cerr << "缓存命中统计不符合预期\n";
      return 1;
    }
    if (calls[0] != 60 || calls[1] != 60) {
      std::cerr << "预期缓存命中时跳过 provider 调用\n";
      return 1;
    }
    if (runs[0].equity_curve != runs[1].equity_curve) {
      std::cerr << "预期缓存回放与首次回放一致\n";
      return 1;
    }
    if (!runs[1].decisions.front().from_cache || runs[0].decisions.front().from_cache) {
      std::cerr << "预期决策标记缓存来源\n";
      return 1;
    }
  }

  {
    // 只读记忆：冻结学习时放行，学习时抛出。
    const auto config = SingleProviderConfig();
    feedback_engine::ProviderPool pool(
        {std::make_shared<ScheduledProvider>("a", 80.0)}, config.provider_pool);
    feedback_engine::PortfolioMemory memory;
    memory.SetReadonly(true);
    feedback_engine::BacktestReplayEngine engine(config, &pool, nullptr, nullptr,
                                                 &memory);
    feedback_engine::ReplayOptions frozen;
    frozen.learn = false;
    feedback_engine::BacktestResult result;
    std::string error;
    if (!engine.Run(FlatSeries(8), frozen, &result, &error) ||
        result.trades.size() != 4 || memory.size() != 0) {
      std::cerr << "预期冻结学习回放不写入记忆\n";
      return 1;
    }
    bool thrown = false;
    try {
      engine.Run(FlatSeries(8), feedback_engine::ReplayOptions{}, &result, &error);
    } catch (const feedback_engine::ReadOnlyViolationError&) {
      thrown = true;
    }
    if (!thrown) {
      std::cerr << "预期只读记忆上学习时抛出 ReadOnlyViolationError\n";
      return 1;
    }
  }

  {
    // 取消与异常传播。
    const auto config = SingleProviderConfig();
    feedback_engine::ProviderPool pool(
        {std::make_shared<ScheduledProvider>("a", 80.0)}, config.provider_pool);
    feedback_engine::PortfolioMemory memory;
    feedback_engine::BacktestReplayEngine engine(config, &pool, nullptr, nullptr,
                                                 &memory);
    std::atomic<bool> cancel{true};
    feedback_engine::ReplayOptions options;
    options.cancel = &cancel;
    feedback_engine::BacktestResult result;
    std::string error;
    if (!engine.Run(FlatSeries(8), options, &result, &error) || !result.cancelled ||
        !result.decisions.empty() || result.equity_curve.size() != 1) {
      std::cerr << "预期取消后不处理任何 bar\n";
      return 1;
    }

    auto unordered = FlatSeries(3);
    std::swap(unordered[0], unordered[1]);
    if (engine.Run(unordered, feedback_engine::ReplayOptions{}, &result, &error)) {
      std::cerr << "预期乱序序列被拒绝\n";
      return 1;
    }

    feedback_engine::ProviderPool silent({std::make_shared<SilentProvider>()},
                                         config.provider_pool);
    feedback_engine::BacktestReplayEngine broken(config, &silent, nullptr, nullptr,
                                                 &memory);
    bool thrown = false;
    try {
      broken.Run(FlatSeries(3), feedback_engine::ReplayOptions{}, &result, &error);
    } catch (const feedback_engine::InsufficientProvidersError&) {
      thrown = true;
    }
    if (!thrown) {
      std::cerr << "预期无有效投票时异常传播出回放\n";
      return 1;
    }
  }

  {
    // 指标工具。
    if (!NearlyEqual(feedback_engine::MaxDrawdown({100.0, 120.0, 90.0, 130.0}), 0.25)) {
      std::cerr << "最大回撤计算不符合预期\n";
      return 1;
    }
    if (!NearlyEqual(feedback_engine::SharpeFromEquity({100.0, 100.0, 100.0}, 252.0),
                     0.0)) {
      std::cerr << "预期零波动 Sharpe 为 0\n";
      return 1;
    }
    if (feedback_engine::SharpeFromEquity({100.0, 101.0, 101.5, 103.0}, 252.0) <= 0.0) {
      std::cerr << "预期上涨曲线 Sharpe 为正\n";
      return 1;
    }
  }

  {
    // Walk-forward 切分与过拟合分级。
    feedback_engine::WalkForwardConfig config;
    config.train_ratio = 0.7;
    config.window_bars = 10;
    feedback_engine::WalkForwardSplitter splitter(config);
    std::vector<feedback_engine::WindowRange> windows;
    std::string error;
    if (!splitter.Split(20, &windows, &error) || windows.size() != 4) {
      std::cerr << "预期 20 根 bar 切出 4 个窗口: " << error << "\n";
      return 1;
    }
    if (windows[1].train_begin != 3 || windows[1].test_begin != 10 ||
        windows[1].test_end != 13) {
      std::cerr << "窗口边界不符合预期\n";
      return 1;
    }
    if (splitter.Split(5, &windows, &error)) {
      std::cerr << "预期数据不足时切分失败\n";
      return 1;
    }

    using feedback_engine::ClassifyRatio;
    using feedback_engine::OverfittingSeverity;
    using feedback_engine::PerformanceRatio;
    if (ClassifyRatio(PerformanceRatio(2.0, 1.8)) != OverfittingSeverity::kNone ||
        ClassifyRatio(PerformanceRatio(2.0, 1.2)) != OverfittingSeverity::kLow ||
        ClassifyRatio(PerformanceRatio(2.0, 0.8)) != OverfittingSeverity::kMedium ||
        ClassifyRatio(PerformanceRatio(2.0, 0.2)) != OverfittingSeverity::kHigh) {
      std::cerr << "过拟合分级阈值不符合预期\n";
      return 1;
    }
    if (!NearlyEqual(PerformanceRatio(-1.0, -2.0), 0.5) ||
        !NearlyEqual(PerformanceRatio(-1.0, 0.5), 1.0) ||
        !NearlyEqual(PerformanceRatio(0.0, 1.0), 0.0)) {
      std::cerr << "比值边界规则不符合预期\n";
      return 1;
    }
    if (feedback_engine::RecommendationsFor(OverfittingSeverity::kHigh).empty()) {
      std::cerr << "预期 HIGH 给出建议\n";
      return 1;
    }
  }

  {
    // Walk-forward：窗口间无泄漏，记忆与权重在每个窗口后恢复。
    auto config = SingleProviderConfig();
    config.ensemble.adaptive_weights = true;
    config.walk_forward.train_ratio = 0.5;
    config.walk_forward.window_bars = 20;
    feedback_engine::ProviderPool pool(
        {std::make_shared<ScheduledProvider>("a", 80.0)}, config.provider_pool);
    feedback_engine::WeightOptimizer optimizer(config.ensemble.providers,
                                               config.weights);
    feedback_engine::PortfolioMemory memory;
    feedback_engine::TradeOutcome prior;
    prior.trade_id = "prior";
    prior.asset_pair = "BTCUSD";
    prior.size = 1.0;
    prior.realized_pnl = 3.0;
    prior.was_profitable = true;
    std::string error;
    if (!memory.RecordTradeOutcome(prior, &error)) {
      std::cerr << "预置交易失败: " << error << "\n";
      return 1;
    }
    const auto memory_before = memory.Snapshot();
    const auto weights_before = optimizer.ExpectedWeights();

    feedback_engine::BacktestReplayEngine engine(config, &pool, &optimizer, nullptr,
                                                 &memory);
    feedback_engine::WalkForwardSplitter splitter(config.walk_forward);
    feedback_engine::WalkForwardReport report;
    if (!splitter.Run(FlatSeries(40), &engine, &memory, &optimizer, nullptr, &report,
                      &error)) {
      std::cerr << "walk-forward 失败: " << error << "\n";
      return 1;
    }
    if (report.windows.size() != 3 || report.cancelled ||
        report.recommendations.empty()) {
      std::cerr << "预期 3 个窗口且给出建议\n";
      return 1;
    }
    for (const auto& window : report.windows) {
      if (window.train.total_trades == 0 || window.test.total_trades == 0) {
        std::cerr << "预期训练段与测试段都产生交易\n";
        return 1;
      }
    }
    if (!(memory.Snapshot() == memory_before) || memory.readonly()) {
      std::cerr << "预期 walk-forward 后记忆恢复且可写\n";
      return 1;
    }
    if (optimizer.ExpectedWeights() != weights_before) {
      std::cerr << "预期 walk-forward 后权重状态恢复\n";
      return 1;
    }

    std::atomic<bool> cancel{true};
    feedback_engine::WalkForwardReport cancelled;
    if (!splitter.Run(FlatSeries(40), &engine, &memory, &optimizer, &cancel,
                      &cancelled, &error) ||
        !cancelled.cancelled || !cancelled.windows.empty()) {
      std::cerr << "预期取消在窗口边界生效\n";
      return 1;
    }
  }

  {
    // Monte Carlo 工具函数。
    if (!NearlyEqual(feedback_engine::MonteCarloSimulator::Percentile(
                         {1.0, 2.0, 3.0, 4.0, 5.0}, 0.5),
                     3.0) ||
        !NearlyEqual(feedback_engine::MonteCarloSimulator::Percentile(
                         {1.0, 2.0, 3.0, 4.0, 5.0}, 0.05),
                     1.2)) {
      std::cerr << "分位数插值不符合预期\n";
      return 1;
    }
    const auto series = WaveSeries(20);
    const auto same = feedback_engine::MonteCarloSimulator::PerturbSeries(series, 0.0, 1);
    const auto a = feedback_engine::MonteCarloSimulator::PerturbSeries(series, 0.01, 5);
    const auto b = feedback_engine::MonteCarloSimulator::PerturbSeries(series, 0.01, 5);
    const auto c = feedback_engine::MonteCarloSimulator::PerturbSeries(series, 0.01, 6);
    if (same.size() != series.size() || same[3].close != series[3].close) {
      std::cerr << "预期零噪声不改变价格\n";
      return 1;
    }
    if (a[3].close != b[3].close || a[3].close == c[3].close) {
      std::cerr << "预期同种子扰动一致、不同种子不同\n";
      return 1;
    }
    if (a[3].high < a[3].low || !NearlyEqual(a[3].high / a[3].close,
                                             series[3].high / series[3].close)) {
      std::cerr << "预期同一 bar 的 OHLC 共用一个扰动因子\n";
      return 1;
    }
  }

  {
    // Monte Carlo：噪声为 0 时 1000 条路径结果完全一致，且等于直接回放。
    auto config = EnsembleConfig();
    config.monte_carlo.num_simulations = 1000;
    config.monte_carlo.price_noise_std = 0.0;
    config.monte_carlo.max_threads = 4;
    auto providers = MakeEnsembleProviders();
    feedback_engine::ProviderPool pool(providers.all, config.provider_pool);
    const auto series = WaveSeries(30);

    feedback_engine::WeightOptimizer base_optimizer(config.ensemble.providers,
                                                    config.weights);
    feedback_engine::PortfolioMemory base_memory;
    feedback_engine::MonteCarloSimulator simulator(config, &pool);
    feedback_engine::MonteCarloReport report;
    std::string error;
    if (!simulator.Run(series, base_memory, &base_optimizer, nullptr, &report,
                       &error)) {
      std::cerr << "Monte Carlo 失败: " << error << "\n";
      return 1;
    }
    if (report.completed_paths != 1000 || report.final_balances.size() != 1000) {
      std::cerr << "预期完成 1000 条路径\n";
      return 1;
    }
    for (const double value : report.final_balances) {
      if (value != report.final_balances.front()) {
        std::cerr << "预期零噪声时每条路径结果一致\n";
        return 1;
      }
    }
    if (report.p5 != report.p95 || !NearlyEqual(report.std_final, 0.0) ||
        !NearlyEqual(report.value_at_risk,
                     config.backtest.initial_balance - report.p50)) {
      std::cerr << "零噪声分位数/VaR 不符合预期\n";
      return 1;
    }
    if (base_memory.size() != 0) {
      std::cerr << "预期路径不修改基准记忆\n";
      return 1;
    }

    feedback_engine::WeightOptimizer replay_optimizer(config.ensemble.providers,
                                                      config.weights);
    feedback_engine::PortfolioMemory replay_memory;
    feedback_engine::BacktestReplayEngine engine(config, &pool, &replay_optimizer,
                                                 nullptr, &replay_memory);
    feedback_engine::BacktestResult replay;
    if (!engine.Run(series, feedback_engine::ReplayOptions{}, &replay, &error)) {
      std::cerr << "回放失败: " << error << "\n";
      return 1;
    }
    if (replay.metrics.final_balance != report.p50) {
      std::cerr << "预期零噪声路径与直接回放一致\n";
      return 1;
    }
  }

  {
    // Monte Carlo：有噪声时分位数有序；取消时不执行路径。
    auto config = EnsembleConfig();
    config.monte_carlo.num_simulations = 50;
    config.monte_carlo.price_noise_std = 0.01;
    auto providers = MakeEnsembleProviders();
    feedback_engine::ProviderPool pool(providers.all, config.provider_pool);
    feedback_engine::WeightOptimizer base_optimizer(config.ensemble.providers,
                                                    config.weights);
    feedback_engine::PortfolioMemory base_memory;
    feedback_engine::MonteCarloSimulator simulator(config, &pool);
    feedback_engine::MonteCarloReport report;
    std::string error;
    if (!simulator.Run(WaveSeries(30), base_memory, &base_optimizer, nullptr,
                       &report, &error)) {
      std::cerr << "Monte Carlo 失败: " << error << "\n";
      return 1;
    }
    if (report.completed_paths != 50 || report.p5 > report.p25 ||
        report.p25 > report.p50 || report.p50 > report.p75 ||
        report.p75 > report.p95 || report.worst_final > report.p5 ||
        report.best_final < report.p95) {
      std::cerr << "分位数顺序不符合预期\n";
      return 1;
    }

    std::atomic<bool> cancel{true};
    feedback_engine::MonteCarloReport cancelled;
    if (!simulator.Run(WaveSeries(30), base_memory, &base_optimizer, &cancel,
                       &cancelled, &error) ||
        !cancelled.cancelled || cancelled.completed_paths != 0) {
      std::cerr << "预期取消后不执行任何路径\n";
      return 1;
    }
  }

  {
    // 学习效果评估：前 60 笔由 a 给出且全亏，后 60 笔由 b 给出且全赚。
    feedback_engine::PortfolioMemory memory;
    std::string error;
    for (int i = 0; i < 120; ++i) {
      feedback_engine::TradeOutcome outcome;
      outcome.trade_id = "lv-" + std::to_string(i);
      outcome.asset_pair = "BTCUSD";
      outcome.size = 1.0;
      outcome.realized_pnl = i < 60 ? -5.0 : 10.0;
      outcome.was_profitable = i >= 60;
      outcome.contributing_providers = {i < 60 ? "a" : "b"};
      if (!memory.RecordTradeOutcome(outcome, &error)) {
        std::cerr << "写入交易失败: " << error << "\n";
        return 1;
      }
    }
    feedback_engine::LearningValidationReport report;
    if (!feedback_engine::ComputeLearningValidation(memory, "", &report, &error)) {
      std::cerr << "学习效果评估失败: " << error << "\n";
      return 1;
    }
    if (report.asset_pair != "ALL" || report.total_trades != 120) {
      std::cerr << "预期未过滤时覆盖全部 120 笔\n";
      return 1;
    }
    // 滚动 20 笔窗口在第 72 笔首次达到 60% 胜率。
    const auto& efficiency = report.sample_efficiency;
    if (efficiency.trades_to_threshold != 72 ||
        !NearlyEqual(efficiency.learning_speed_per_100_trades, 1.0 / 1.2)) {
      std::cerr << "样本效率不符合预期\n";
      return 1;
    }
    const auto& regret = report.cumulative_regret;
    if (regret.optimal_provider != "b" || !NearlyEqual(regret.optimal_avg_pnl, 10.0) ||
        !NearlyEqual(regret.total_regret, 900.0) ||
        !NearlyEqual(regret.avg_regret_per_trade, 7.5)) {
      std::cerr << "累计遗憾不符合预期，total=" << regret.total_regret << "\n";
      return 1;
    }
    const auto& drift = report.concept_drift;
    const std::vector<double> expected_rates = {0.0, 0.0, 0.5, 1.0, 1.0};
    if (!drift.sufficient_data || drift.window_win_rates != expected_rates ||
        !NearlyEqual(drift.drift_score, std::sqrt(0.2)) || drift.severity != "HIGH") {
      std::cerr << "漂移检测不符合预期，score=" << drift.drift_score << "\n";
      return 1;
    }
    const auto& thompson = report.thompson;
    if (!NearlyEqual(thompson.exploration_rate, 0.5) ||
        thompson.dominant_provider != "a" ||
        !NearlyEqual(thompson.exploitation_convergence, 0.0) ||
        thompson.provider_distribution.at("b") != 60) {
      std::cerr << "探索/利用诊断不符合预期\n";
      return 1;
    }
    const auto& curve = report.learning_curve;
    if (!curve.sufficient_data || !NearlyEqual(curve.first_win_rate, 0.0) ||
        !NearlyEqual(curve.last_win_rate, 1.0) ||
        !NearlyEqual(curve.win_rate_improvement_pct, 0.0) ||
        !NearlyEqual(curve.pnl_improvement_pct, 300.0) || !curve.learning_detected) {
      std::cerr << "学习曲线不符合预期\n";
      return 1;
    }

    if (feedback_engine::ComputeLearningValidation(memory, "ETHUSD", &report, &error) ||
        error.find("ETHUSD") == std::string::npos) {
      std::cerr << "预期过滤后无交易时返回错误\n";
      return 1;
    }
    const auto recorded = memory.Snapshot().outcomes;
    const std::vector<feedback_engine::TradeOutcome> few(recorded.begin(),
                                                         recorded.begin() + 30);
    if (!feedback_engine::ComputeLearningValidation(few, "BTCUSD", &report, &error) ||
        report.asset_pair != "BTCUSD" || report.concept_drift.sufficient_data ||
        report.learning_curve.sufficient_data ||
        report.sample_efficiency.trades_to_threshold.has_value()) {
      std::cerr << "预期样本不足时跳过漂移与学习曲线\n";
      return 1;
    }
  }

  std::cout << "test_backtest_replay: all passed\n";
  return 0;
}
