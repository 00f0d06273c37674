#include "memory/portfolio_memory.h"

#include <algorithm>
#include <cmath>

#include "core/errors.h"
#include "core/json_utils.h"
#include "core/log.h"
#include "storage/journal_store.h"
#include "storage/record_codec.h"

namespace feedback_engine {

namespace {

constexpr double kTradingDaysPerYear = 252.0;

bool Fail(const std::string& message, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

}  // namespace

void PortfolioMemory::Accumulate(const TradeOutcome& outcome,
                                 PortfolioMemorySnapshot* state) {
  state->outcomes.push_back(outcome);
  for (const auto& provider : outcome.contributing_providers) {
    PerformanceBucket& bucket = state->provider_performance[provider];
    ++bucket.trades;
    bucket.wins += outcome.was_profitable ? 1 : 0;
    bucket.total_pnl += outcome.realized_pnl;
  }
  PerformanceBucket& regime = state->regime_performance[ToString(outcome.regime)];
  ++regime.trades;
  regime.wins += outcome.was_profitable ? 1 : 0;
  regime.total_pnl += outcome.realized_pnl;
}

bool PortfolioMemory::Initialize(std::string* out_error) {
  if (state_path_.empty()) {
    return true;
  }
  std::string load_error;
  if (LoadFromFile(state_path_, &load_error)) {
    return true;
  }
  if (!allow_fresh_start_) {
    return Fail("组合记忆加载失败: " + load_error, out_error);
  }
  LogWarn("组合记忆文件损坏，按配置以空账本启动: " + load_error);
  Restore(PortfolioMemorySnapshot{});
  return true;
}

bool PortfolioMemory::RecordTradeOutcome(const TradeOutcome& outcome,
                                         std::string* out_error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (readonly_) {
      throw ReadOnlyViolationError(
          "portfolio memory is read-only; rejected trade " + outcome.trade_id);
    }
    if (outcome.trade_id.empty() || trade_ids_.count(outcome.trade_id) > 0) {
      return Fail("trade_id 为空或重复: " + outcome.trade_id, out_error);
    }
    if (!std::isfinite(outcome.realized_pnl) || !std::isfinite(outcome.size) ||
        outcome.size < 0.0) {
      return Fail("交易结果数值非法: " + outcome.trade_id, out_error);
    }
    trade_ids_.insert(outcome.trade_id);
    Accumulate(outcome, &state_);
  }
  if (state_path_.empty()) {
    return true;
  }
  return SaveToFile(state_path_, out_error);
}

PortfolioMemorySnapshot PortfolioMemory::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

void PortfolioMemory::Restore(const PortfolioMemorySnapshot& snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = snapshot;
  trade_ids_.clear();
  for (const auto& outcome : state_.outcomes) {
    trade_ids_.insert(outcome.trade_id);
  }
}

void PortfolioMemory::SetReadonly(bool readonly) {
  std::lock_guard<std::mutex> lock(mutex_);
  readonly_ = readonly;
}

bool PortfolioMemory::readonly() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return readonly_;
}

std::map<std::string, PerformanceBucket> PortfolioMemory::ProviderPerformance() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.provider_performance;
}

std::map<std::string, PerformanceBucket> PortfolioMemory::RegimePerformance() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.regime_performance;
}

std::size_t PortfolioMemory::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.outcomes.size();
}

std::vector<TradeOutcome> PortfolioMemory::RecentOutcomes(std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t count = std::min(limit, state_.outcomes.size());
  return std::vector<TradeOutcome>(state_.outcomes.end() - static_cast<long>(count),
                                   state_.outcomes.end());
}

std::vector<double> PortfolioMemory::EquityCurve(double initial_balance) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<double> curve;
  curve.reserve(state_.outcomes.size() + 1);
  double equity = initial_balance;
  curve.push_back(equity);
  for (const auto& outcome : state_.outcomes) {
    equity += outcome.realized_pnl;
    curve.push_back(equity);
  }
  return curve;
}

PerformanceReport PortfolioMemory::AnalyzePerformance() const {
  std::vector<TradeOutcome> outcomes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes = state_.outcomes;
  }
  PerformanceReport report;
  report.total_trades = static_cast<int>(outcomes.size());
  if (outcomes.empty()) {
    return report;
  }

  double gross_profit = 0.0;
  double gross_loss = 0.0;
  double cumulative = 0.0;
  double peak = 0.0;
  std::vector<double> returns;
  returns.reserve(outcomes.size());
  for (const auto& outcome : outcomes) {
    report.total_pnl += outcome.realized_pnl;
    if (outcome.realized_pnl > 0.0) {
      ++report.winning_trades;
      gross_profit += outcome.realized_pnl;
    } else if (outcome.realized_pnl < 0.0) {
      ++report.losing_trades;
      gross_loss += -outcome.realized_pnl;
    }
    cumulative += outcome.realized_pnl;
    peak = std::max(peak, cumulative);
    report.max_drawdown = std::max(report.max_drawdown, peak - cumulative);
    returns.push_back(outcome.pnl_pct);
  }
  report.win_rate =
      static_cast<double>(report.winning_trades) / report.total_trades;
  report.avg_win =
      report.winning_trades > 0 ? gross_profit / report.winning_trades : 0.0;
  report.avg_loss =
      report.losing_trades > 0 ? -gross_loss / report.losing_trades : 0.0;
  report.profit_factor = gross_loss > 0.0 ? gross_profit / gross_loss : 0.0;

  if (returns.size() >= 2) {
    const double n = static_cast<double>(returns.size());
    double mean = 0.0;
    for (const double r : returns) {
      mean += r;
    }
    mean /= n;
    double variance = 0.0;
    double downside = 0.0;
    int downside_count = 0;
    for (const double r : returns) {
      variance += (r - mean) * (r - mean);
      if (r < 0.0) {
        downside += r * r;
        ++downside_count;
      }
    }
    const double stddev = std::sqrt(variance / (n - 1.0));
    if (stddev > 0.0) {
      report.sharpe_ratio = mean / stddev * std::sqrt(kTradingDaysPerYear);
    }
    if (downside_count > 0) {
      const double downside_dev = std::sqrt(downside / downside_count);
      if (downside_dev > 0.0) {
        report.sortino_ratio = mean / downside_dev * std::sqrt(kTradingDaysPerYear);
      }
    }
  }
  return report;
}

bool PortfolioMemory::SaveToFile(const std::string& file_path,
                                 std::string* out_error) const {
  JsonValue root = MakeJsonObject();
  root.object_value["version"] = MakeJsonNumber(1);
  JsonValue outcomes = MakeJsonArray();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes.array_value.reserve(state_.outcomes.size());
    for (const auto& outcome : state_.outcomes) {
      outcomes.array_value.push_back(OutcomeToJson(outcome));
    }
  }
  root.object_value["outcomes"] = std::move(outcomes);
  std::string write_error;
  if (!WriteFileAtomically(file_path, SerializeJson(root), &write_error)) {
    LogError("组合记忆写盘失败: " + write_error);
    return Fail(write_error, out_error);
  }
  return true;
}

bool PortfolioMemory::LoadFromFile(const std::string& file_path,
                                   std::string* out_error) {
  std::string content;
  bool exists = false;
  if (!ReadWholeFile(file_path, &content, &exists, out_error)) {
    return false;
  }
  if (!exists) {
    return true;
  }
  JsonValue root;
  if (!ParseJson(content, &root, out_error)) {
    return false;
  }
  const JsonValue* outcomes = JsonObjectField(&root, "outcomes");
  if (outcomes == nullptr || outcomes->type != JsonType::kArray) {
    return Fail("组合记忆缺少 outcomes 数组", out_error);
  }
  PortfolioMemorySnapshot loaded;
  std::unordered_set<std::string> ids;
  for (const auto& item : outcomes->array_value) {
    TradeOutcome outcome;
    if (!OutcomeFromJson(item, &outcome, out_error)) {
      return false;
    }
    if (!ids.insert(outcome.trade_id).second) {
      return Fail("组合记忆存在重复 trade_id: " + outcome.trade_id, out_error);
    }
    Accumulate(outcome, &loaded);
  }
  Restore(loaded);
  return true;
}

}  // namespace feedback_engine
