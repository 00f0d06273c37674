#include "backtest/walk_forward.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>

#include "core/log.h"

namespace feedback_engine {

namespace {

int SeverityRank(OverfittingSeverity severity) {
  return static_cast<int>(severity);
}

OverfittingSeverity Worse(OverfittingSeverity lhs, OverfittingSeverity rhs) {
  return SeverityRank(lhs) >= SeverityRank(rhs) ? lhs : rhs;
}

std::vector<MarketSnapshot> Slice(const std::vector<MarketSnapshot>& series,
                                  std::size_t begin, std::size_t end) {
  return std::vector<MarketSnapshot>(
      series.begin() + static_cast<std::ptrdiff_t>(begin),
      series.begin() + static_cast<std::ptrdiff_t>(end));
}

// 窗口级学习状态守护：无论正常结束还是异常退出，都恢复记忆与权重。
class LearningStateGuard {
 public:
  LearningStateGuard(PortfolioMemory* memory, WeightOptimizer* optimizer)
      : memory_(memory),
        optimizer_(optimizer),
        memory_snapshot_(memory->Snapshot()) {
    if (optimizer_ != nullptr) {
      optimizer_state_ = optimizer_->ExportState();
    }
  }

  LearningStateGuard(const LearningStateGuard&) = delete;
  LearningStateGuard& operator=(const LearningStateGuard&) = delete;

  ~LearningStateGuard() {
    memory_->SetReadonly(false);
    memory_->Restore(memory_snapshot_);
    if (optimizer_ != nullptr && optimizer_state_.has_value()) {
      std::string error;
      if (!optimizer_->RestoreState(*optimizer_state_, &error)) {
        LogError("WALK_FORWARD_WEIGHT_RESTORE_FAILED: " + error);
      }
    }
  }

 private:
  PortfolioMemory* memory_;
  WeightOptimizer* optimizer_;
  PortfolioMemorySnapshot memory_snapshot_;
  std::optional<WeightOptimizerState> optimizer_state_;
};

}  // namespace

const char* ToString(OverfittingSeverity severity) {
  switch (severity) {
    case OverfittingSeverity::kNone:
      return "NONE";
    case OverfittingSeverity::kLow:
      return "LOW";
    case OverfittingSeverity::kMedium:
      return "MEDIUM";
    case OverfittingSeverity::kHigh:
      return "HIGH";
  }
  return "HIGH";
}

double PerformanceRatio(double train_value, double test_value) {
  if (train_value > 0.0) {
    return test_value / train_value;
  }
  if (train_value < 0.0) {
    if (test_value < 0.0) {
      return train_value / test_value;
    }
    return 1.0;
  }
  return 0.0;
}

OverfittingSeverity ClassifyRatio(double ratio) {
  if (ratio > 0.8) return OverfittingSeverity::kNone;
  if (ratio > 0.5) return OverfittingSeverity::kLow;
  if (ratio > 0.3) return OverfittingSeverity::kMedium;
  return OverfittingSeverity::kHigh;
}

std::vector<std::string> RecommendationsFor(OverfittingSeverity severity) {
  switch (severity) {
    case OverfittingSeverity::kNone:
      return {"out-of-sample performance is consistent with training"};
    case OverfittingSeverity::kLow:
      return {"minor degradation out of sample; monitor live performance"};
    case OverfittingSeverity::kMedium:
      return {"reduce model complexity or number of tuned parameters",
              "extend training windows before deploying"};
    case OverfittingSeverity::kHigh:
      return {"strategy is likely overfit; do not deploy",
              "re-validate provider weights on fresh data",
              "increase regularization and widen test coverage"};
  }
  return {};
}

bool WalkForwardSplitter::Split(std::size_t bar_count,
                                std::vector<WindowRange>* out_windows,
                                std::string* out_error) const {
  auto fail = [out_error](std::string message) {
    if (out_error != nullptr) {
      *out_error = std::move(message);
    }
    return false;
  };
  if (out_windows == nullptr) {
    return fail("out_windows 为空");
  }
  if (config_.train_ratio <= 0.0 || config_.train_ratio >= 1.0) {
    return fail("walk_forward.train_ratio 必须在 (0, 1) 内");
  }
  if (config_.window_bars <= 1) {
    return fail("walk_forward.window_bars 必须大于 1");
  }
  const std::size_t window = static_cast<std::size_t>(config_.window_bars);
  const std::size_t train = static_cast<std::size_t>(
      std::floor(static_cast<double>(window) * config_.train_ratio));
  const std::size_t test = window - train;
  if (train == 0 || test == 0) {
    return fail("walk_forward 窗口过小，训练段或测试段为空");
  }
  const std::size_t step =
      config_.step_bars > 0 ? static_cast<std::size_t>(config_.step_bars) : test;

  std::vector<WindowRange> windows;
  for (std::size_t start = 0; start + window <= bar_count; start += step) {
    WindowRange range;
    range.train_begin = start;
    range.train_end = start + train;
    range.test_begin = start + train;
    range.test_end = start + window;
    windows.push_back(range);
  }
  if (windows.empty()) {
    return fail("数据不足以构成一个窗口: bars=" + std::to_string(bar_count) +
                ", window_bars=" + std::to_string(window));
  }
  *out_windows = std::move(windows);
  return true;
}

bool WalkForwardSplitter::Run(const std::vector<MarketSnapshot>& series,
                              BacktestReplayEngine* engine,
                              PortfolioMemory* memory,
                              WeightOptimizer* optimizer,
                              const std::atomic<bool>* cancel,
                              WalkForwardReport* out_report,
                              std::string* out_error) const {
  if (engine == nullptr || memory == nullptr || out_report == nullptr) {
    if (out_error != nullptr) {
      *out_error = "engine/memory/out_report 为空";
    }
    return false;
  }
  std::vector<WindowRange> ranges;
  if (!Split(series.size(), &ranges, out_error)) {
    return false;
  }

  WalkForwardReport report;
  for (std::size_t i = 0; i < ranges.size(); ++i) {
    if (cancel != nullptr && cancel->load()) {
      report.cancelled = true;
      LogInfo("WALK_FORWARD_CANCELLED: completed_windows=" +
              std::to_string(report.windows.size()));
      break;
    }
    const WindowRange& range = ranges[i];
    WalkForwardWindow window;
    window.index = static_cast<int>(i);
    window.range = range;
    window.train_start_ts = series[range.train_begin].timestamp;
    window.test_end_ts = series[range.test_end - 1].timestamp;
    {
      LearningStateGuard guard(memory, optimizer);

      ReplayOptions train_options;
      train_options.learn = true;
      BacktestResult train_result;
      if (!engine->Run(Slice(series, range.train_begin, range.train_end),
                       train_options, &train_result, out_error)) {
        return false;
      }

      memory->SetReadonly(true);
      ReplayOptions test_options;
      test_options.learn = false;
      BacktestResult test_result;
      if (!engine->Run(Slice(series, range.test_begin, range.test_end),
                       test_options, &test_result, out_error)) {
        return false;
      }
      window.train = train_result.metrics;
      window.test = test_result.metrics;
    }

    window.sharpe_ratio_change =
        PerformanceRatio(window.train.sharpe_ratio, window.test.sharpe_ratio);
    window.win_rate_ratio_change =
        PerformanceRatio(window.train.win_rate, window.test.win_rate);
    window.severity = Worse(ClassifyRatio(window.sharpe_ratio_change),
                            ClassifyRatio(window.win_rate_ratio_change));
    LogInfo("WALK_FORWARD_WINDOW: index=" + std::to_string(window.index) +
            ", train_sharpe=" + std::to_string(window.train.sharpe_ratio) +
            ", test_sharpe=" + std::to_string(window.test.sharpe_ratio) +
            ", severity=" + ToString(window.severity));
    report.overall = Worse(report.overall, window.severity);
    report.windows.push_back(std::move(window));
  }

  if (!report.windows.empty()) {
    const double n = static_cast<double>(report.windows.size());
    for (const auto& window : report.windows) {
      report.avg_train_sharpe += window.train.sharpe_ratio / n;
      report.avg_test_sharpe += window.test.sharpe_ratio / n;
      report.avg_test_win_rate += window.test.win_rate / n;
      report.avg_test_drawdown += window.test.max_drawdown / n;
    }
  }
  report.recommendations = RecommendationsFor(report.overall);
  *out_report = std::move(report);
  return true;
}

}  // namespace feedback_engine
