#include "backtest/learning_validation.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

#include "core/log.h"

namespace feedback_engine {

namespace {

constexpr std::size_t kRollingWindow = 20;
constexpr double kWinRateThreshold = 0.60;
constexpr std::size_t kDriftMinTrades = 100;
constexpr std::size_t kDriftWindows = 5;
constexpr std::size_t kCurveMinTrades = 40;
constexpr std::size_t kConvergenceWindow = 50;

double WinRate(std::vector<TradeOutcome>::const_iterator begin,
               std::vector<TradeOutcome>::const_iterator end) {
  const auto count = std::distance(begin, end);
  if (count <= 0) {
    return 0.0;
  }
  const auto wins = std::count_if(
      begin, end, [](const TradeOutcome& outcome) { return outcome.was_profitable; });
  return static_cast<double>(wins) / static_cast<double>(count);
}

double AvgPnl(std::vector<TradeOutcome>::const_iterator begin,
              std::vector<TradeOutcome>::const_iterator end) {
  const auto count = std::distance(begin, end);
  if (count <= 0) {
    return 0.0;
  }
  double total = 0.0;
  for (auto it = begin; it != end; ++it) {
    total += it->realized_pnl;
  }
  return total / static_cast<double>(count);
}

double Mean(std::vector<double>::const_iterator begin,
            std::vector<double>::const_iterator end) {
  const auto count = std::distance(begin, end);
  if (count <= 0) {
    return 0.0;
  }
  double total = 0.0;
  for (auto it = begin; it != end; ++it) {
    total += *it;
  }
  return total / static_cast<double>(count);
}

SampleEfficiency ComputeSampleEfficiency(const std::vector<TradeOutcome>& outcomes) {
  SampleEfficiency result;
  // 第 i 个值是 [i, i + 20) 的胜率。
  std::vector<double> rolling;
  for (std::size_t end = kRollingWindow; end < outcomes.size(); ++end) {
    rolling.push_back(WinRate(outcomes.begin() + (end - kRollingWindow),
                              outcomes.begin() + end));
  }
  for (std::size_t i = 0; i < rolling.size(); ++i) {
    if (rolling[i] >= kWinRateThreshold) {
      result.trades_to_threshold = static_cast<int>(i + kRollingWindow);
      break;
    }
  }
  if (rolling.size() >= 2) {
    const std::size_t k =
        std::max<std::size_t>(1, std::min<std::size_t>(10, rolling.size() / 4));
    const double early = Mean(rolling.begin(), rolling.begin() + k);
    const double late = Mean(rolling.end() - k, rolling.end());
    result.learning_speed_per_100_trades =
        (late - early) / (static_cast<double>(outcomes.size()) / 100.0);
  }
  return result;
}

CumulativeRegret ComputeRegret(const std::vector<TradeOutcome>& outcomes) {
  CumulativeRegret result;
  std::map<std::string, std::pair<double, int>> pnl_by_provider;
  for (const auto& outcome : outcomes) {
    for (const auto& provider : outcome.contributing_providers) {
      auto& [total, count] = pnl_by_provider[provider];
      total += outcome.realized_pnl;
      ++count;
    }
  }
  if (pnl_by_provider.empty()) {
    return result;
  }
  bool first = true;
  for (const auto& [provider, entry] : pnl_by_provider) {
    const double avg = entry.first / static_cast<double>(entry.second);
    if (first || avg > result.optimal_avg_pnl) {
      result.optimal_provider = provider;
      result.optimal_avg_pnl = avg;
      first = false;
    }
  }
  for (const auto& outcome : outcomes) {
    if (!outcome.contributing_providers.empty()) {
      result.total_regret += result.optimal_avg_pnl - outcome.realized_pnl;
    }
  }
  result.avg_regret_per_trade =
      result.total_regret / static_cast<double>(outcomes.size());
  return result;
}

ConceptDrift ComputeConceptDrift(const std::vector<TradeOutcome>& outcomes) {
  ConceptDrift result;
  if (outcomes.size() < kDriftMinTrades) {
    return result;
  }
  result.sufficient_data = true;
  const std::size_t window = outcomes.size() / kDriftWindows;
  for (std::size_t i = 0; i < kDriftWindows; ++i) {
    const auto begin = outcomes.begin() + i * window;
    // 最后一个窗口吸收余数。
    const auto end = i + 1 < kDriftWindows ? begin + window : outcomes.end();
    result.window_win_rates.push_back(WinRate(begin, end));
  }
  const double mean =
      Mean(result.window_win_rates.begin(), result.window_win_rates.end());
  double variance = 0.0;
  for (const double rate : result.window_win_rates) {
    variance += (rate - mean) * (rate - mean);
  }
  variance /= static_cast<double>(result.window_win_rates.size());
  result.drift_score = std::sqrt(variance);
  if (result.drift_score > 0.15) {
    result.severity = "HIGH";
  } else if (result.drift_score > 0.08) {
    result.severity = "MEDIUM";
  }
  return result;
}

ThompsonDiagnostics ComputeThompson(const std::vector<TradeOutcome>& outcomes) {
  ThompsonDiagnostics result;
  int total = 0;
  for (const auto& outcome : outcomes) {
    for (const auto& provider : outcome.contributing_providers) {
      ++result.provider_distribution[provider];
      ++total;
    }
  }
  if (total == 0) {
    return result;
  }
  int max_count = 0;
  for (const auto& [provider, count] : result.provider_distribution) {
    if (count > max_count) {
      max_count = count;
      result.dominant_provider = provider;
    }
  }
  result.exploration_rate =
      static_cast<double>(total - max_count) / static_cast<double>(total);

  const std::size_t recent = std::min(kConvergenceWindow, outcomes.size());
  const auto recent_dominant =
      std::count_if(outcomes.end() - recent, outcomes.end(),
                    [&result](const TradeOutcome& outcome) {
                      const auto& providers = outcome.contributing_providers;
                      return std::find(providers.begin(), providers.end(),
                                       result.dominant_provider) != providers.end();
                    });
  result.exploitation_convergence =
      static_cast<double>(recent_dominant) / static_cast<double>(recent);
  return result;
}

LearningCurve ComputeLearningCurve(const std::vector<TradeOutcome>& outcomes) {
  LearningCurve result;
  if (outcomes.size() < kCurveMinTrades) {
    return result;
  }
  result.sufficient_data = true;
  const std::size_t quartile = outcomes.size() / 4;
  const auto first_end = outcomes.begin() + quartile;
  const auto last_begin = outcomes.end() - quartile;
  result.first_win_rate = WinRate(outcomes.begin(), first_end);
  result.first_avg_pnl = AvgPnl(outcomes.begin(), first_end);
  result.last_win_rate = WinRate(last_begin, outcomes.end());
  result.last_avg_pnl = AvgPnl(last_begin, outcomes.end());
  if (result.first_win_rate > 0.0) {
    result.win_rate_improvement_pct =
        (result.last_win_rate - result.first_win_rate) / result.first_win_rate * 100.0;
  }
  if (result.first_avg_pnl != 0.0) {
    result.pnl_improvement_pct = (result.last_avg_pnl - result.first_avg_pnl) /
                                 std::fabs(result.first_avg_pnl) * 100.0;
  }
  result.learning_detected =
      result.win_rate_improvement_pct > 5.0 || result.pnl_improvement_pct > 10.0;
  return result;
}

}  // namespace

bool ComputeLearningValidation(const std::vector<TradeOutcome>& outcomes,
                               const std::string& asset_pair,
                               LearningValidationReport* out_report,
                               std::string* out_error) {
  if (out_report == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_report 为空";
    }
    return false;
  }
  std::vector<TradeOutcome> selected;
  if (asset_pair.empty()) {
    selected = outcomes;
  } else {
    std::copy_if(outcomes.begin(), outcomes.end(), std::back_inserter(selected),
                 [&asset_pair](const TradeOutcome& outcome) {
                   return outcome.asset_pair == asset_pair;
                 });
  }
  if (selected.empty()) {
    if (out_error != nullptr) {
      *out_error = asset_pair.empty() ? "没有可分析的交易结果"
                                      : "没有 " + asset_pair + " 的交易结果";
    }
    return false;
  }

  LearningValidationReport report;
  report.asset_pair = asset_pair.empty() ? "ALL" : asset_pair;
  report.total_trades = static_cast<int>(selected.size());
  report.sample_efficiency = ComputeSampleEfficiency(selected);
  report.cumulative_regret = ComputeRegret(selected);
  report.concept_drift = ComputeConceptDrift(selected);
  report.thompson = ComputeThompson(selected);
  report.learning_curve = ComputeLearningCurve(selected);

  LogInfo("LEARNING_VALIDATION: asset=" + report.asset_pair +
          ", trades=" + std::to_string(report.total_trades) +
          ", drift=" + report.concept_drift.severity +
          ", learning=" + (report.learning_curve.learning_detected ? "yes" : "no"));
  *out_report = std::move(report);
  return true;
}

bool ComputeLearningValidation(const PortfolioMemory& memory,
                               const std::string& asset_pair,
                               LearningValidationReport* out_report,
                               std::string* out_error) {
  return ComputeLearningValidation(memory.Snapshot().outcomes, asset_pair,
                                   out_report, out_error);
}

}  // namespace feedback_engine
