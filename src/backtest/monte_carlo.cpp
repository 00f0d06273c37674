#include "backtest/monte_carlo.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <memory>
#include <optional>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/normal_distribution.hpp>

#include "backtest/replay_engine.h"
#include "core/log.h"

namespace feedback_engine {

namespace {

constexpr double kMinPriceFactor = 0.01;

struct PathOutcome {
  std::optional<double> final_balance;
  std::string error;
  std::exception_ptr exception;
};

}  // namespace

std::vector<MarketSnapshot> MonteCarloSimulator::PerturbSeries(
    const std::vector<MarketSnapshot>& series,
    double noise_std,
    std::uint64_t seed) {
  std::vector<MarketSnapshot> out = series;
  if (noise_std <= 0.0) {
    return out;
  }
  boost::random::mt19937_64 rng(seed);
  boost::random::normal_distribution<double> noise(0.0, noise_std);
  for (auto& bar : out) {
    const double factor = std::max(kMinPriceFactor, 1.0 + noise(rng));
    bar.open *= factor;
    bar.high *= factor;
    bar.low *= factor;
    bar.close *= factor;
  }
  return out;
}

double MonteCarloSimulator::Percentile(const std::vector<double>& sorted_values,
                                       double q) {
  if (sorted_values.empty()) {
    return 0.0;
  }
  const double clamped = std::clamp(q, 0.0, 1.0);
  const double position =
      clamped * static_cast<double>(sorted_values.size() - 1);
  const std::size_t lower = static_cast<std::size_t>(std::floor(position));
  const std::size_t upper = std::min(lower + 1, sorted_values.size() - 1);
  const double fraction = position - static_cast<double>(lower);
  return sorted_values[lower] +
         (sorted_values[upper] - sorted_values[lower]) * fraction;
}

bool MonteCarloSimulator::Run(const std::vector<MarketSnapshot>& series,
                              const PortfolioMemory& base_memory,
                              const WeightOptimizer* base_optimizer,
                              const std::atomic<bool>* cancel,
                              MonteCarloReport* out_report,
                              std::string* out_error) const {
  if (out_report == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_report 为空";
    }
    return false;
  }
  const int paths = config_.monte_carlo.num_simulations;
  if (paths <= 0) {
    if (out_error != nullptr) {
      *out_error = "monte_carlo.num_simulations 必须大于 0";
    }
    return false;
  }

  const PortfolioMemorySnapshot memory_snapshot = base_memory.Snapshot();
  std::optional<WeightOptimizerState> optimizer_state;
  std::vector<std::string> provider_ids;
  if (base_optimizer != nullptr) {
    optimizer_state = base_optimizer->ExportState();
    provider_ids = base_optimizer->provider_ids();
  }
  WeightOptimizerConfig path_weights = config_.weights;
  path_weights.state_path.clear();

  std::vector<PathOutcome> outcomes(static_cast<std::size_t>(paths));
  std::atomic<bool> skipped{false};
  {
    boost::asio::thread_pool workers(static_cast<std::size_t>(
        std::max(1, config_.monte_carlo.max_threads)));
    for (int path = 0; path < paths; ++path) {
      boost::asio::post(workers, [&, path]() {
        PathOutcome& outcome = outcomes[static_cast<std::size_t>(path)];
        if (cancel != nullptr && cancel->load()) {
          skipped = true;
          return;
        }
        try {
          PortfolioMemory memory;
          memory.Restore(memory_snapshot);
          std::unique_ptr<WeightOptimizer> optimizer;
          if (optimizer_state.has_value()) {
            optimizer = std::make_unique<WeightOptimizer>(provider_ids, path_weights);
            optimizer->DisablePersistence();
            if (!optimizer->RestoreState(*optimizer_state, &outcome.error)) {
              return;
            }
            optimizer->Reseed(config_.weights.seed);
          }
          const std::vector<MarketSnapshot> perturbed = PerturbSeries(
              series, config_.monte_carlo.price_noise_std,
              config_.monte_carlo.seed + static_cast<std::uint64_t>(path) + 1);
          BacktestReplayEngine engine(config_, pool_, optimizer.get(), nullptr,
                                      &memory);
          ReplayOptions options;
          options.use_cache = false;
          options.learn = true;
          BacktestResult result;
          if (!engine.Run(perturbed, options, &result, &outcome.error)) {
            return;
          }
          outcome.final_balance = result.metrics.final_balance;
        } catch (const std::exception&) {
          outcome.exception = std::current_exception();
        }
      });
    }
    workers.join();
  }

  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    if (outcomes[i].exception) {
      std::rethrow_exception(outcomes[i].exception);
    }
  }
  MonteCarloReport report;
  report.num_simulations = paths;
  report.var_confidence = config_.risk.var_confidence;
  report.cancelled = skipped.load();
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    if (!outcomes[i].error.empty()) {
      if (out_error != nullptr) {
        *out_error = "路径 " + std::to_string(i) + " 失败: " + outcomes[i].error;
      }
      return false;
    }
    if (outcomes[i].final_balance.has_value()) {
      report.final_balances.push_back(*outcomes[i].final_balance);
    }
  }
  report.completed_paths = static_cast<int>(report.final_balances.size());
  if (report.final_balances.empty()) {
    *out_report = std::move(report);
    return true;
  }

  std::vector<double> sorted = report.final_balances;
  std::sort(sorted.begin(), sorted.end());
  report.p5 = Percentile(sorted, 0.05);
  report.p25 = Percentile(sorted, 0.25);
  report.p50 = Percentile(sorted, 0.50);
  report.p75 = Percentile(sorted, 0.75);
  report.p95 = Percentile(sorted, 0.95);
  report.worst_final = sorted.front();
  report.best_final = sorted.back();

  const double initial = config_.backtest.initial_balance;
  report.value_at_risk = initial - Percentile(sorted, 1.0 - report.var_confidence);
  double mean = 0.0;
  for (const double value : sorted) {
    mean += value;
  }
  mean /= static_cast<double>(sorted.size());
  double variance = 0.0;
  for (const double value : sorted) {
    variance += (value - mean) * (value - mean);
  }
  report.std_final = std::sqrt(variance / static_cast<double>(sorted.size()));
  report.expected_return = initial > 0.0 ? mean / initial - 1.0 : 0.0;

  LogInfo("MONTE_CARLO_DONE: paths=" + std::to_string(report.completed_paths) +
          ", p50=" + std::to_string(report.p50) +
          ", var=" + std::to_string(report.value_at_risk));
  *out_report = std::move(report);
  return true;
}

}  // namespace feedback_engine
