#include "risk/var_calculator.h"

#include <algorithm>
#include <cmath>

namespace feedback_engine {

double HistoricalVar(const std::vector<double>& returns,
                     double confidence,
                     int min_samples) {
  if (returns.empty() || static_cast<int>(returns.size()) < min_samples) {
    return 0.0;
  }
  std::vector<double> sorted = returns;
  std::sort(sorted.begin(), sorted.end());
  const double n = static_cast<double>(sorted.size());
  long index = std::lround(n * (1.0 - confidence));
  index = std::clamp<long>(index, 0, static_cast<long>(sorted.size()) - 1);
  return std::fabs(sorted[static_cast<std::size_t>(index)]);
}

double TrailingDrawdown(const std::vector<double>& equity_curve) {
  double peak = 0.0;
  for (const double equity : equity_curve) {
    peak = std::max(peak, equity);
  }
  if (equity_curve.empty() || peak <= 0.0) {
    return 0.0;
  }
  return std::max(0.0, (peak - equity_curve.back()) / peak);
}

std::vector<double> ReturnsFromEquity(const std::vector<double>& equity_curve) {
  std::vector<double> returns;
  for (std::size_t i = 1; i < equity_curve.size(); ++i) {
    if (equity_curve[i - 1] > 0.0) {
      returns.push_back(equity_curve[i] / equity_curve[i - 1] - 1.0);
    }
  }
  return returns;
}

}  // namespace feedback_engine
