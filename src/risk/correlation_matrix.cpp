#include "risk/correlation_matrix.h"

#include <algorithm>
#include <cmath>

namespace feedback_engine {

std::pair<std::string, std::string> CorrelationMatrix::Key(const std::string& lhs,
                                                           const std::string& rhs) {
  return lhs < rhs ? std::make_pair(lhs, rhs) : std::make_pair(rhs, lhs);
}

void CorrelationMatrix::Set(const std::string& lhs, const std::string& rhs,
                            double correlation) {
  if (lhs == rhs || !std::isfinite(correlation)) {
    return;
  }
  values_[Key(lhs, rhs)] = std::clamp(correlation, -1.0, 1.0);
}

std::optional<double> CorrelationMatrix::Get(const std::string& lhs,
                                             const std::string& rhs) const {
  if (lhs == rhs) {
    return 1.0;
  }
  const auto it = values_.find(Key(lhs, rhs));
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

CorrelationMatrix CorrelationMatrix::FromReturns(
    const std::map<std::string, std::vector<double>>& returns_by_asset) {
  CorrelationMatrix matrix;
  for (auto lhs = returns_by_asset.begin(); lhs != returns_by_asset.end(); ++lhs) {
    for (auto rhs = std::next(lhs); rhs != returns_by_asset.end(); ++rhs) {
      const std::size_t n = std::min(lhs->second.size(), rhs->second.size());
      if (n < 2) {
        continue;
      }
      const double* x = lhs->second.data() + (lhs->second.size() - n);
      const double* y = rhs->second.data() + (rhs->second.size() - n);
      double mean_x = 0.0;
      double mean_y = 0.0;
      for (std::size_t i = 0; i < n; ++i) {
        mean_x += x[i];
        mean_y += y[i];
      }
      mean_x /= static_cast<double>(n);
      mean_y /= static_cast<double>(n);
      double cov = 0.0;
      double var_x = 0.0;
      double var_y = 0.0;
      for (std::size_t i = 0; i < n; ++i) {
        cov += (x[i] - mean_x) * (y[i] - mean_y);
        var_x += (x[i] - mean_x) * (x[i] - mean_x);
        var_y += (y[i] - mean_y) * (y[i] - mean_y);
      }
      if (var_x <= 0.0 || var_y <= 0.0) {
        continue;
      }
      matrix.Set(lhs->first, rhs->first, cov / std::sqrt(var_x * var_y));
    }
  }
  return matrix;
}

}  // namespace feedback_engine
