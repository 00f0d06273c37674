#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace feedback_engine {

/// 对称相关系数表；资产与自身的相关系数恒为 1。
class CorrelationMatrix {
 public:
  void Set(const std::string& lhs, const std::string& rhs, double correlation);
  std::optional<double> Get(const std::string& lhs, const std::string& rhs) const;

  /// 以尾部对齐的收益序列估计 Pearson 相关系数（每对至少 2 个样本）。
  static CorrelationMatrix FromReturns(
      const std::map<std::string, std::vector<double>>& returns_by_asset);

 private:
  static std::pair<std::string, std::string> Key(const std::string& lhs,
                                                 const std::string& rhs);
  std::map<std::pair<std::string, std::string>, double> values_;
};

}  // namespace feedback_engine
