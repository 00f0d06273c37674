#pragma once

#include <stdexcept>
#include <string>

namespace feedback_engine {

/// 所有降级层级后仍没有任何可用投票；调用方必须处理，不会被降级为 HOLD。
class InsufficientProvidersError : public std::runtime_error {
 public:
  explicit InsufficientProvidersError(const std::string& message)
      : std::runtime_error(message) {}
};

/// 只读状态下写入 PortfolioMemory。
class ReadOnlyViolationError : public std::runtime_error {
 public:
  explicit ReadOnlyViolationError(const std::string& message)
      : std::runtime_error(message) {}
};

}  // namespace feedback_engine
