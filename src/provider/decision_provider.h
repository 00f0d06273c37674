#pragma once

#include <optional>
#include <string>

#include "core/types.h"

namespace feedback_engine {

/**
 * @brief 决策源统一抽象
 *
 * 具体 AI/规则客户端在本库之外实现。`Vote` 会在线程池中并发调用，
 * 实现必须线程安全；允许返回空或抛异常，两者都只会让该票被剔除。
 */
class DecisionProvider {
 public:
  virtual ~DecisionProvider() = default;

  /// provider 唯一 id（与 ensemble.providers 中的条目对应）。
  virtual std::string id() const = 0;

  /// 针对单个行情快照给出一票；无意见时返回 `std::nullopt`。
  virtual std::optional<ProviderVote> Vote(const MarketSnapshot& snapshot) = 0;
};

}  // namespace feedback_engine
