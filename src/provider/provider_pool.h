#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "core/config.h"
#include "core/types.h"
#include "provider/decision_provider.h"

namespace feedback_engine {

/// 一次扇出的汇总：成功票按 provider 优先级排序。
struct ProviderPoolResult {
  std::vector<ProviderVote> votes;
  std::vector<std::string> failed_providers;
};

/**
 * @brief Provider 并发扇出
 *
 * 行为：
 * 1. 每个 provider 投递一个任务到有界线程池；
 * 2. 所有任务共享同一个截止时间，超时的票直接剔除，不会无限等待；
 * 3. 异常/空结果同样剔除并记录 WARN，永远不会抛到聚合器；
 * 4. 超时后仍在运行的调用记为“滞留”，滞留期间该 provider 直接判失败、
 *    不再投递新任务，因此滞留调用最多各占一个工作线程；
 *    线程数至少等于 provider 数，滞留的 provider 不会饿死健康的 provider。
 *
 * provider 以 shared_ptr 持有，超时后仍在运行的任务不会悬空。
 */
class ProviderPool {
 public:
  ProviderPool(std::vector<std::shared_ptr<DecisionProvider>> providers,
               ProviderPoolConfig config);
  ~ProviderPool();

  ProviderPool(const ProviderPool&) = delete;
  ProviderPool& operator=(const ProviderPool&) = delete;

  ProviderPoolResult CollectVotes(const MarketSnapshot& snapshot);

  std::vector<std::string> provider_ids() const;

  /// 超时后仍未返回的调用数（所有 provider 合计）。
  int stalled_calls() const;

 private:
  /// 单个 provider 的滞留调用计数。
  struct StallCounter {
    std::atomic<int> stalled{0};
  };

  std::vector<std::shared_ptr<DecisionProvider>> providers_;
  std::vector<std::shared_ptr<StallCounter>> stall_counters_;
  ProviderPoolConfig config_;
  boost::asio::thread_pool pool_;
};

}  // namespace feedback_engine
