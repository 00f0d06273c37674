#include "provider/provider_pool.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>

#include <boost/asio/post.hpp>

#include "core/log.h"

namespace feedback_engine {

namespace {

// 一次调用的完成/滞留状态，由收集方与工作线程共享。
struct CallState {
  std::mutex mutex;
  bool done{false};
  bool stalled{false};
};

std::size_t PoolSize(const ProviderPoolConfig& config, std::size_t provider_count) {
  const std::size_t configured =
      static_cast<std::size_t>(config.max_threads > 0 ? config.max_threads : 1);
  return std::max(configured, provider_count);
}

}  // namespace

ProviderPool::ProviderPool(std::vector<std::shared_ptr<DecisionProvider>> providers,
                           ProviderPoolConfig config)
    : providers_(std::move(providers)),
      config_(config),
      pool_(PoolSize(config, providers_.size())) {
  stall_counters_.reserve(providers_.size());
  for (std::size_t i = 0; i < providers_.size(); ++i) {
    stall_counters_.push_back(std::make_shared<StallCounter>());
  }
}

ProviderPool::~ProviderPool() {
  pool_.stop();
  pool_.join();
}

std::vector<std::string> ProviderPool::provider_ids() const {
  std::vector<std::string> ids;
  ids.reserve(providers_.size());
  for (const auto& provider : providers_) {
    ids.push_back(provider->id());
  }
  return ids;
}

int ProviderPool::stalled_calls() const {
  int total = 0;
  for (const auto& counter : stall_counters_) {
    total += counter->stalled.load();
  }
  return total;
}

ProviderPoolResult ProviderPool::CollectVotes(const MarketSnapshot& snapshot) {
  using Clock = std::chrono::steady_clock;
  const auto shared_snapshot = std::make_shared<const MarketSnapshot>(snapshot);
  const auto deadline = Clock::now() + std::chrono::milliseconds(config_.timeout_ms);

  std::vector<std::optional<std::future<std::optional<ProviderVote>>>> futures(
      providers_.size());
  std::vector<std::shared_ptr<CallState>> calls(providers_.size());
  for (std::size_t i = 0; i < providers_.size(); ++i) {
    if (stall_counters_[i]->stalled.load() > 0) {
      continue;
    }
    auto provider = providers_[i];
    auto counter = stall_counters_[i];
    auto call = std::make_shared<CallState>();
    auto promise = std::make_shared<std::promise<std::optional<ProviderVote>>>();
    futures[i] = promise->get_future();
    calls[i] = call;
    boost::asio::post(pool_, [provider, counter, call, shared_snapshot, promise]() {
      const auto started = Clock::now();
      try {
        std::optional<ProviderVote> vote = provider->Vote(*shared_snapshot);
        if (vote.has_value()) {
          vote->provider_id = provider->id();
          vote->latency_ms = std::chrono::duration<double, std::milli>(
                                 Clock::now() - started)
                                 .count();
        }
        promise->set_value(std::move(vote));
      } catch (const std::exception&) {
        promise->set_exception(std::current_exception());
      } catch (...) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("provider 抛出非标准异常")));
      }
      std::lock_guard<std::mutex> lock(call->mutex);
      call->done = true;
      if (call->stalled) {
        counter->stalled.fetch_sub(1);
        LogInfo("PROVIDER_RECOVERED: provider=" + provider->id());
      }
    });
  }

  ProviderPoolResult result;
  for (std::size_t i = 0; i < providers_.size(); ++i) {
    const std::string provider_id = providers_[i]->id();
    if (!futures[i].has_value()) {
      LogWarn("provider 上次调用仍未返回，跳过本轮: " + provider_id);
      result.failed_providers.push_back(provider_id);
      continue;
    }
    auto& future = *futures[i];
    if (future.wait_until(deadline) != std::future_status::ready) {
      {
        std::lock_guard<std::mutex> lock(calls[i]->mutex);
        if (!calls[i]->done) {
          calls[i]->stalled = true;
          stall_counters_[i]->stalled.fetch_add(1);
        }
      }
      LogWarn("provider 超时，剔除该票: " + provider_id);
      result.failed_providers.push_back(provider_id);
      continue;
    }
    try {
      std::optional<ProviderVote> vote = future.get();
      if (!vote.has_value()) {
        LogWarn("provider 未给出投票: " + provider_id);
        result.failed_providers.push_back(provider_id);
        continue;
      }
      result.votes.push_back(std::move(*vote));
    } catch (const std::exception& e) {
      LogWarn("provider 调用失败，剔除该票: " + provider_id + " (" + e.what() +
              ")");
      result.failed_providers.push_back(provider_id);
    }
  }
  return result;
}

}  // namespace feedback_engine
