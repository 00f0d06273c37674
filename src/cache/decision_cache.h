#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "core/types.h"
#include "storage/journal_store.h"

namespace feedback_engine {

/// 缓存命中统计。
struct DecisionCacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  double hit_rate{0.0};
  std::size_t entries{0};
  std::map<std::string, std::size_t> entries_by_asset;
};

/**
 * @brief 决策草稿缓存（回放主要加速手段）
 *
 * 键 = asset_pair + "_" + timestamp + "_" + SHA-256(规范化快照)，
 * 不同行情状态在同一 (asset, timestamp) 下不会共用键。
 * 读取走共享锁；Put 为按键的 compare-and-set，已存在时不覆盖。
 * 配置了持久化路径时，新条目以 JSON 行追加写入。
 */
class DecisionCache {
 public:
  explicit DecisionCache(std::string persist_path = "")
      : persist_path_(std::move(persist_path)) {}

  /// 读取持久化条目；文件损坏时记录 WARN 并以空缓存继续。
  bool Initialize(std::string* out_error);

  static bool BuildKey(const MarketSnapshot& snapshot,
                       std::string* out_key,
                       std::string* out_error);

  std::optional<DecisionDraft> Get(const std::string& key);

  /// 仅当键不存在时写入；返回是否写入。
  bool Put(const std::string& key, const DecisionDraft& draft);

  /// 删除 timestamp 早于 `cutoff_ts` 的条目，返回删除条数。
  std::size_t ClearOlderThan(std::int64_t cutoff_ts);
  void ClearAll();

  DecisionCacheStats Stats() const;

 private:
  bool RewritePersisted(std::string* out_error) const;

  std::string persist_path_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, DecisionDraft> entries_;
  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  mutable std::mutex persist_mutex_;
};

}  // namespace feedback_engine
