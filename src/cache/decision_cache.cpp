#include "cache/decision_cache.h"

#include <vector>

#include "core/log.h"
#include "market/market_snapshot.h"
#include "storage/record_codec.h"

namespace feedback_engine {

namespace {

JsonValue CacheRecord(const std::string& key, const DecisionDraft& draft) {
  JsonValue record = MakeJsonObject();
  record.object_value["key"] = MakeJsonString(key);
  record.object_value["draft"] = DraftToJson(draft);
  return record;
}

}  // namespace

bool DecisionCache::Initialize(std::string* out_error) {
  if (persist_path_.empty()) {
    return true;
  }
  JournalStore store(persist_path_);
  if (!store.Initialize(out_error)) {
    return false;
  }
  std::vector<JsonValue> records;
  std::string load_error;
  std::unordered_map<std::string, DecisionDraft> loaded;
  bool corrupted = !store.Load(&records, &load_error);
  for (const auto& record : records) {
    if (corrupted) {
      break;
    }
    const auto key = JsonAsString(JsonObjectField(&record, "key"));
    const JsonValue* draft_value = JsonObjectField(&record, "draft");
    DecisionDraft draft;
    if (!key.has_value() || draft_value == nullptr ||
        !DraftFromJson(*draft_value, &draft, &load_error)) {
      corrupted = true;
      break;
    }
    loaded.emplace(*key, std::move(draft));
  }
  if (corrupted) {
    // 缓存只是派生数据，损坏时丢弃并重建。
    LogWarn("决策缓存文件损坏，以空缓存启动: " + load_error);
    loaded.clear();
  }
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_ = std::move(loaded);
  }
  if (corrupted) {
    return RewritePersisted(out_error);
  }
  return true;
}

bool DecisionCache::BuildKey(const MarketSnapshot& snapshot,
                             std::string* out_key,
                             std::string* out_error) {
  if (out_key == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_key 为空";
    }
    return false;
  }
  std::string hash;
  if (!MarketStateHash(snapshot, &hash, out_error)) {
    return false;
  }
  *out_key = snapshot.asset_pair + "_" + std::to_string(snapshot.timestamp) +
             "_" + hash;
  return true;
}

std::optional<DecisionDraft> DecisionCache::Get(const std::string& key) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }
  hits_.fetch_add(1, std::memory_order_relaxed);
  return it->second;
}

bool DecisionCache::Put(const std::string& key, const DecisionDraft& draft) {
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!entries_.emplace(key, draft).second) {
      return false;
    }
  }
  if (!persist_path_.empty()) {
    std::lock_guard<std::mutex> lock(persist_mutex_);
    std::string error;
    if (!JournalStore(persist_path_).Append(CacheRecord(key, draft), &error)) {
      LogError("决策缓存持久化失败: " + error);
    }
  }
  return true;
}

std::size_t DecisionCache::ClearOlderThan(std::int64_t cutoff_ts) {
  std::size_t removed = 0;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (it->second.timestamp < cutoff_ts) {
        it = entries_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
  }
  std::string error;
  if (removed > 0 && !RewritePersisted(&error)) {
    LogError("决策缓存重写失败: " + error);
  }
  return removed;
}

void DecisionCache::ClearAll() {
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
  }
  hits_.store(0);
  misses_.store(0);
  std::string error;
  if (!RewritePersisted(&error)) {
    LogError("决策缓存重写失败: " + error);
  }
}

bool DecisionCache::RewritePersisted(std::string* out_error) const {
  if (persist_path_.empty()) {
    return true;
  }
  std::string content;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [key, draft] : entries_) {
      content += SerializeJson(CacheRecord(key, draft));
      content.push_back('\n');
    }
  }
  std::lock_guard<std::mutex> lock(persist_mutex_);
  return WriteFileAtomically(persist_path_, content, out_error);
}

DecisionCacheStats DecisionCache::Stats() const {
  DecisionCacheStats stats;
  stats.hits = hits_.load();
  stats.misses = misses_.load();
  const std::uint64_t total = stats.hits + stats.misses;
  stats.hit_rate =
      total > 0 ? static_cast<double>(stats.hits) / static_cast<double>(total)
                : 0.0;
  std::shared_lock<std::shared_mutex> lock(mutex_);
  stats.entries = entries_.size();
  for (const auto& [key, draft] : entries_) {
    ++stats.entries_by_asset[draft.asset_pair];
  }
  return stats;
}

}  // namespace feedback_engine
