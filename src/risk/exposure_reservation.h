#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace feedback_engine {

/**
 * @brief 风险预算预占
 *
 * 决策在执行前先占用名义敞口额度，执行成功后 Commit（额度转入持仓敞口），
 * 失败或放弃时 Rollback。检查与写入在同一把锁内完成，
 * 两个并发决策不会重复占用同一份额度。超过 TTL 未结算的预占会被清理。
 */
class ExposureReservationManager {
 public:
  explicit ExposureReservationManager(int ttl_s = 300) : ttl_s_(ttl_s) {}

  /**
   * @brief 原子预占
   *
   * 条件：committed_exposure + 现有预占 + notional <= budget。
   * decision_id 重复、notional 非法或额度不足时返回 false。
   */
  bool TryReserve(const std::string& decision_id,
                  const std::string& asset_pair,
                  double notional,
                  double committed_exposure,
                  double budget,
                  std::int64_t now_ts,
                  std::string* out_error);

  /// 执行成功：移除预占（敞口已计入持仓）。未知 id 返回 false。
  bool Commit(const std::string& decision_id);
  /// 执行失败或放弃：释放额度。未知 id 返回 false。
  bool Rollback(const std::string& decision_id);
  /// 清理过期预占，返回清理条数。
  int ClearStale(std::int64_t now_ts);

  double reserved_total() const;
  std::size_t active_count() const;

 private:
  struct Reservation {
    std::string asset_pair;
    double notional{0.0};
    std::int64_t created_ts{0};
  };

  bool Release(const std::string& decision_id);
  int ClearStaleLocked(std::int64_t now_ts);

  int ttl_s_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Reservation> reservations_;
  double reserved_total_{0.0};
};

}  // namespace feedback_engine
