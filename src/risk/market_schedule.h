#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/types.h"

namespace feedback_engine {

/// 某资产类别在给定时刻的开闭市状态。
struct MarketStatus {
  bool is_open{true};
  std::string session;                 ///< 如 "London"、"Overlap"、"Regular"、"Closed"。
  std::optional<int> minutes_to_close;
  std::optional<int> minutes_to_open;
  std::vector<std::string> warnings;   ///< 低流动性等提示，不构成拒绝。
};

/**
 * @brief 交易时段判定
 *
 * - crypto：全天候开放；UTC 周末给出低流动性警告；
 * - forex：纽约时间周五 17:00 至周日 17:00 休市，其余时间按伦敦/纽约
 *   本地 08:00-17:00 划分 London / New York / Overlap / Asian；
 * - stock：纽约时间工作日 09:30-16:00。
 *
 * 夏令时由 Boost.DateTime 的 POSIX 时区规则处理。
 */
class MarketSchedule {
 public:
  MarketStatus GetStatus(AssetType asset_type, std::int64_t unix_ts) const;

 private:
  MarketStatus CryptoStatus(std::int64_t unix_ts) const;
  MarketStatus ForexStatus(std::int64_t unix_ts) const;
  MarketStatus StockStatus(std::int64_t unix_ts) const;
};

}  // namespace feedback_engine
