#include "risk/market_schedule.h"

#include <ctime>

#include <boost/date_time/local_time/local_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace feedback_engine {

namespace {

namespace lt = boost::local_time;
namespace pt = boost::posix_time;

constexpr int kMinutesPerDay = 24 * 60;
constexpr int kForexBoundary = 17 * 60;  // 纽约 17:00 开/收周。
constexpr int kSessionOpen = 8 * 60;
constexpr int kSessionClose = 17 * 60;
constexpr int kStockOpen = 9 * 60 + 30;
constexpr int kStockClose = 16 * 60;

/// 本地日历：星期（0=周日）与当日分钟数。
struct LocalClock {
  int day_of_week{0};
  int minute_of_day{0};
};

const lt::time_zone_ptr& NewYorkZone() {
  static const lt::time_zone_ptr zone(
      new lt::posix_time_zone("EST-05EDT+01,M3.2.0/02:00,M11.1.0/02:00"));
  return zone;
}

const lt::time_zone_ptr& LondonZone() {
  static const lt::time_zone_ptr zone(
      new lt::posix_time_zone("GMT+00BST+01,M3.5.0/01:00,M10.5.0/02:00"));
  return zone;
}

LocalClock ToLocal(std::int64_t unix_ts, const lt::time_zone_ptr& zone) {
  const pt::ptime utc = pt::from_time_t(static_cast<std::time_t>(unix_ts));
  const pt::ptime local = lt::local_date_time(utc, zone).local_time();
  LocalClock clock;
  clock.day_of_week = static_cast<int>(local.date().day_of_week().as_number());
  clock.minute_of_day = static_cast<int>(local.time_of_day().hours() * 60 +
                                         local.time_of_day().minutes());
  return clock;
}

bool IsWeekday(int day_of_week) { return day_of_week >= 1 && day_of_week <= 5; }

bool InSession(const LocalClock& clock) {
  return IsWeekday(clock.day_of_week) && clock.minute_of_day >= kSessionOpen &&
         clock.minute_of_day < kSessionClose;
}

}  // namespace

MarketStatus MarketSchedule::GetStatus(AssetType asset_type,
                                       std::int64_t unix_ts) const {
  switch (asset_type) {
    case AssetType::kCrypto:
      return CryptoStatus(unix_ts);
    case AssetType::kForex:
      return ForexStatus(unix_ts);
    case AssetType::kStock:
      return StockStatus(unix_ts);
  }
  return CryptoStatus(unix_ts);
}

MarketStatus MarketSchedule::CryptoStatus(std::int64_t unix_ts) const {
  MarketStatus status;
  status.is_open = true;
  status.session = "24/7";
  const std::time_t t = static_cast<std::time_t>(unix_ts);
  std::tm tm{};
  gmtime_r(&t, &tm);
  if (tm.tm_wday == 0 || tm.tm_wday == 6) {
    status.warnings.push_back("weekend low liquidity");
  }
  return status;
}

MarketStatus MarketSchedule::ForexStatus(std::int64_t unix_ts) const {
  const LocalClock ny = ToLocal(unix_ts, NewYorkZone());
  const int week_minute = ny.day_of_week * kMinutesPerDay + ny.minute_of_day;
  const int weekly_close = 5 * kMinutesPerDay + kForexBoundary;

  MarketStatus status;
  const bool closed = (ny.day_of_week == 5 && ny.minute_of_day >= kForexBoundary) ||
                      ny.day_of_week == 6 ||
                      (ny.day_of_week == 0 && ny.minute_of_day < kForexBoundary);
  if (closed) {
    status.is_open = false;
    status.session = "Closed";
    status.minutes_to_open =
        ny.day_of_week == 0 ? kForexBoundary - week_minute
                            : 7 * kMinutesPerDay + kForexBoundary - week_minute;
    return status;
  }

  status.is_open = true;
  status.minutes_to_close = weekly_close - week_minute;
  const bool london = InSession(ToLocal(unix_ts, LondonZone()));
  const bool new_york = InSession(ny);
  if (london && new_york) {
    status.session = "Overlap";
  } else if (london) {
    status.session = "London";
  } else if (new_york) {
    status.session = "New York";
  } else {
    status.session = "Asian";
  }
  return status;
}

MarketStatus MarketSchedule::StockStatus(std::int64_t unix_ts) const {
  const LocalClock ny = ToLocal(unix_ts, NewYorkZone());
  MarketStatus status;
  if (IsWeekday(ny.day_of_week) && ny.minute_of_day >= kStockOpen &&
      ny.minute_of_day < kStockClose) {
    status.is_open = true;
    status.session = "Regular";
    status.minutes_to_close = kStockClose - ny.minute_of_day;
    return status;
  }

  status.is_open = false;
  status.session = "Closed";
  // 找到下一个工作日开盘时刻。
  int days_ahead = 0;
  int day = ny.day_of_week;
  if (IsWeekday(day) && ny.minute_of_day < kStockOpen) {
    days_ahead = 0;
  } else {
    do {
      ++days_ahead;
      day = (day + 1) % 7;
    } while (!IsWeekday(day));
  }
  status.minutes_to_open =
      days_ahead * kMinutesPerDay + kStockOpen - ny.minute_of_day;
  return status;
}

}  // namespace feedback_engine
