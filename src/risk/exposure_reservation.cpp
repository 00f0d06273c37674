#include "risk/exposure_reservation.h"

#include <cmath>

#include "core/log.h"

namespace feedback_engine {

bool ExposureReservationManager::TryReserve(const std::string& decision_id,
                                            const std::string& asset_pair,
                                            double notional,
                                            double committed_exposure,
                                            double budget,
                                            std::int64_t now_ts,
                                            std::string* out_error) {
  if (!std::isfinite(notional) || notional < 0.0) {
    if (out_error != nullptr) {
      *out_error = "invalid reservation notional";
    }
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  ClearStaleLocked(now_ts);
  if (reservations_.count(decision_id) > 0) {
    if (out_error != nullptr) {
      *out_error = "duplicate reservation for decision " + decision_id;
    }
    return false;
  }
  const double required = committed_exposure + reserved_total_ + notional;
  if (required > budget + 1e-9) {
    if (out_error != nullptr) {
      *out_error = "exposure budget exhausted: required " +
                   std::to_string(required) + " > budget " +
                   std::to_string(budget);
    }
    return false;
  }
  reservations_[decision_id] = Reservation{asset_pair, notional, now_ts};
  reserved_total_ += notional;
  return true;
}

bool ExposureReservationManager::Commit(const std::string& decision_id) {
  return Release(decision_id);
}

bool ExposureReservationManager::Rollback(const std::string& decision_id) {
  if (!Release(decision_id)) {
    return false;
  }
  LogInfo("风险预占已回滚: decision=" + decision_id);
  return true;
}

bool ExposureReservationManager::Release(const std::string& decision_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = reservations_.find(decision_id);
  if (it == reservations_.end()) {
    return false;
  }
  reserved_total_ -= it->second.notional;
  if (reservations_.size() == 1) {
    reserved_total_ = 0.0;  // 消除累计浮点误差。
  }
  reservations_.erase(it);
  return true;
}

int ExposureReservationManager::ClearStale(std::int64_t now_ts) {
  std::lock_guard<std::mutex> lock(mutex_);
  return ClearStaleLocked(now_ts);
}

int ExposureReservationManager::ClearStaleLocked(std::int64_t now_ts) {
  int cleared = 0;
  for (auto it = reservations_.begin(); it != reservations_.end();) {
    if (now_ts - it->second.created_ts > ttl_s_) {
      LogWarn("清理过期风险预占: decision=" + it->first + " asset=" +
              it->second.asset_pair);
      reserved_total_ -= it->second.notional;
      it = reservations_.erase(it);
      ++cleared;
    } else {
      ++it;
    }
  }
  if (reservations_.empty()) {
    reserved_total_ = 0.0;
  }
  return cleared;
}

double ExposureReservationManager::reserved_total() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reserved_total_;
}

std::size_t ExposureReservationManager::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reservations_.size();
}

}  // namespace feedback_engine
