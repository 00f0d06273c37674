#pragma once

#include <string>
#include <vector>

#include "core/types.h"

namespace feedback_engine {

/**
 * @brief 快照的规范化文本
 *
 * 资产、周期、时间戳、OHLCV 与全部指标按固定顺序拼接，数值以 %.17g 输出，
 * 文本字段（资产、周期、指标名）带长度前缀，任意字段差异都会反映到文本上。
 */
std::string CanonicalSnapshotString(const MarketSnapshot& snapshot);

/// 规范化文本的 SHA-256（小写 hex，OpenSSL EVP）。
bool MarketStateHash(const MarketSnapshot& snapshot,
                     std::string* out_hash,
                     std::string* out_error);

/**
 * @brief 校验回放序列
 *
 * 要求：同一资产、时间戳严格递增（不做重排）、价格为正且 high >= low。
 */
bool ValidateSnapshotSeries(const std::vector<MarketSnapshot>& series,
                            std::string* out_error);

/**
 * @brief CSV 行情源
 *
 * 格式：表头 `timestamp,open,high,low,close,volume[,indicator...]`，
 * 其后每行一根 bar；额外列按表头名称写入 indicators。
 */
class CsvSnapshotSource {
 public:
  CsvSnapshotSource(std::string asset_pair, AssetType asset_type,
                    std::string timeframe)
      : asset_pair_(std::move(asset_pair)),
        asset_type_(asset_type),
        timeframe_(std::move(timeframe)) {}

  /// 读取整个文件，并按 [start_ts, end_ts] 过滤（end_ts <= 0 表示不限）。
  bool Load(const std::string& file_path,
            std::int64_t start_ts,
            std::int64_t end_ts,
            std::vector<MarketSnapshot>* out_series,
            std::string* out_error) const;

 private:
  std::string asset_pair_;
  AssetType asset_type_;
  std::string timeframe_;
};

}  // namespace feedback_engine
