#include "market/market_snapshot.h"

#include <cmath>
#include <cstdio>
#include <exception>
#include <fstream>
#include <sstream>

#include <openssl/evp.h>

namespace feedback_engine {

namespace {

std::string FormatNumber(double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.17g", value);
  return buffer;
}

std::string BytesToHex(const unsigned char* bytes, unsigned int size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<std::size_t>(size) * 2);
  for (unsigned int i = 0; i < size; ++i) {
    out.push_back(kHex[bytes[i] >> 4U]);
    out.push_back(kHex[bytes[i] & 0x0FU]);
  }
  return out;
}

std::vector<std::string> SplitComma(const std::string& line) {
  std::vector<std::string> parts;
  std::string current;
  std::istringstream iss(line);
  while (std::getline(iss, current, ',')) {
    if (!current.empty() && current.back() == '\r') {
      current.pop_back();
    }
    parts.push_back(current);
  }
  return parts;
}

}  // namespace

std::string CanonicalSnapshotString(const MarketSnapshot& snapshot) {
  // 自由文本字段带长度前缀，名称中的分隔符不会与相邻字段混淆。
  auto append_text = [](std::string* out, const std::string& text) {
    out->append(std::to_string(text.size())).push_back(':');
    out->append(text);
  };
  std::string out;
  out.reserve(160 + snapshot.indicators.size() * 32);
  append_text(&out, snapshot.asset_pair);
  out.push_back('|');
  out.append(ToString(snapshot.asset_type)).push_back('|');
  append_text(&out, snapshot.timeframe);
  out.push_back('|');
  out.append(std::to_string(snapshot.timestamp)).push_back('|');
  for (const double value : {snapshot.open, snapshot.high, snapshot.low,
                             snapshot.close, snapshot.volume}) {
    out.append(FormatNumber(value)).push_back('|');
  }
  for (const auto& [name, value] : snapshot.indicators) {
    append_text(&out, name);
    out.push_back('=');
    out.append(FormatNumber(value)).push_back(';');
  }
  return out;
}

bool MarketStateHash(const MarketSnapshot& snapshot,
                     std::string* out_hash,
                     std::string* out_error) {
  if (out_hash == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_hash 为空";
    }
    return false;
  }
  const std::string canonical = CanonicalSnapshotString(snapshot);
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(canonical.data(), canonical.size(), digest, &digest_len,
                 EVP_sha256(), nullptr) != 1 ||
      digest_len == 0U) {
    if (out_error != nullptr) {
      *out_error = "OpenSSL SHA-256 计算失败";
    }
    return false;
  }
  *out_hash = BytesToHex(digest, digest_len);
  return true;
}

bool ValidateSnapshotSeries(const std::vector<MarketSnapshot>& series,
                            std::string* out_error) {
  for (std::size_t i = 0; i < series.size(); ++i) {
    const MarketSnapshot& bar = series[i];
    std::string problem;
    if (!std::isfinite(bar.close) || bar.close <= 0.0 || bar.open <= 0.0 ||
        bar.high <= 0.0 || bar.low <= 0.0) {
      problem = "价格必须为正";
    } else if (bar.high < bar.low) {
      problem = "high 小于 low";
    } else if (i > 0 && bar.asset_pair != series[0].asset_pair) {
      problem = "序列中混入其他资产";
    } else if (i > 0 && bar.timestamp <= series[i - 1].timestamp) {
      problem = "时间戳未严格递增";
    }
    if (!problem.empty()) {
      if (out_error != nullptr) {
        *out_error = "行情序列非法（index=" + std::to_string(i) +
                     ", ts=" + std::to_string(bar.timestamp) + "）: " + problem;
      }
      return false;
    }
  }
  return true;
}

bool CsvSnapshotSource::Load(const std::string& file_path,
                             std::int64_t start_ts,
                             std::int64_t end_ts,
                             std::vector<MarketSnapshot>* out_series,
                             std::string* out_error) const {
  if (out_series == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_series 为空";
    }
    return false;
  }
  std::ifstream in(file_path);
  if (!in.is_open()) {
    if (out_error != nullptr) {
      *out_error = "无法打开行情文件: " + file_path;
    }
    return false;
  }
  std::string line;
  if (!std::getline(in, line)) {
    if (out_error != nullptr) {
      *out_error = "行情文件为空: " + file_path;
    }
    return false;
  }
  const std::vector<std::string> header = SplitComma(line);
  if (header.size() < 6 || header[0] != "timestamp") {
    if (out_error != nullptr) {
      *out_error = "行情文件表头非法: " + file_path;
    }
    return false;
  }

  std::vector<MarketSnapshot> series;
  int line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty() || line == "\r") {
      continue;
    }
    const auto fields = SplitComma(line);
    if (fields.size() != header.size()) {
      if (out_error != nullptr) {
        *out_error = "行情行字段数不匹配，行号: " + std::to_string(line_no);
      }
      return false;
    }
    MarketSnapshot bar;
    bar.asset_pair = asset_pair_;
    bar.asset_type = asset_type_;
    bar.timeframe = timeframe_;
    try {
      bar.timestamp = std::stoll(fields[0]);
      bar.open = std::stod(fields[1]);
      bar.high = std::stod(fields[2]);
      bar.low = std::stod(fields[3]);
      bar.close = std::stod(fields[4]);
      bar.volume = std::stod(fields[5]);
      for (std::size_t i = 6; i < fields.size(); ++i) {
        bar.indicators[header[i]] = std::stod(fields[i]);
      }
    } catch (const std::exception&) {
      if (out_error != nullptr) {
        *out_error = "行情行数值解析失败，行号: " + std::to_string(line_no);
      }
      return false;
    }
    if (bar.timestamp < start_ts || (end_ts > 0 && bar.timestamp > end_ts)) {
      continue;
    }
    series.push_back(std::move(bar));
  }
  if (!ValidateSnapshotSeries(series, out_error)) {
    return false;
  }
  *out_series = std::move(series);
  return true;
}

}  // namespace feedback_engine
