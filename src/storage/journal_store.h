#pragma once

#include <string>
#include <vector>

#include "core/json_utils.h"

namespace feedback_engine {

/**
 * @brief 追加式 JSON 行日志
 *
 * 语义：
 * 1. 每条记录一行紧凑 JSON，写入后立即 flush；
 * 2. 重启时按写入顺序回读；
 * 3. 任意一行损坏视为整个文件损坏（由调用方决定是否允许重新开始）。
 */
class JournalStore {
 public:
  explicit JournalStore(std::string file_path) : file_path_(std::move(file_path)) {}

  /// 确保父目录存在并创建文件（若不存在）。
  bool Initialize(std::string* out_error) const;

  /// 追加一条记录。
  bool Append(const JsonValue& record, std::string* out_error) const;

  /// 读取全部记录；文件不存在视为空日志。
  bool Load(std::vector<JsonValue>* out_records, std::string* out_error) const;

  const std::string& file_path() const { return file_path_; }

 private:
  std::string file_path_;  ///< 日志文件路径。
};

/// 临时文件 + rename 的原子整文件写入。
bool WriteFileAtomically(const std::string& file_path,
                         const std::string& content,
                         std::string* out_error);

/// 读取整个文件；`out_exists` 为 false 时表示文件不存在（不算错误）。
bool ReadWholeFile(const std::string& file_path,
                   std::string* out_content,
                   bool* out_exists,
                   std::string* out_error);

}  // namespace feedback_engine
