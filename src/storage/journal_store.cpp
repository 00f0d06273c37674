#include "storage/journal_store.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace feedback_engine {

namespace {

bool EnsureParentDirectory(const std::string& file_path, std::string* out_error) {
  const auto parent = std::filesystem::path(file_path).parent_path();
  if (parent.empty()) {
    return true;
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    if (out_error != nullptr) {
      *out_error = "创建目录失败: " + parent.string() + " (" + ec.message() + ")";
    }
    return false;
  }
  return true;
}

}  // namespace

bool JournalStore::Initialize(std::string* out_error) const {
  if (!EnsureParentDirectory(file_path_, out_error)) {
    return false;
  }
  std::ofstream out(file_path_, std::ios::app);
  if (!out.is_open()) {
    if (out_error != nullptr) {
      *out_error = "创建/打开日志文件失败: " + file_path_;
    }
    return false;
  }
  return true;
}

bool JournalStore::Append(const JsonValue& record, std::string* out_error) const {
  std::ofstream out(file_path_, std::ios::app);
  if (!out.is_open()) {
    if (out_error != nullptr) {
      *out_error = "日志文件打开失败: " + file_path_;
    }
    return false;
  }
  out << SerializeJson(record) << '\n';
  out.flush();
  if (!out.good()) {
    if (out_error != nullptr) {
      *out_error = "日志写入失败: " + file_path_;
    }
    return false;
  }
  return true;
}

bool JournalStore::Load(std::vector<JsonValue>* out_records,
                        std::string* out_error) const {
  if (out_records == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_records 为空";
    }
    return false;
  }
  out_records->clear();
  std::ifstream in(file_path_);
  if (!in.is_open()) {
    return true;
  }
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    JsonValue record;
    std::string parse_error;
    if (!ParseJson(line, &record, &parse_error) ||
        record.type != JsonType::kObject) {
      if (out_error != nullptr) {
        *out_error = "日志行解析失败（line=" + std::to_string(line_no) +
                     "）: " + parse_error;
      }
      return false;
    }
    out_records->push_back(std::move(record));
  }
  return true;
}

bool WriteFileAtomically(const std::string& file_path,
                         const std::string& content,
                         std::string* out_error) {
  if (!EnsureParentDirectory(file_path, out_error)) {
    return false;
  }
  const std::string temp_path = file_path + ".tmp";
  {
    std::ofstream out(temp_path, std::ios::trunc);
    if (!out.is_open()) {
      if (out_error != nullptr) {
        *out_error = "临时文件打开失败: " + temp_path;
      }
      return false;
    }
    out << content;
    out.flush();
    if (!out.good()) {
      if (out_error != nullptr) {
        *out_error = "临时文件写入失败: " + temp_path;
      }
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    if (out_error != nullptr) {
      *out_error = "替换文件失败: " + file_path + " (" + ec.message() + ")";
    }
    return false;
  }
  return true;
}

bool ReadWholeFile(const std::string& file_path,
                   std::string* out_content,
                   bool* out_exists,
                   std::string* out_error) {
  if (out_content == nullptr || out_exists == nullptr) {
    if (out_error != nullptr) {
      *out_error = "输出参数为空";
    }
    return false;
  }
  std::error_code ec;
  *out_exists = std::filesystem::exists(file_path, ec);
  if (ec) {
    if (out_error != nullptr) {
      *out_error = "无法访问文件: " + file_path + " (" + ec.message() + ")";
    }
    return false;
  }
  if (!*out_exists) {
    out_content->clear();
    return true;
  }
  std::ifstream in(file_path);
  if (!in.is_open()) {
    if (out_error != nullptr) {
      *out_error = "文件打开失败: " + file_path;
    }
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  *out_content = buffer.str();
  return true;
}

}  // namespace feedback_engine
