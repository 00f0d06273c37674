#include "core/json_utils.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <utility>

namespace feedback_engine {

namespace {

// 递归下降解析器：覆盖持久化文件用到的完整 JSON 语法（\u 仅支持 ASCII）。
class Reader {
 public:
  explicit Reader(const std::string& text) : text_(text) {}

  bool ReadDocument(JsonValue* out, std::string* out_error) {
    SkipSpace();
    if (!ReadValue(out, 0)) {
      return Report(out_error);
    }
    SkipSpace();
    if (pos_ != text_.size()) {
      error_ = "JSON 尾部存在多余字符";
      return Report(out_error);
    }
    return true;
  }

 private:
  static constexpr int kMaxDepth = 64;

  bool Report(std::string* out_error) const {
    if (out_error != nullptr) {
      *out_error = error_ + "，偏移: " + std::to_string(pos_);
    }
    return false;
  }

  bool Fail(const char* message) {
    error_ = message;
    return false;
  }

  void SkipSpace() {
    while (pos_ < text_.size() &&
           (text_[pos_] == ' ' || text_[pos_] == '\n' || text_[pos_] == '\r' ||
            text_[pos_] == '\t')) {
      ++pos_;
    }
  }

  bool Peek(char expected) const {
    return pos_ < text_.size() && text_[pos_] == expected;
  }

  bool ReadLiteral(const char* literal) {
    std::size_t i = 0;
    while (literal[i] != '\0') {
      if (pos_ + i >= text_.size() || text_[pos_ + i] != literal[i]) {
        return Fail("JSON 字面量非法");
      }
      ++i;
    }
    pos_ += i;
    return true;
  }

  bool ReadValue(JsonValue* out, int depth) {
    if (depth > kMaxDepth) {
      return Fail("JSON 嵌套过深");
    }
    if (pos_ >= text_.size()) {
      return Fail("JSON 意外结束");
    }
    const char ch = text_[pos_];
    switch (ch) {
      case '{':
        return ReadObject(out, depth);
      case '[':
        return ReadArray(out, depth);
      case '"':
        out->type = JsonType::kString;
        return ReadString(&out->string_value);
      case 't':
        out->type = JsonType::kBool;
        out->bool_value = true;
        return ReadLiteral("true");
      case 'f':
        out->type = JsonType::kBool;
        out->bool_value = false;
        return ReadLiteral("false");
      case 'n':
        out->type = JsonType::kNull;
        return ReadLiteral("null");
      default:
        break;
    }
    if (ch == '-' || (ch >= '0' && ch <= '9')) {
      out->type = JsonType::kNumber;
      return ReadNumber(&out->number_value);
    }
    return Fail("JSON 非法值起始字符");
  }

  bool ReadObject(JsonValue* out, int depth) {
    ++pos_;
    out->type = JsonType::kObject;
    out->object_value.clear();
    SkipSpace();
    if (Peek('}')) {
      ++pos_;
      return true;
    }
    for (;;) {
      SkipSpace();
      if (!Peek('"')) {
        return Fail("JSON 对象键必须为字符串");
      }
      std::string key;
      if (!ReadString(&key)) {
        return false;
      }
      SkipSpace();
      if (!Peek(':')) {
        return Fail("JSON 对象缺少冒号");
      }
      ++pos_;
      SkipSpace();
      JsonValue item;
      if (!ReadValue(&item, depth + 1)) {
        return false;
      }
      out->object_value[key] = std::move(item);
      SkipSpace();
      if (Peek(',')) {
        ++pos_;
        continue;
      }
      if (Peek('}')) {
        ++pos_;
        return true;
      }
      return Fail("JSON 对象缺少结束符");
    }
  }

  bool ReadArray(JsonValue* out, int depth) {
    ++pos_;
    out->type = JsonType::kArray;
    out->array_value.clear();
    SkipSpace();
    if (Peek(']')) {
      ++pos_;
      return true;
    }
    for (;;) {
      SkipSpace();
      JsonValue item;
      if (!ReadValue(&item, depth + 1)) {
        return false;
      }
      out->array_value.push_back(std::move(item));
      SkipSpace();
      if (Peek(',')) {
        ++pos_;
        continue;
      }
      if (Peek(']')) {
        ++pos_;
        return true;
      }
      return Fail("JSON 数组缺少结束符");
    }
  }

  bool ReadString(std::string* out) {
    ++pos_;  // 起始引号
    out->clear();
    while (pos_ < text_.size()) {
      const char ch = text_[pos_++];
      if (ch == '"') {
        return true;
      }
      if (ch != '\\') {
        out->push_back(ch);
        continue;
      }
      if (pos_ >= text_.size()) {
        return Fail("JSON 字符串转义不完整");
      }
      const char esc = text_[pos_++];
      switch (esc) {
        case '"':
        case '\\':
        case '/':
          out->push_back(esc);
          break;
        case 'b':
          out->push_back('\b');
          break;
        case 'f':
          out->push_back('\f');
          break;
        case 'n':
          out->push_back('\n');
          break;
        case 'r':
          out->push_back('\r');
          break;
        case 't':
          out->push_back('\t');
          break;
        case 'u': {
          if (pos_ + 4 > text_.size()) {
            return Fail("JSON unicode 转义不完整");
          }
          const std::string hex = text_.substr(pos_, 4);
          char* end = nullptr;
          const long codepoint = std::strtol(hex.c_str(), &end, 16);
          if (end == nullptr || *end != '\0') {
            return Fail("JSON unicode 转义非法");
          }
          pos_ += 4;
          out->push_back(codepoint <= 0x7F ? static_cast<char>(codepoint)
                                           : '?');
          break;
        }
        default:
          return Fail("JSON 未知转义字符");
      }
    }
    return Fail("JSON 字符串缺少结束引号");
  }

  bool ReadNumber(double* out) {
    const std::size_t begin = pos_;
    if (Peek('-')) {
      ++pos_;
    }
    auto is_number_char = [](char c) {
      return (c >= '0' && c <= '9') || c == '.' || c == 'e' || c == 'E' ||
             c == '+' || c == '-';
    };
    while (pos_ < text_.size() && is_number_char(text_[pos_])) {
      ++pos_;
    }
    const std::string token = text_.substr(begin, pos_ - begin);
    char* end = nullptr;
    const double value = std::strtod(token.c_str(), &end);
    if (token.empty() || end == nullptr || *end != '\0') {
      return Fail("JSON 数字格式非法");
    }
    *out = value;
    return true;
  }

  const std::string& text_;
  std::size_t pos_{0};
  std::string error_;
};

void AppendEscaped(const std::string& text, std::string* out) {
  out->push_back('"');
  for (const char ch : text) {
    switch (ch) {
      case '"':
        out->append("\\\"");
        break;
      case '\\':
        out->append("\\\\");
        break;
      case '\n':
        out->append("\\n");
        break;
      case '\r':
        out->append("\\r");
        break;
      case '\t':
        out->append("\\t");
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char buffer[8];
          std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                        static_cast<unsigned int>(ch));
          out->append(buffer);
        } else {
          out->push_back(ch);
        }
    }
  }
  out->push_back('"');
}

void AppendValue(const JsonValue& value, std::string* out) {
  switch (value.type) {
    case JsonType::kNull:
      out->append("null");
      return;
    case JsonType::kBool:
      out->append(value.bool_value ? "true" : "false");
      return;
    case JsonType::kNumber: {
      if (!std::isfinite(value.number_value)) {
        out->append("null");
        return;
      }
      // %.17g 保证 double 往返无损。
      char buffer[32];
      std::snprintf(buffer, sizeof(buffer), "%.17g", value.number_value);
      out->append(buffer);
      return;
    }
    case JsonType::kString:
      AppendEscaped(value.string_value, out);
      return;
    case JsonType::kArray: {
      out->push_back('[');
      bool first = true;
      for (const auto& item : value.array_value) {
        if (!first) {
          out->push_back(',');
        }
        first = false;
        AppendValue(item, out);
      }
      out->push_back(']');
      return;
    }
    case JsonType::kObject: {
      out->push_back('{');
      bool first = true;
      for (const auto& [key, item] : value.object_value) {
        if (!first) {
          out->push_back(',');
        }
        first = false;
        AppendEscaped(key, out);
        out->push_back(':');
        AppendValue(item, out);
      }
      out->push_back('}');
      return;
    }
  }
}

}  // namespace

bool ParseJson(const std::string& text,
               JsonValue* out_value,
               std::string* out_error) {
  if (out_value == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_value 为空";
    }
    return false;
  }
  JsonValue parsed;
  Reader reader(text);
  if (!reader.ReadDocument(&parsed, out_error)) {
    return false;
  }
  *out_value = std::move(parsed);
  return true;
}

std::string SerializeJson(const JsonValue& value) {
  std::string out;
  AppendValue(value, &out);
  return out;
}

JsonValue MakeJsonNull() { return JsonValue{}; }

JsonValue MakeJsonBool(bool value) {
  JsonValue out;
  out.type = JsonType::kBool;
  out.bool_value = value;
  return out;
}

JsonValue MakeJsonNumber(double value) {
  JsonValue out;
  out.type = JsonType::kNumber;
  out.number_value = value;
  return out;
}

JsonValue MakeJsonString(std::string value) {
  JsonValue out;
  out.type = JsonType::kString;
  out.string_value = std::move(value);
  return out;
}

JsonValue MakeJsonArray() {
  JsonValue out;
  out.type = JsonType::kArray;
  return out;
}

JsonValue MakeJsonObject() {
  JsonValue out;
  out.type = JsonType::kObject;
  return out;
}

const JsonValue* JsonObjectField(const JsonValue* value, const std::string& key) {
  if (value == nullptr || value->type != JsonType::kObject) {
    return nullptr;
  }
  const auto it = value->object_value.find(key);
  if (it == value->object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

std::optional<std::string> JsonAsString(const JsonValue* value) {
  if (value == nullptr || value->type != JsonType::kString) {
    return std::nullopt;
  }
  return value->string_value;
}

std::optional<double> JsonAsNumber(const JsonValue* value) {
  if (value == nullptr || value->type != JsonType::kNumber) {
    return std::nullopt;
  }
  return value->number_value;
}

std::optional<bool> JsonAsBool(const JsonValue* value) {
  if (value == nullptr || value->type != JsonType::kBool) {
    return std::nullopt;
  }
  return value->bool_value;
}

}  // namespace feedback_engine
