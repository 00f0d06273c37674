#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace feedback_engine {

/// JSON AST 节点类型。
enum class JsonType {
  kNull,
  kBool,
  kNumber,
  kString,
  kArray,
  kObject,
};

/**
 * @brief 轻量 JSON 值
 *
 * 对象使用有序 map，序列化输出的键顺序稳定（持久化文件可 diff）。
 */
struct JsonValue {
  JsonType type{JsonType::kNull};
  bool bool_value{false};
  double number_value{0.0};
  std::string string_value;
  std::vector<JsonValue> array_value;
  std::map<std::string, JsonValue> object_value;
};

/**
 * @brief JSON 解析入口
 *
 * @param text 原始 JSON 文本
 * @param out_value 解析结果
 * @param out_error 失败原因（可选输出，包含出错偏移）
 */
bool ParseJson(const std::string& text,
               JsonValue* out_value,
               std::string* out_error);

/// 紧凑序列化；非有限数值输出为 null。
std::string SerializeJson(const JsonValue& value);

/// 构造工具。
JsonValue MakeJsonNull();
JsonValue MakeJsonBool(bool value);
JsonValue MakeJsonNumber(double value);
JsonValue MakeJsonString(std::string value);
JsonValue MakeJsonArray();
JsonValue MakeJsonObject();

/// 字段不存在或类型不符时返回 `nullptr`，不抛异常。
const JsonValue* JsonObjectField(const JsonValue* value, const std::string& key);

std::optional<std::string> JsonAsString(const JsonValue* value);
std::optional<double> JsonAsNumber(const JsonValue* value);
std::optional<bool> JsonAsBool(const JsonValue* value);

}  // namespace feedback_engine
