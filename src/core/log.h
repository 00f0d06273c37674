#pragma once

#include <string>
#include <string_view>

namespace feedback_engine {

/**
 * @brief 输出 INFO 级日志
 *
 * 线程安全串行写入 `stdout`，自动附加本地时间戳和 `[INFO]` 前缀。
 */
void LogInfo(std::string_view message);

/// 输出 WARN 级日志（`stderr`），用于可恢复的降级路径。
void LogWarn(std::string_view message);

/**
 * @brief 输出 ERROR 级日志
 *
 * 线程安全串行写入 `stderr`，自动附加本地时间戳和 `[ERROR]` 前缀。
 */
void LogError(std::string_view message);

}  // namespace feedback_engine
