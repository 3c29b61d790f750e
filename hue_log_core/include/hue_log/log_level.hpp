#pragma once
#include <cstdint>
#include <string_view>

namespace hue_log
{

// 数值与宿主框架保持一致；枚举之外的任意 int8_t 值视为原始数值级别
enum class Level : int8_t
{
  Debug = -1,
  Info = 0,
  Warn = 1,
  Error = 2,
  Panic = 3,
  Fatal = 4
};

constexpr std::string_view to_string(Level level)
{
  switch (level)
  {
    case Level::Debug: return "DEBUG";
    case Level::Info:  return "INFO";
    case Level::Warn:  return "WARN";
    case Level::Error: return "ERROR";
    case Level::Panic: return "PANIC";
    case Level::Fatal: return "FATAL";
  }
  return "UNKNOWN";
}

// 固定 6 字符的方括号缩写；未知级别返回空串
constexpr std::string_view level_tag(Level level)
{
  switch (level)
  {
    case Level::Debug: return "[DEBG]";
    case Level::Info:  return "[INFO]";
    case Level::Warn:  return "[WARN]";
    case Level::Error: return "[ERRO]";
    case Level::Panic: return "[PANC]";
    case Level::Fatal: return "[FATA]";
  }
  return "";
}

constexpr std::string_view level_color(Level level)
{
  switch (level)
  {
    case Level::Debug: return "\033[32;1m";
    case Level::Info:  return "\033[34;1m";
    case Level::Warn:  return "\033[33;1m";
    case Level::Error:
    case Level::Panic:
    case Level::Fatal: return "\033[31;1m";
  }
  return "";
}

constexpr bool is_known_level(Level level) { return !level_tag(level).empty(); }

}  // namespace hue_log
