#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace hue_log
{

inline constexpr std::string_view kAnsiReset = "\033[0m";

// 键名调色板大小：ESC[31m .. ESC[37m
inline constexpr int kKeyPaletteSize = 7;

// 键名颜色 = 字节和 % 7 + 1，结果在 [1, 7]
constexpr int key_color(std::string_view key)
{
  uint64_t sum = 0;
  for (char c : key)
  {
    sum += static_cast<unsigned char>(c);
  }
  return static_cast<int>(sum % kKeyPaletteSize) + 1;
}

// 去掉 CSI 转义序列（ESC '[' ... 终止字节），用于不支持颜色的终端
std::string strip_ansi(std::string_view text);

}  // namespace hue_log
