#pragma once
#include <functional>
#include <string>
#include <string_view>

#include "timestamp.hpp"

namespace hue_log
{

struct EncoderOptions
{
  std::string time_format{kRfc3339Layout};
  bool utc = false;
};

// 构造时按顺序应用的选项
using TextOption = std::function<void(EncoderOptions&)>;

// 设置时间戳布局（strftime 语法，见 timestamp.hpp）；空串表示不输出时间
TextOption TextTimeFormat(std::string_view layout);

// 等价于 TextTimeFormat("")
TextOption TextNoTime();

// 以 UTC 而非本地时区格式化时间戳
TextOption TextUtcTime();

}  // namespace hue_log
