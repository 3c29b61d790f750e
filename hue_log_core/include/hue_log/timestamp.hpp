#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace hue_log
{

// RFC 3339：日期、时间、UTC 偏移
inline constexpr std::string_view kRfc3339Layout = "%Y-%m-%dT%H:%M:%S%:z";
inline constexpr std::string_view kRfc3339MicroLayout = "%Y-%m-%dT%H:%M:%S.%f%:z";

uint64_t wall_clock_now_ns();

// 按 strftime 布局格式化 wall_ns 并追加到 out，返回追加的字节数。
// 扩展：%:z 输出 +hh:mm（偏移为 0 时输出 Z），%f 输出 6 位微秒。
size_t append_time_layout(std::string& out, uint64_t wall_ns, std::string_view layout,
                          bool utc = false);

}  // namespace hue_log
