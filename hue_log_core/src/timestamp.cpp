#include "hue_log/timestamp.hpp"

#include <cstdio>
#include <ctime>

#include "hue_log/platform.hpp"

#if defined(HUE_LOG_PLATFORM_WINDOWS)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <time.h>
#endif

namespace hue_log
{

#if defined(HUE_LOG_PLATFORM_WINDOWS)

uint64_t wall_clock_now_ns()
{
  FILETIME ft;
  GetSystemTimePreciseAsFileTime(&ft);
  uint64_t ticks = (static_cast<uint64_t>(ft.dwHighDateTime) << 32) |
                   static_cast<uint64_t>(ft.dwLowDateTime);
  // FILETIME epoch: 1601-01-01, Unix epoch offset: 11644473600 seconds
  constexpr uint64_t epoch_offset = 11644473600ULL * 10'000'000ULL;
  return (ticks - epoch_offset) * 100ULL;
}

#else

uint64_t wall_clock_now_ns()
{
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<uint64_t>(ts.tv_nsec);
}

#endif

namespace
{

void decompose(time_t sec, bool utc, struct tm& tm_out)
{
#if defined(HUE_LOG_PLATFORM_WINDOWS)
  if (utc)
  {
    gmtime_s(&tm_out, &sec);
  }
  else
  {
    localtime_s(&tm_out, &sec);
  }
#else
  if (utc)
  {
    gmtime_r(&sec, &tm_out);
  }
  else
  {
    localtime_r(&sec, &tm_out);
  }
#endif
}

// 公历日期到 1970-01-01 的天数
int64_t days_from_civil(int64_t y, unsigned m, unsigned d)
{
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

// 分解后的时间与真实 epoch 秒之差即为 UTC 偏移
int64_t utc_offset_seconds(const struct tm& tm_val, time_t sec)
{
  int64_t days = days_from_civil(tm_val.tm_year + 1900LL, static_cast<unsigned>(tm_val.tm_mon + 1),
                                 static_cast<unsigned>(tm_val.tm_mday));
  int64_t as_utc = days * 86400 + tm_val.tm_hour * 3600 + tm_val.tm_min * 60 + tm_val.tm_sec;
  return as_utc - static_cast<int64_t>(sec);
}

void append_offset(std::string& out, int64_t offset)
{
  if (offset == 0)
  {
    out += 'Z';
    return;
  }
  char sign = offset < 0 ? '-' : '+';
  if (offset < 0)
  {
    offset = -offset;
  }
  char tmp[16];
  int n = std::snprintf(tmp, sizeof(tmp), "%c%02d:%02d", sign, static_cast<int>(offset / 3600),
                        static_cast<int>((offset % 3600) / 60));
  if (n > 0)
  {
    out.append(tmp, static_cast<size_t>(n));
  }
}

}  // namespace

size_t append_time_layout(std::string& out, uint64_t wall_ns, std::string_view layout, bool utc)
{
  if (layout.empty())
  {
    return 0;
  }

  time_t sec = static_cast<time_t>(wall_ns / 1'000'000'000ULL);
  uint32_t us = static_cast<uint32_t>((wall_ns % 1'000'000'000ULL) / 1'000ULL);
  struct tm tm_val{};
  decompose(sec, utc, tm_val);

  // 先展开扩展占位符，剩余部分交给 strftime
  std::string expanded;
  expanded.reserve(layout.size() + 16);
  for (size_t i = 0; i < layout.size(); ++i)
  {
    if (layout[i] != '%' || i + 1 >= layout.size())
    {
      expanded += layout[i];
      continue;
    }

    char c = layout[i + 1];
    if (c == 'f')
    {
      char tmp[8];
      int n = std::snprintf(tmp, sizeof(tmp), "%06u", us);
      if (n > 0) expanded.append(tmp, static_cast<size_t>(n));
      ++i;
    }
    else if (c == ':' && i + 2 < layout.size() && layout[i + 2] == 'z')
    {
      append_offset(expanded, utc ? 0 : utc_offset_seconds(tm_val, sec));
      i += 2;
    }
    else
    {
      expanded += '%';
      expanded += c;
      ++i;
    }
  }

  char buf[HUE_LOG_TIME_BUF_SIZE];
  size_t n = std::strftime(buf, sizeof(buf), expanded.c_str(), &tm_val);
  if (n == 0 && !expanded.empty())
  {
    // 结果超出栈缓冲区，或格式本身产生空串
    std::string big(expanded.size() * 8 + HUE_LOG_TIME_BUF_SIZE, '\0');
    n = std::strftime(big.data(), big.size(), expanded.c_str(), &tm_val);
    out.append(big.data(), n);
    return n;
  }
  out.append(buf, n);
  return n;
}

}  // namespace hue_log
