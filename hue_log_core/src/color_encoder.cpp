#include "hue_log/color_encoder.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <iterator>

#include "hue_log/ansi.hpp"
#include "hue_log/error.hpp"
#include "hue_log/platform.hpp"
#include "hue_log/timestamp.hpp"

namespace hue_log
{

namespace
{

// 最短可往返的定点十进制表示，不使用指数形式
void append_float(std::string& out, double val)
{
  if (std::isnan(val))
  {
    out += "NaN";
    return;
  }
  if (std::isinf(val))
  {
    out += val > 0 ? "+Inf" : "-Inf";
    return;
  }

  // DBL_MAX 的定点形式为 309 位整数
  char buf[400];
  auto result = std::to_chars(buf, buf + sizeof(buf), val, std::chars_format::fixed);
  if (result.ec == std::errc())
  {
    out.append(buf, static_cast<size_t>(result.ptr - buf));
  }
}

bool is_continuation(unsigned char c, unsigned char lo = 0x80, unsigned char hi = 0xBF)
{
  return c >= lo && c <= hi;
}

// 合法 UTF-8 序列的字节长度；非法则返回 0
size_t utf8_sequence_length(std::string_view s, size_t i)
{
  const auto b0 = static_cast<unsigned char>(s[i]);
  const size_t left = s.size() - i;
  auto at = [&](size_t k) { return static_cast<unsigned char>(s[i + k]); };

  if (b0 < 0x80)
  {
    return 1;
  }
  if (b0 >= 0xC2 && b0 <= 0xDF)
  {
    return left >= 2 && is_continuation(at(1)) ? 2 : 0;
  }
  if (b0 >= 0xE0 && b0 <= 0xEF)
  {
    // E0 排除过长编码，ED 排除代理区
    unsigned char lo = b0 == 0xE0 ? 0xA0 : 0x80;
    unsigned char hi = b0 == 0xED ? 0x9F : 0xBF;
    return left >= 3 && is_continuation(at(1), lo, hi) && is_continuation(at(2)) ? 3 : 0;
  }
  if (b0 >= 0xF0 && b0 <= 0xF4)
  {
    unsigned char lo = b0 == 0xF0 ? 0x90 : 0x80;
    unsigned char hi = b0 == 0xF4 ? 0x8F : 0xBF;
    return left >= 4 && is_continuation(at(1), lo, hi) && is_continuation(at(2)) &&
                   is_continuation(at(3))
               ? 4
               : 0;
  }
  return 0;
}

// 按码点计数，每个非法字节计为一个字符
size_t utf8_char_count(std::string_view s)
{
  size_t count = 0;
  size_t i = 0;
  while (i < s.size())
  {
    size_t len = utf8_sequence_length(s, i);
    i += len == 0 ? 1 : len;
    ++count;
  }
  return count;
}

}  // namespace

ColorEncoder::ColorEncoder() : time_format_(kRfc3339Layout), utc_(false), first_nested_(false)
{
  bytes_.reserve(HUE_LOG_INITIAL_BUF_SIZE);
}

EncoderPool& ColorEncoder::Pool()
{
  // 有意不析构：静态对象持有的 EncoderPtr 在退出阶段仍可归还
  static auto* pool = new EncoderPool;
  return *pool;
}

EncoderPtr NewColorEncoder(const std::vector<TextOption>& options)
{
  EncoderOptions opts;
  for (const auto& opt : options)
  {
    if (opt)
    {
      opt(opts);
    }
  }

  EncoderPtr enc = ColorEncoder::Pool().Acquire();
  enc->ApplyOptions(opts);
  return enc;
}

void ColorEncoder::Reset()
{
  bytes_.clear();
  time_format_.assign(kRfc3339Layout.data(), kRfc3339Layout.size());
  utc_ = false;
  first_nested_ = false;
}

void ColorEncoder::ApplyOptions(const EncoderOptions& opts)
{
  time_format_ = opts.time_format;
  utc_ = opts.utc;
}

void ColorEncoder::AddString(std::string_view key, std::string_view val)
{
  AddKey(key);
  bytes_.append(val.data(), val.size());
}

void ColorEncoder::AddBool(std::string_view key, bool val)
{
  AddKey(key);
  bytes_ += val ? "true" : "false";
}

void ColorEncoder::AddInt64(std::string_view key, int64_t val)
{
  AddKey(key);
  fmt::format_to(std::back_inserter(bytes_), "{}", val);
}

void ColorEncoder::AddUint64(std::string_view key, uint64_t val)
{
  AddKey(key);
  fmt::format_to(std::back_inserter(bytes_), "{}", val);
}

void ColorEncoder::AddUintptr(std::string_view key, uintptr_t val)
{
  AddKey(key);
  fmt::format_to(std::back_inserter(bytes_), "0x{:x}", val);
}

void ColorEncoder::AddFloat64(std::string_view key, double val)
{
  AddKey(key);
  append_float(bytes_, val);
}

std::error_code ColorEncoder::AddMarshaler(std::string_view key, ILogMarshaler& obj)
{
  AddKey(key);
  first_nested_ = true;
  bytes_ += '{';
  std::error_code ec = obj.MarshalLog(*this);
  bytes_ += '}';
  first_nested_ = false;
  return ec;
}

EncoderPtr ColorEncoder::Clone() const
{
  EncoderPtr clone = Pool().Acquire();
  clone->bytes_.append(bytes_);
  clone->time_format_ = time_format_;
  clone->utc_ = utc_;
  clone->first_nested_ = first_nested_;
  return clone;
}

std::error_code ColorEncoder::WriteEntry(IByteSink* sink, std::string_view msg, Level level,
                                         uint64_t wall_ns) const
{
  if (sink == nullptr)
  {
    return make_error_code(Errc::InvalidSink);
  }

  // 组装缓冲同样来自对象池，句柄析构时无论成败都会归还
  EncoderPtr final_enc = Pool().Acquire();
  std::string& out = final_enc->bytes_;

  AppendLevel(out, level);
  AppendTime(out, wall_ns);
  AppendMessage(out, msg);

  if (!bytes_.empty())
  {
    out += ' ';
    out.append(bytes_);
  }
  out += '\n';

  std::error_code ec;
  size_t written = sink->Write(out, ec);
  if (ec)
  {
    return ec;
  }
  if (written != out.size())
  {
    return make_error_code(Errc::ShortWrite);
  }
  return {};
}

// 嵌套帧内的第一个键不加前导空格
void ColorEncoder::AddKey(std::string_view key)
{
  if (!bytes_.empty() && !first_nested_)
  {
    bytes_ += ' ';
  }
  else
  {
    first_nested_ = false;
  }

  fmt::format_to(std::back_inserter(bytes_), "\033[3{};1m{}{}=", key_color(key), key,
                 kAnsiReset);
}

void ColorEncoder::AppendLevel(std::string& out, Level level) const
{
  if (!is_known_level(level))
  {
    fmt::format_to(std::back_inserter(out), "{}", static_cast<int>(level));
    return;
  }
  out.append(level_color(level));
  out.append(level_tag(level));
  out.append(kAnsiReset);
}

void ColorEncoder::AppendTime(std::string& out, uint64_t wall_ns) const
{
  if (time_format_.empty())
  {
    return;
  }
  out += ' ';
  append_time_layout(out, wall_ns, time_format_, utc_);
}

void ColorEncoder::AppendMessage(std::string& out, std::string_view msg) const
{
  if (msg.empty())
  {
    return;
  }
  out += ' ';
  out.append(msg.data(), msg.size());

  // 宽度按字符数计，而非显示列宽
  const size_t width = HUE_LOG_MSG_MIN_WIDTH;
  size_t chars = utf8_char_count(msg);
  if (chars < width)
  {
    out.append(width - chars, ' ');
  }
}

}  // namespace hue_log
