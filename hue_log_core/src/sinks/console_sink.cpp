#include "hue_log/sinks/console_sink.hpp"

#include <cerrno>
#include <string>

#include "hue_log/ansi.hpp"
#include "hue_log/platform.hpp"

#if defined(HUE_LOG_PLATFORM_LINUX) || defined(HUE_LOG_PLATFORM_MACOS)
#include <unistd.h>
#elif defined(HUE_LOG_PLATFORM_WINDOWS)
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#endif

namespace hue_log
{

ConsoleSink::ConsoleSink(Stream stream, std::optional<bool> force_color)
    : target_(stream == Stream::Stderr ? stderr : stdout)
{
  is_tty_ = ::isatty(::fileno(target_)) != 0;

  if (force_color.has_value())
  {
    use_color_ = force_color.value();
  }
  else
  {
    use_color_ = is_tty_;
  }
}

size_t ConsoleSink::Write(std::string_view bytes, std::error_code& ec)
{
  if (use_color_)
  {
    size_t written = std::fwrite(bytes.data(), 1, bytes.size(), target_);
    if (written != bytes.size() && std::ferror(target_))
    {
      ec = std::error_code(errno, std::generic_category());
    }
    return written;
  }

  // 非彩色终端：去掉转义序列后写出，完整写出时按原始长度汇报
  std::string plain = strip_ansi(bytes);
  size_t written = std::fwrite(plain.data(), 1, plain.size(), target_);
  if (written != plain.size())
  {
    if (std::ferror(target_))
    {
      ec = std::error_code(errno, std::generic_category());
    }
    return written;
  }
  return bytes.size();
}

void ConsoleSink::Flush() { std::fflush(target_); }

}  // namespace hue_log
