#include "hue_log/ansi.hpp"

namespace hue_log
{

std::string strip_ansi(std::string_view text)
{
  std::string out;
  out.reserve(text.size());

  size_t i = 0;
  while (i < text.size())
  {
    if (text[i] == '\033' && i + 1 < text.size() && text[i + 1] == '[')
    {
      // 参数与中间字节落在 0x20..0x3F，终止字节落在 0x40..0x7E
      size_t j = i + 2;
      while (j < text.size() && text[j] >= 0x20 && text[j] <= 0x3F)
      {
        ++j;
      }
      if (j < text.size() && text[j] >= 0x40 && text[j] <= 0x7E)
      {
        i = j + 1;
        continue;
      }
    }
    out += text[i];
    ++i;
  }
  return out;
}

}  // namespace hue_log
