#include "hue_log/encoder_options.hpp"

namespace hue_log
{

TextOption TextTimeFormat(std::string_view layout)
{
  return [layout = std::string(layout)](EncoderOptions& opts) { opts.time_format = layout; };
}

TextOption TextNoTime() { return TextTimeFormat(""); }

TextOption TextUtcTime()
{
  return [](EncoderOptions& opts) { opts.utc = true; };
}

}  // namespace hue_log
