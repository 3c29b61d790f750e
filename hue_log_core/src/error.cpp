#include "hue_log/error.hpp"

#include <string>

namespace hue_log
{

namespace
{

class HueLogErrorCategory : public std::error_category
{
 public:
  const char* name() const noexcept override { return "hue_log"; }

  std::string message(int ev) const override
  {
    switch (static_cast<Errc>(ev))
    {
      case Errc::InvalidSink:
        return "invalid sink: sink is null";
      case Errc::ShortWrite:
        return "incomplete write: sink accepted fewer bytes than the line length";
    }
    return "unknown hue_log error";
  }
};

}  // namespace

const std::error_category& error_category() noexcept
{
  static HueLogErrorCategory category;
  return category;
}

std::error_code make_error_code(Errc e) noexcept
{
  return {static_cast<int>(e), error_category()};
}

}  // namespace hue_log
