#pragma once
#include <cstdint>
#include <cstdio>
#include <optional>

#include "sink_interface.hpp"

namespace hue_log
{

class ConsoleSink : public IByteSink
{
 public:
  enum class Stream : uint8_t
  {
    Stdout,
    Stderr
  };

  explicit ConsoleSink(Stream stream = Stream::Stdout,
                       std::optional<bool> force_color = std::nullopt);

  size_t Write(std::string_view bytes, std::error_code& ec) override;
  void Flush() override;

  bool UseColor() const { return use_color_; }
  bool IsTty() const { return is_tty_; }

 private:
  FILE* target_;
  bool use_color_;
  bool is_tty_;
};

}  // namespace hue_log
