#pragma once
#include <functional>

#include "sink_interface.hpp"

namespace hue_log
{

class CallbackSink : public IByteSink
{
 public:
  using Callback = std::function<void(std::string_view line)>;

  explicit CallbackSink(Callback cb);

  size_t Write(std::string_view bytes, std::error_code& ec) override;
  void Flush() override;

 private:
  Callback callback_;
};

}  // namespace hue_log
