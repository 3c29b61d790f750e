#include "hue_log/sinks/callback_sink.hpp"

namespace hue_log
{

CallbackSink::CallbackSink(Callback cb) : callback_(std::move(cb)) {}

size_t CallbackSink::Write(std::string_view bytes, std::error_code& /*ec*/)
{
  if (callback_)
  {
    callback_(bytes);
  }
  return bytes.size();
}

void CallbackSink::Flush() {}

}  // namespace hue_log
