#pragma once
#include <cstddef>
#include <string_view>
#include <system_error>

namespace hue_log
{

class IByteSink
{
 public:
  virtual ~IByteSink() = default;

  // 写入一整行；返回实际接受的字节数，失败时设置 ec
  virtual size_t Write(std::string_view bytes, std::error_code& ec) = 0;

  // 刷新缓冲区
  virtual void Flush() = 0;
};

}  // namespace hue_log
