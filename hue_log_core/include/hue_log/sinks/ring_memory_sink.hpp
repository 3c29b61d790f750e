#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "sink_interface.hpp"

namespace hue_log
{

// 仅保留最近 capacity 行，供调试转储与测试断言
class RingMemorySink : public IByteSink
{
 public:
  explicit RingMemorySink(size_t capacity = 1024);

  size_t Write(std::string_view bytes, std::error_code& ec) override;
  void Flush() override;

  bool DumpToFile(const char* path) const;

  size_t Size() const;

  // 0 为最旧的一行
  const std::string& At(size_t index) const;

 private:
  std::vector<std::string> buffer_;
  size_t capacity_;
  size_t head_;
  size_t count_;
};

}  // namespace hue_log
