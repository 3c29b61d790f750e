#include "hue_log/sinks/ring_memory_sink.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace hue_log
{

RingMemorySink::RingMemorySink(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity), head_(0), count_(0)
{
  buffer_.resize(capacity_);
}

size_t RingMemorySink::Write(std::string_view bytes, std::error_code& /*ec*/)
{
  buffer_[head_].assign(bytes.data(), bytes.size());
  head_ = (head_ + 1) % capacity_;
  if (count_ < capacity_)
  {
    ++count_;
  }
  return bytes.size();
}

void RingMemorySink::Flush() {}

bool RingMemorySink::DumpToFile(const char* path) const
{
  int fd = ::open(path, O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0)
  {
    std::fprintf(stderr, "RingMemorySink: failed to open '%s': %s\n", path,
                 std::strerror(errno));
    return false;
  }

  bool ok = true;
  for (size_t i = 0; i < count_ && ok; ++i)
  {
    const std::string& line = At(i);
    size_t off = 0;
    while (off < line.size())
    {
      ssize_t n = ::write(fd, line.data() + off, line.size() - off);
      if (n < 0)
      {
        if (errno == EINTR)
        {
          continue;
        }
        std::fprintf(stderr, "RingMemorySink: write to '%s' failed: %s\n", path,
                     std::strerror(errno));
        ok = false;
        break;
      }
      off += static_cast<size_t>(n);
    }
  }

  ::close(fd);
  return ok;
}

size_t RingMemorySink::Size() const { return count_; }

const std::string& RingMemorySink::At(size_t index) const
{
  size_t start = (count_ < capacity_) ? 0 : head_;
  return buffer_[(start + index) % capacity_];
}

}  // namespace hue_log
