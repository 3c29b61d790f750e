#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "encoder_options.hpp"
#include "field_emitter.hpp"
#include "log_level.hpp"
#include "object_pool.hpp"
#include "sinks/sink_interface.hpp"

namespace hue_log
{

class ColorEncoder;

using EncoderPool = ObjectPool<ColorEncoder>;

// 句柄析构时实例自动归还到 ColorEncoder::Pool()
using EncoderPtr = EncoderPool::Handle;

// 默认使用 RFC 3339 本地时间戳
EncoderPtr NewColorEncoder(const std::vector<TextOption>& options = {});

// 面向人阅读的单行文本编码器：
//   [INFO] 2025-02-16T07:50:00Z message                   key=value key2=value2
// 键名按字节和取色，嵌套对象渲染为 key={a=1 b=2}。
// 单个实例不是线程安全的；每条日志应使用各自的实例。
class ColorEncoder : public IFieldEmitter
{
 public:
  // 仅供对象池构造；调用方应使用 NewColorEncoder()
  ColorEncoder();

  // 进程级对象池，字段编码器与整行组装缓冲共用。
  // 池本身永不销毁，静态存储期的 EncoderPtr 可安全地在退出时归还。
  static EncoderPool& Pool();

  void AddString(std::string_view key, std::string_view val) override;
  void AddBool(std::string_view key, bool val) override;
  void AddInt64(std::string_view key, int64_t val) override;
  void AddUint64(std::string_view key, uint64_t val) override;
  void AddUintptr(std::string_view key, uintptr_t val) override;
  void AddFloat64(std::string_view key, double val) override;
  std::error_code AddMarshaler(std::string_view key, ILogMarshaler& obj) override;

  // 从池中取出新实例并复制缓冲区与配置，两者此后互不影响
  EncoderPtr Clone() const;

  // 组装 级别、时间、消息、字段 并一次写入 sink，校验写入字节数。
  // 不会清空或归还本实例的字段缓冲区。
  std::error_code WriteEntry(IByteSink* sink, std::string_view msg, Level level,
                             uint64_t wall_ns) const;

  std::string_view Bytes() const { return bytes_; }
  const std::string& TimeFormat() const { return time_format_; }
  bool UseUtc() const { return utc_; }

  // 对象池复用前调用：清空缓冲区并恢复默认配置
  void Reset();

  static void Free(EncoderPtr& enc) { enc.reset(); }

 private:
  friend EncoderPtr NewColorEncoder(const std::vector<TextOption>& options);

  void AddKey(std::string_view key);
  void ApplyOptions(const EncoderOptions& opts);

  void AppendLevel(std::string& out, Level level) const;
  void AppendTime(std::string& out, uint64_t wall_ns) const;
  void AppendMessage(std::string& out, std::string_view msg) const;

  std::string bytes_;
  std::string time_format_;
  bool utc_;
  bool first_nested_;
};

}  // namespace hue_log
