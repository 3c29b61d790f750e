#pragma once
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace hue_log
{

class IFieldEmitter;

// 能把自身字段逐个上报给 IFieldEmitter 的嵌套对象
class ILogMarshaler
{
 public:
  virtual ~ILogMarshaler() = default;
  virtual std::error_code MarshalLog(IFieldEmitter& emitter) = 0;
};

namespace detail
{

template <typename T, typename = void>
struct IsOstreamable : std::false_type
{
};

template <typename T>
struct IsOstreamable<T, std::void_t<decltype(std::declval<std::ostream&>()
                                             << std::declval<const T&>())>> : std::true_type
{
};

// 通用字符串化：优先 fmt::formatter（含 fmt/ranges.h 支持的容器），其次 operator<<
template <typename T>
std::string to_display_string(const T& obj)
{
  if constexpr (fmt::is_formattable<T>::value)
  {
    return fmt::format("{}", obj);
  }
  else
  {
    static_assert(IsOstreamable<T>::value,
                  "AddObject requires a fmt::formatter specialization or operator<<");
    return fmt::format("{}", fmt::streamed(obj));
  }
}

}  // namespace detail

class IFieldEmitter
{
 public:
  virtual ~IFieldEmitter() = default;

  virtual void AddString(std::string_view key, std::string_view val) = 0;
  virtual void AddBool(std::string_view key, bool val) = 0;
  virtual void AddInt64(std::string_view key, int64_t val) = 0;
  virtual void AddUint64(std::string_view key, uint64_t val) = 0;
  virtual void AddUintptr(std::string_view key, uintptr_t val) = 0;
  virtual void AddFloat64(std::string_view key, double val) = 0;

  // 嵌套对象：回调返回的错误原样返回
  virtual std::error_code AddMarshaler(std::string_view key, ILogMarshaler& obj) = 0;

  void AddInt(std::string_view key, int val) { AddInt64(key, val); }
  void AddUint(std::string_view key, unsigned val) { AddUint64(key, val); }

  template <typename T>
  std::error_code AddObject(std::string_view key, const T& obj)
  {
    AddString(key, detail::to_display_string(obj));
    return {};
  }
};

}  // namespace hue_log
