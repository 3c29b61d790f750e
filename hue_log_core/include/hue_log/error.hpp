#pragma once
#include <system_error>
#include <type_traits>

namespace hue_log
{

enum class Errc : int
{
  InvalidSink = 1,
  ShortWrite = 2
};

const std::error_category& error_category() noexcept;

std::error_code make_error_code(Errc e) noexcept;

}  // namespace hue_log

namespace std
{

template <>
struct is_error_code_enum<hue_log::Errc> : true_type
{
};

}  // namespace std
