#pragma once

#include <string_view>
#include <system_error>

#include <fmt/format.h>

namespace mvfmt {

enum class errc : int {
  insufficient_buffer = 1,
  invalid_stride,
  capacity_exceeded,
  region_out_of_bounds,
  unknown_pixel_format
};

const std::error_category& mvfmt_category() noexcept;

std::error_code make_error_code(errc c) noexcept;

} // namespace mvfmt

namespace std {
template <>
struct is_error_code_enum<mvfmt::errc> : std::true_type {};
} // namespace std

template <>
struct fmt::formatter<mvfmt::errc> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(mvfmt::errc ec, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(make_error_code(ec).message(), ctx);
  }
};
