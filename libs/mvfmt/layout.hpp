#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <span>

#include <fmt/format.h>

#include <libs/mvfmt/errc.hpp>
#include <libs/mvfmt/pixel_fmt.hpp>

namespace mvfmt {

struct extent {
  uint32_t width = 0;
  uint32_t height = 0;

  constexpr bool empty() const noexcept { return width == 0 || height == 0; }

  constexpr bool operator==(const extent&) const noexcept = default;
};

namespace detail {

constexpr std::optional<size_t> checked_mul(size_t l, size_t r) noexcept {
  if (l != 0 && r > std::numeric_limits<size_t>::max() / l)
    return std::nullopt;
  return l * r;
}

constexpr std::optional<size_t> checked_add(size_t l, size_t r) noexcept {
  if (r > std::numeric_limits<size_t>::max() - l)
    return std::nullopt;
  return l + r;
}

void log_rejection(pix_fmt fmt, extent sz, size_t stride, size_t buffer_len, errc ec);
void log_region_rejection(pix_fmt fmt, extent parent, uint32_t x, uint32_t y, extent sz);

} // namespace detail

constexpr std::optional<size_t> min_row_bytes(pix_fmt fmt, uint32_t width) noexcept {
  return detail::checked_mul(width, bytes_per_pixel(fmt));
}

template <pixel_format F>
constexpr std::optional<size_t> min_row_bytes(uint32_t width) noexcept {
  return detail::checked_mul(width, F::bytes_per_pixel);
}

// the last row needs no stride padding
constexpr std::optional<size_t> min_buffer_size(pix_fmt fmt, extent sz, size_t stride) noexcept {
  if (sz.height == 0)
    return 0;
  const auto row = min_row_bytes(fmt, sz.width);
  if (!row)
    return std::nullopt;
  const auto leading = detail::checked_mul(stride, sz.height - 1);
  if (!leading)
    return std::nullopt;
  return detail::checked_add(*leading, *row);
}

template <pixel_format F>
constexpr std::optional<size_t> min_buffer_size(extent sz, size_t stride) noexcept {
  return min_buffer_size(F::value, sz, stride);
}

constexpr std::expected<void, errc> validate(
    pix_fmt fmt, extent sz, size_t stride, size_t buffer_len) noexcept {
  const auto row = min_row_bytes(fmt, sz.width);
  if (!row || stride < *row)
    return std::unexpected{errc::invalid_stride};
  const auto required = min_buffer_size(fmt, sz, stride);
  if (!required || buffer_len < *required)
    return std::unexpected{errc::insufficient_buffer};
  return {};
}

template <pixel_format F>
constexpr std::expected<void, errc> validate(extent sz, size_t stride, size_t buffer_len) noexcept {
  return validate(F::value, sz, stride, buffer_len);
}

template <pixel_format F>
class layout {
public:
  using format_type = F;

  static std::expected<layout, errc> make(extent sz, size_t stride, size_t buffer_len) {
    if (auto res = validate<F>(sz, stride, buffer_len); !res) {
      detail::log_rejection(F::value, sz, stride, buffer_len, res.error());
      return std::unexpected{res.error()};
    }
    return layout{sz, stride};
  }

  constexpr extent size() const noexcept { return sz_; }
  constexpr uint32_t width() const noexcept { return sz_.width; }
  constexpr uint32_t height() const noexcept { return sz_.height; }
  constexpr size_t stride() const noexcept { return stride_; }

  constexpr size_t row_len() const noexcept { return size_t{sz_.width} * F::bytes_per_pixel; }

  /// Precondition: `idx < height()` and `buf` is the buffer this layout was
  /// validated against. Checked by assert in debug builds only.
  template <typename Byte>
  constexpr std::span<Byte> row(std::span<Byte> buf, size_t idx) const noexcept {
    assert(idx < sz_.height);
    return buf.subspan(idx * stride_, row_len());
  }

  constexpr bool operator==(const layout&) const noexcept = default;

private:
  constexpr layout(extent sz, size_t stride) noexcept : sz_{sz}, stride_{stride} {}

private:
  extent sz_;
  size_t stride_ = 0;
};

} // namespace mvfmt

template <>
struct fmt::formatter<mvfmt::extent> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(mvfmt::extent sz, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}x{}", sz.width, sz.height);
  }
};
