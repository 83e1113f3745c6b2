#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include <fmt/format.h>

#include <libs/mvfmt/layout.hpp>
#include <libs/mvfmt/pixel_fmt.hpp>

namespace mvfmt {

template <typename I>
concept image_data = requires(const I& img, size_t row) {
  typename I::format_type;
  requires pixel_format<typename I::format_type>;
  { img.format() } -> std::same_as<pix_fmt>;
  { img.width() } -> std::same_as<uint32_t>;
  { img.height() } -> std::same_as<uint32_t>;
  { img.stride() } -> std::same_as<size_t>;
  { img.bytes() } -> std::same_as<std::span<const std::byte>>;
  { img.row_bytes(row) } -> std::same_as<std::span<const std::byte>>;
};

template <typename I>
concept image_mut_data = image_data<I> && requires(I& img, size_t row) {
  { img.bytes_mut() } -> std::same_as<std::span<std::byte>>;
  { img.row_bytes_mut(row) } -> std::same_as<std::span<std::byte>>;
};

template <typename I, typename F>
concept image_of = image_data<I> && std::same_as<typename I::format_type, F>;

template <typename I>
concept validated_image = image_data<I> && requires(const I& img) {
  { img.geometry() } -> std::same_as<const layout<typename I::format_type>&>;
};

template <typename I>
inline constexpr bool enable_borrowed_image = false;

template <typename I>
concept borrowed_image = image_data<I> && enable_borrowed_image<I>;

template <typename Derived, pixel_format F>
class image_base {
public:
  using format_type = F;

  static constexpr pix_fmt format() noexcept { return F::value; }

  extent size() const noexcept { return layout_.size(); }
  uint32_t width() const noexcept { return layout_.width(); }
  uint32_t height() const noexcept { return layout_.height(); }
  size_t stride() const noexcept { return layout_.stride(); }

  const layout<F>& geometry() const noexcept { return layout_; }

  std::span<const std::byte> row_bytes(size_t row) const noexcept {
    return layout_.row(static_cast<const Derived&>(*this).bytes(), row);
  }

protected:
  explicit image_base(layout<F> geometry) noexcept : layout_{geometry} {}

protected:
  layout<F> layout_;
};

namespace detail {

template <pixel_format F>
std::optional<size_t> storage_size(const layout<F>& geometry) noexcept {
  return checked_mul(geometry.stride(), geometry.height());
}

void log_allocation(pix_fmt fmt, extent sz, size_t stride, size_t bytes);

template <image_data Src, image_mut_data Dst>
void copy_rows(const Src& src, Dst& dst) noexcept {
  for (size_t row = 0; row < src.height(); ++row)
    std::ranges::copy(src.row_bytes(row), dst.row_bytes_mut(row).begin());
}

} // namespace detail

} // namespace mvfmt

template <mvfmt::image_data I>
struct fmt::formatter<I> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const I& img, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{} image {}x{} stride {}", img.format(), img.width(), img.height(),
        img.stride());
  }
};
