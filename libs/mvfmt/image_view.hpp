#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>

#include <libs/mvfmt/errc.hpp>
#include <libs/mvfmt/image_data.hpp>
#include <libs/mvfmt/layout.hpp>
#include <libs/mvfmt/pixel_fmt.hpp>

namespace mvfmt {

namespace detail {

template <pixel_format F>
std::expected<size_t, errc> region_offset(const layout<F>& parent, uint32_t x, uint32_t y, extent sz) {
  if (x > parent.width() || sz.width > parent.width() - x || y > parent.height() ||
      sz.height > parent.height() - y) {
    log_region_rejection(F::value, parent.size(), x, y, sz);
    return std::unexpected{errc::region_out_of_bounds};
  }
  if (sz.height == 0)
    return 0;
  return y * parent.stride() + size_t{x} * F::bytes_per_pixel;
}

} // namespace detail

template <pixel_format F>
class mut_image_view;

/// Like std::span the view does not extend the lifetime of its memory: the
/// bytes must outlive the view and anything obtained from it.
template <pixel_format F>
class image_view : public image_base<image_view<F>, F> {
public:
  static std::expected<image_view, errc> make(extent sz, size_t stride, std::span<const std::byte> buf) {
    return layout<F>::make(sz, stride, buf.size()).transform([buf](layout<F> geometry) {
      return image_view{geometry, buf};
    });
  }

  template <validated_image I>
    requires std::same_as<typename I::format_type, F>
  static image_view of(const I& img) noexcept {
    return image_view{img.geometry(), img.bytes()};
  }

  template <validated_image I>
    requires(!borrowed_image<I> && std::same_as<typename I::format_type, F>)
  static image_view of(const I&&) = delete;

  std::span<const std::byte> bytes() const noexcept { return buf_; }

  std::expected<image_view, errc> crop(uint32_t x, uint32_t y, extent sz) const {
    return detail::region_offset(this->layout_, x, y, sz).and_then([&](size_t offset) {
      return make(sz, this->stride(), buf_.subspan(offset));
    });
  }

private:
  image_view(layout<F> geometry, std::span<const std::byte> buf) noexcept
      : image_base<image_view<F>, F>{geometry}, buf_{buf} {}

private:
  std::span<const std::byte> buf_;
};

template <pixel_format F>
class mut_image_view : public image_base<mut_image_view<F>, F> {
public:
  static std::expected<mut_image_view, errc> make(extent sz, size_t stride, std::span<std::byte> buf) {
    return layout<F>::make(sz, stride, buf.size()).transform([buf](layout<F> geometry) {
      return mut_image_view{geometry, buf};
    });
  }

  template <validated_image I>
    requires image_mut_data<I> && std::same_as<typename I::format_type, F>
  static mut_image_view of(I& img) noexcept {
    return mut_image_view{img.geometry(), img.bytes_mut()};
  }

  std::span<const std::byte> bytes() const noexcept { return buf_; }
  std::span<std::byte> bytes_mut() noexcept { return buf_; }

  std::span<std::byte> row_bytes_mut(size_t row) noexcept { return this->layout_.row(buf_, row); }

  std::expected<mut_image_view, errc> crop(uint32_t x, uint32_t y, extent sz) {
    return detail::region_offset(this->layout_, x, y, sz).and_then([&](size_t offset) {
      return make(sz, this->stride(), buf_.subspan(offset));
    });
  }

  operator image_view<F>() const noexcept { return image_view<F>::of(*this); }

private:
  mut_image_view(layout<F> geometry, std::span<std::byte> buf) noexcept
      : image_base<mut_image_view<F>, F>{geometry}, buf_{buf} {}

private:
  std::span<std::byte> buf_;
};

template <pixel_format F>
inline constexpr bool enable_borrowed_image<image_view<F>> = true;

template <pixel_format F>
inline constexpr bool enable_borrowed_image<mut_image_view<F>> = true;

template <validated_image I>
image_view<typename I::format_type> view(const I& img) noexcept {
  return image_view<typename I::format_type>::of(img);
}

template <validated_image I>
  requires(!borrowed_image<I>)
void view(const I&&) = delete;

template <validated_image I>
  requires image_mut_data<I>
mut_image_view<typename I::format_type> view_mut(I& img) noexcept {
  return mut_image_view<typename I::format_type>::of(img);
}

} // namespace mvfmt
