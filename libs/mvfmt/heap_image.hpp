#pragma once

#if !defined(MVFMT_ENABLE_HEAP)
#error "heap_image requires the heap or full mvfmt build profile"
#endif

#include <cstddef>
#include <expected>
#include <limits>
#include <new>
#include <span>
#include <utility>
#include <vector>

#include <libs/mvfmt/errc.hpp>
#include <libs/mvfmt/image_data.hpp>
#include <libs/mvfmt/layout.hpp>
#include <libs/mvfmt/pixel_fmt.hpp>

namespace mvfmt {

template <pixel_format F>
class heap_image : public image_base<heap_image<F>, F> {
public:
  static std::expected<heap_image, errc> zeros(extent sz, size_t stride) {
    const auto requested = detail::checked_mul(stride, sz.height);
    auto geometry = layout<F>::make(sz, stride, requested.value_or(std::numeric_limits<size_t>::max()));
    if (!geometry) {
      // a valid stride fits into stride * height unless that overflows
      if (geometry.error() == errc::insufficient_buffer)
        throw std::bad_array_new_length{};
      return std::unexpected{geometry.error()};
    }
    return heap_image{*geometry, allocate(*geometry)};
  }

  static std::expected<heap_image, errc> adopt(extent sz, size_t stride, std::vector<std::byte>&& buf) {
    auto geometry = layout<F>::make(sz, stride, buf.size());
    if (!geometry)
      return std::unexpected{geometry.error()};
    return heap_image{*geometry, std::move(buf)};
  }

  template <validated_image I>
    requires std::same_as<typename I::format_type, F>
  static heap_image copy_from(const I& src) {
    heap_image res{src.geometry(), allocate(src.geometry())};
    detail::copy_rows(src, res);
    return res;
  }

  // foreign images are revalidated against their bytes
  template <image_of<F> I>
    requires(!validated_image<I>)
  static std::expected<heap_image, errc> copy_from(const I& src) {
    return layout<F>::make(extent{src.width(), src.height()}, src.stride(), src.bytes().size())
        .transform([&src](layout<F> geometry) {
          heap_image res{geometry, allocate(geometry)};
          detail::copy_rows(src, res);
          return res;
        });
  }

  std::span<const std::byte> bytes() const noexcept { return buf_; }
  std::span<std::byte> bytes_mut() noexcept { return buf_; }

  std::span<std::byte> row_bytes_mut(size_t row) noexcept { return this->layout_.row(bytes_mut(), row); }

protected:
  heap_image(layout<F> geometry, std::vector<std::byte> buf) noexcept
      : image_base<heap_image<F>, F>{geometry}, buf_{std::move(buf)} {}

  static std::vector<std::byte> allocate(const layout<F>& geometry) {
    const auto sz = detail::storage_size(geometry);
    if (!sz)
      throw std::bad_array_new_length{};
    detail::log_allocation(F::value, geometry.size(), geometry.stride(), *sz);
    return std::vector<std::byte>(*sz);
  }

protected:
  std::vector<std::byte> buf_;
};

} // namespace mvfmt
