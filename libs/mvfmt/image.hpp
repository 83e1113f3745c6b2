#pragma once

#if !defined(MVFMT_ENABLE_STD)
#error "image requires the full mvfmt build profile"
#endif

#include <cstddef>
#include <expected>
#include <utility>
#include <vector>

#include <libs/mvfmt/errc.hpp>
#include <libs/mvfmt/fixed_image.hpp>
#include <libs/mvfmt/heap_image.hpp>
#include <libs/mvfmt/image_data.hpp>
#include <libs/mvfmt/pixel_fmt.hpp>

namespace mvfmt {

template <pixel_format F>
class image : public heap_image<F> {
public:
  image(heap_image<F>&& other) noexcept : heap_image<F>{std::move(other)} {}

  static std::expected<image, errc> zeros(extent sz, size_t stride) {
    return heap_image<F>::zeros(sz, stride).transform(to_image);
  }

  static std::expected<image, errc> adopt(extent sz, size_t stride, std::vector<std::byte>&& buf) {
    return heap_image<F>::adopt(sz, stride, std::move(buf)).transform(to_image);
  }

  template <validated_image I>
    requires std::same_as<typename I::format_type, F>
  static image copy_from(const I& src) {
    return heap_image<F>::copy_from(src);
  }

  template <image_of<F> I>
    requires(!validated_image<I>)
  static std::expected<image, errc> copy_from(const I& src) {
    return heap_image<F>::copy_from(src).transform(to_image);
  }

  std::vector<std::byte> into_bytes() && noexcept { return std::move(this->buf_); }

  heap_image<F> to_heap() && noexcept { return std::move(static_cast<heap_image<F>&>(*this)); }

  template <size_t Capacity>
  std::expected<fixed_image<F, Capacity>, errc> to_fixed() const {
    return fixed_image<F, Capacity>::copy_from(*this);
  }

private:
  static image to_image(heap_image<F>&& img) noexcept { return image{std::move(img)}; }
};

} // namespace mvfmt
