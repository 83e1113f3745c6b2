#pragma once

#include <array>
#include <cstddef>
#include <expected>
#include <limits>
#include <span>
#include <utility>

#include <libs/mvfmt/errc.hpp>
#include <libs/mvfmt/image_data.hpp>
#include <libs/mvfmt/layout.hpp>
#include <libs/mvfmt/pixel_fmt.hpp>

namespace mvfmt {

template <pixel_format F, size_t Capacity>
class fixed_image : public image_base<fixed_image<F, Capacity>, F> {
public:
  static constexpr size_t capacity = Capacity;

  static std::expected<fixed_image, errc> make(extent sz, size_t stride) {
    const auto used = detail::checked_mul(stride, sz.height);
    if (!used || *used > Capacity) {
      // a bad stride is reported even when the image would not fit anyway
      const auto res = validate<F>(sz, stride, std::numeric_limits<size_t>::max());
      const errc ec = !res && res.error() == errc::invalid_stride ? errc::invalid_stride
                                                                  : errc::capacity_exceeded;
      detail::log_rejection(F::value, sz, stride, Capacity, ec);
      return std::unexpected{ec};
    }
    return layout<F>::make(sz, stride, *used).transform([&](layout<F> geometry) {
      return fixed_image{geometry, *used};
    });
  }

  template <image_of<F> I>
  static std::expected<fixed_image, errc> copy_from(const I& src) {
    return make(extent{src.width(), src.height()}, src.stride()).transform([&src](fixed_image&& res) {
      detail::copy_rows(src, res);
      return std::move(res);
    });
  }

  std::span<const std::byte> bytes() const noexcept { return std::span{storage_}.first(used_); }
  std::span<std::byte> bytes_mut() noexcept { return std::span{storage_}.first(used_); }

  std::span<std::byte> row_bytes_mut(size_t row) noexcept { return this->layout_.row(bytes_mut(), row); }

private:
  fixed_image(layout<F> geometry, size_t used) noexcept
      : image_base<fixed_image<F, Capacity>, F>{geometry}, used_{used} {}

private:
  std::array<std::byte, Capacity> storage_{};
  size_t used_ = 0;
};

} // namespace mvfmt
