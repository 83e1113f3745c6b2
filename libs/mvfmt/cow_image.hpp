#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <variant>

#include <libs/mvfmt/image.hpp>
#include <libs/mvfmt/image_data.hpp>
#include <libs/mvfmt/image_view.hpp>
#include <libs/mvfmt/layout.hpp>

namespace mvfmt {

template <pixel_format F>
class cow_image {
public:
  using format_type = F;

  cow_image(image_view<F> borrowed) noexcept : img_{borrowed} {}
  cow_image(image<F>&& owned) noexcept : img_{std::move(owned)} {}

  static constexpr pix_fmt format() noexcept { return F::value; }

  bool is_borrowed() const noexcept { return std::holds_alternative<image_view<F>>(img_); }

  const layout<F>& geometry() const noexcept {
    return std::visit([](const auto& img) -> const layout<F>& { return img.geometry(); }, img_);
  }

  extent size() const noexcept { return geometry().size(); }
  uint32_t width() const noexcept { return geometry().width(); }
  uint32_t height() const noexcept { return geometry().height(); }
  size_t stride() const noexcept { return geometry().stride(); }

  std::span<const std::byte> bytes() const noexcept {
    return std::visit([](const auto& img) { return img.bytes(); }, img_);
  }

  std::span<const std::byte> row_bytes(size_t row) const noexcept { return geometry().row(bytes(), row); }

  image<F> into_owned() && {
    if (auto* borrowed = std::get_if<image_view<F>>(&img_))
      return image<F>::copy_from(*borrowed);
    return std::get<image<F>>(std::move(img_));
  }

private:
  std::variant<image_view<F>, image<F>> img_;
};

} // namespace mvfmt
