#pragma once

#include <compare>
#include <cstddef>
#include <iterator>
#include <ranges>
#include <span>

#include <libs/mvfmt/image_data.hpp>
#include <libs/mvfmt/pixel_fmt.hpp>

namespace mvfmt {

// Chunk addresses are computed from the index so no pointer past the last row
// is ever formed.
template <typename Byte, size_t Extent = std::dynamic_extent>
class strided_iterator {
public:
  using value_type = std::span<Byte, Extent>;
  using difference_type = std::ptrdiff_t;
  using iterator_concept = std::random_access_iterator_tag;

  strided_iterator() noexcept = default;
  strided_iterator(Byte* base, size_t step, size_t len, difference_type idx) noexcept
      : base_{base}, step_{step}, len_{len}, idx_{idx} {}

  value_type operator*() const noexcept { return value_type{base_ + static_cast<size_t>(idx_) * step_, len_}; }
  value_type operator[](difference_type n) const noexcept { return *(*this + n); }

  strided_iterator& operator++() noexcept {
    ++idx_;
    return *this;
  }
  strided_iterator operator++(int) noexcept {
    auto res = *this;
    ++idx_;
    return res;
  }
  strided_iterator& operator--() noexcept {
    --idx_;
    return *this;
  }
  strided_iterator operator--(int) noexcept {
    auto res = *this;
    --idx_;
    return res;
  }

  strided_iterator& operator+=(difference_type n) noexcept {
    idx_ += n;
    return *this;
  }
  strided_iterator& operator-=(difference_type n) noexcept {
    idx_ -= n;
    return *this;
  }

  friend strided_iterator operator+(strided_iterator it, difference_type n) noexcept { return it += n; }
  friend strided_iterator operator+(difference_type n, strided_iterator it) noexcept { return it += n; }
  friend strided_iterator operator-(strided_iterator it, difference_type n) noexcept { return it -= n; }
  friend difference_type operator-(const strided_iterator& l, const strided_iterator& r) noexcept {
    return l.idx_ - r.idx_;
  }

  friend bool operator==(const strided_iterator& l, const strided_iterator& r) noexcept {
    return l.idx_ == r.idx_;
  }
  friend std::strong_ordering operator<=>(const strided_iterator& l, const strided_iterator& r) noexcept {
    return l.idx_ <=> r.idx_;
  }

private:
  Byte* base_ = nullptr;
  size_t step_ = 0;
  size_t len_ = 0;
  difference_type idx_ = 0;
};

template <typename Byte, size_t Extent = std::dynamic_extent>
class strided_range : public std::ranges::view_interface<strided_range<Byte, Extent>> {
public:
  using iterator = strided_iterator<Byte, Extent>;

  strided_range() noexcept = default;
  strided_range(Byte* base, size_t step, size_t len, size_t count) noexcept
      : base_{base}, step_{step}, len_{len}, count_{count} {}

  iterator begin() const noexcept { return {base_, step_, len_, 0}; }
  iterator end() const noexcept { return {base_, step_, len_, static_cast<std::ptrdiff_t>(count_)}; }
  size_t size() const noexcept { return count_; }

private:
  Byte* base_ = nullptr;
  size_t step_ = 0;
  size_t len_ = 0;
  size_t count_ = 0;
};

template <typename Byte>
using row_range = strided_range<Byte>;

template <typename Byte, pixel_format F>
using pixel_range = strided_range<Byte, F::bytes_per_pixel>;

namespace detail {

template <image_data I>
size_t row_count(const I& img) noexcept {
  return img.width() == 0 ? 0 : img.height();
}

} // namespace detail

template <image_data I>
row_range<const std::byte> rows(const I& img) noexcept {
  return {img.bytes().data(), img.stride(), size_t{img.width()} * I::format_type::bytes_per_pixel,
      detail::row_count(img)};
}

template <image_data I>
  requires(!borrowed_image<I>)
void rows(const I&&) = delete;

template <image_mut_data I>
row_range<std::byte> rows_mut(I& img) noexcept {
  return {img.bytes_mut().data(), img.stride(), size_t{img.width()} * I::format_type::bytes_per_pixel,
      detail::row_count(img)};
}

template <pixel_format F>
pixel_range<const std::byte, F> pixels(std::span<const std::byte> row) noexcept {
  return {row.data(), F::bytes_per_pixel, F::bytes_per_pixel, row.size() / F::bytes_per_pixel};
}

template <pixel_format F>
pixel_range<std::byte, F> pixels_mut(std::span<std::byte> row) noexcept {
  return {row.data(), F::bytes_per_pixel, F::bytes_per_pixel, row.size() / F::bytes_per_pixel};
}

} // namespace mvfmt

namespace std::ranges {
template <typename Byte, size_t Extent>
inline constexpr bool enable_borrowed_range<mvfmt::strided_range<Byte, Extent>> = true;
} // namespace std::ranges
