#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include <libs/mvfmt/errc.hpp>

namespace mvfmt {

enum class pix_fmt : uint8_t {
  mono8,
  mono32f,
  rgb8,
  rgba8,
  bayer_rg8,
  bayer_bg8,
  bayer_gb8,
  bayer_gr8,
  bayer_rg32f,
  bayer_bg32f,
  bayer_gb32f,
  bayer_gr32f,
  yuv444,
  yuv422,
};

enum class arrangement { mono, interleaved, mosaic, packed_chroma };

enum class sample_type { u8, f32 };

enum class sample { luma, red, green, blue, alpha, cb, cr };

// named after the top left 2x2 cell: rg means R G / G B
enum class cfa { rg, bg, gb, gr };

namespace detail {

template <pix_fmt Fmt, sample_type T, arrangement A, size_t PixelsPerGroup, sample... S>
struct pixel_tag {
  static constexpr pix_fmt value = Fmt;
  static constexpr enum sample_type sample_type = T;
  static constexpr enum arrangement arrangement = A;
  static constexpr size_t pixels_per_group = PixelsPerGroup;
  static constexpr std::array<sample, sizeof...(S)> samples = {S...};
  static constexpr size_t bytes_per_sample = T == mvfmt::sample_type::u8 ? 1 : 4;
  static constexpr size_t bytes_per_pixel = bytes_per_sample * sizeof...(S) / PixelsPerGroup;
};

template <pix_fmt Fmt, sample_type T, cfa Pattern>
struct bayer_tag : pixel_tag<Fmt, T, arrangement::mosaic, 1, sample::luma> {
  static constexpr enum cfa cfa = Pattern;
};

} // namespace detail

// clang-format off
struct mono8 : detail::pixel_tag<pix_fmt::mono8, sample_type::u8, arrangement::mono, 1, sample::luma> {};
struct mono32f : detail::pixel_tag<pix_fmt::mono32f, sample_type::f32, arrangement::mono, 1, sample::luma> {};
struct rgb8 : detail::pixel_tag<pix_fmt::rgb8, sample_type::u8, arrangement::interleaved, 1,
    sample::red, sample::green, sample::blue> {};
struct rgba8 : detail::pixel_tag<pix_fmt::rgba8, sample_type::u8, arrangement::interleaved, 1,
    sample::red, sample::green, sample::blue, sample::alpha> {};
struct yuv444 : detail::pixel_tag<pix_fmt::yuv444, sample_type::u8, arrangement::interleaved, 1,
    sample::luma, sample::cb, sample::cr> {};
// UYVY: two pixels share one chroma pair
struct yuv422 : detail::pixel_tag<pix_fmt::yuv422, sample_type::u8, arrangement::packed_chroma, 2,
    sample::cb, sample::luma, sample::cr, sample::luma> {};

struct bayer_rg8 : detail::bayer_tag<pix_fmt::bayer_rg8, sample_type::u8, cfa::rg> {};
struct bayer_bg8 : detail::bayer_tag<pix_fmt::bayer_bg8, sample_type::u8, cfa::bg> {};
struct bayer_gb8 : detail::bayer_tag<pix_fmt::bayer_gb8, sample_type::u8, cfa::gb> {};
struct bayer_gr8 : detail::bayer_tag<pix_fmt::bayer_gr8, sample_type::u8, cfa::gr> {};
struct bayer_rg32f : detail::bayer_tag<pix_fmt::bayer_rg32f, sample_type::f32, cfa::rg> {};
struct bayer_bg32f : detail::bayer_tag<pix_fmt::bayer_bg32f, sample_type::f32, cfa::bg> {};
struct bayer_gb32f : detail::bayer_tag<pix_fmt::bayer_gb32f, sample_type::f32, cfa::gb> {};
struct bayer_gr32f : detail::bayer_tag<pix_fmt::bayer_gr32f, sample_type::f32, cfa::gr> {};
// clang-format on

template <typename F>
concept pixel_format = std::is_empty_v<F> && requires {
  { F::value } -> std::convertible_to<pix_fmt>;
  { F::bytes_per_pixel } -> std::convertible_to<size_t>;
  { F::pixels_per_group } -> std::convertible_to<size_t>;
  { F::samples.size() } -> std::convertible_to<size_t>;
  requires F::bytes_per_pixel > 0;
};

template <typename F>
concept bayer_format = pixel_format<F> && F::arrangement == arrangement::mosaic && requires {
  { F::cfa } -> std::convertible_to<cfa>;
};

template <pixel_format F>
inline constexpr size_t bytes_per_pixel_v = F::bytes_per_pixel;

template <typename Fn>
constexpr decltype(auto) visit_format(pix_fmt fmt, Fn&& f) {
  switch (fmt) {
  case pix_fmt::mono8:
    return std::forward<Fn>(f).template operator()<mono8>();
  case pix_fmt::mono32f:
    return std::forward<Fn>(f).template operator()<mono32f>();
  case pix_fmt::rgb8:
    return std::forward<Fn>(f).template operator()<rgb8>();
  case pix_fmt::rgba8:
    return std::forward<Fn>(f).template operator()<rgba8>();
  case pix_fmt::bayer_rg8:
    return std::forward<Fn>(f).template operator()<bayer_rg8>();
  case pix_fmt::bayer_bg8:
    return std::forward<Fn>(f).template operator()<bayer_bg8>();
  case pix_fmt::bayer_gb8:
    return std::forward<Fn>(f).template operator()<bayer_gb8>();
  case pix_fmt::bayer_gr8:
    return std::forward<Fn>(f).template operator()<bayer_gr8>();
  case pix_fmt::bayer_rg32f:
    return std::forward<Fn>(f).template operator()<bayer_rg32f>();
  case pix_fmt::bayer_bg32f:
    return std::forward<Fn>(f).template operator()<bayer_bg32f>();
  case pix_fmt::bayer_gb32f:
    return std::forward<Fn>(f).template operator()<bayer_gb32f>();
  case pix_fmt::bayer_gr32f:
    return std::forward<Fn>(f).template operator()<bayer_gr32f>();
  case pix_fmt::yuv444:
    return std::forward<Fn>(f).template operator()<yuv444>();
  case pix_fmt::yuv422:
    return std::forward<Fn>(f).template operator()<yuv422>();
  }
  std::unreachable();
}

constexpr size_t bytes_per_pixel(pix_fmt fmt) noexcept {
  return visit_format(fmt, []<pixel_format F>() { return F::bytes_per_pixel; });
}

std::string_view name(pix_fmt fmt) noexcept;

std::expected<pix_fmt, errc> parse_pix_fmt(std::string_view name) noexcept;

} // namespace mvfmt

template <>
struct fmt::formatter<mvfmt::pix_fmt> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(mvfmt::pix_fmt value, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(mvfmt::name(value), ctx);
  }
};
