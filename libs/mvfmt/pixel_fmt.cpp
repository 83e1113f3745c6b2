#include "pixel_fmt.hpp"

#include <algorithm>
#include <utility>

namespace mvfmt {

namespace {

using namespace std::literals;

// GenICam style names as reported by camera drivers
constexpr std::pair<pix_fmt, std::string_view> format_names[] = {
    {pix_fmt::mono8, "Mono8"sv},
    {pix_fmt::mono32f, "Mono32f"sv},
    {pix_fmt::rgb8, "RGB8"sv},
    {pix_fmt::rgba8, "RGBA8"sv},
    {pix_fmt::bayer_rg8, "BayerRG8"sv},
    {pix_fmt::bayer_bg8, "BayerBG8"sv},
    {pix_fmt::bayer_gb8, "BayerGB8"sv},
    {pix_fmt::bayer_gr8, "BayerGR8"sv},
    {pix_fmt::bayer_rg32f, "BayerRG32f"sv},
    {pix_fmt::bayer_bg32f, "BayerBG32f"sv},
    {pix_fmt::bayer_gb32f, "BayerGB32f"sv},
    {pix_fmt::bayer_gr32f, "BayerGR32f"sv},
    {pix_fmt::yuv444, "YUV444"sv},
    {pix_fmt::yuv422, "YUV422"sv},
};

} // namespace

std::string_view name(pix_fmt fmt) noexcept {
  const auto it = std::ranges::find(format_names, fmt, &std::pair<pix_fmt, std::string_view>::first);
  if (it == std::ranges::end(format_names))
    return "unknown pixel format"sv;
  return it->second;
}

std::expected<pix_fmt, errc> parse_pix_fmt(std::string_view name) noexcept {
  const auto it = std::ranges::find(format_names, name, &std::pair<pix_fmt, std::string_view>::second);
  if (it == std::ranges::end(format_names))
    return std::unexpected{errc::unknown_pixel_format};
  return it->first;
}

} // namespace mvfmt
