#pragma once

#include <cstddef>
#include <string>

#include <catch2/catch_tostring.hpp>

#include <fmt/format.h>

#include <libs/mvfmt/errc.hpp>
#include <libs/mvfmt/layout.hpp>
#include <libs/mvfmt/pixel_fmt.hpp>

namespace Catch {

template <>
struct StringMaker<std::byte> {
  static std::string convert(std::byte val) { return fmt::format("{:#04x}", std::to_integer<unsigned>(val)); }
};

template <>
struct StringMaker<mvfmt::errc> {
  static std::string convert(mvfmt::errc val) { return fmt::format("{}", val); }
};

template <>
struct StringMaker<mvfmt::pix_fmt> {
  static std::string convert(mvfmt::pix_fmt val) { return fmt::format("{}", val); }
};

template <>
struct StringMaker<mvfmt::extent> {
  static std::string convert(mvfmt::extent val) { return fmt::format("{}", val); }
};

} // namespace Catch
