#include "errc.hpp"

#include <string>

namespace mvfmt {

const std::error_category& mvfmt_category() noexcept {
  static const struct : std::error_category {
    const char* name() const noexcept override { return "mvfmt"; }
    std::string message(int cond) const override {
      switch (static_cast<errc>(cond)) {
      case errc::insufficient_buffer:
        return "Buffer is too short for image stride and height";
      case errc::invalid_stride:
        return "Stride is smaller than minimal row width";
      case errc::capacity_exceeded:
        return "Image does not fit into fixed capacity storage";
      case errc::region_out_of_bounds:
        return "Region lies outside of parent image";
      case errc::unknown_pixel_format:
        return "Unknown pixel format name";
      }
      return "unknown mvfmt error " + std::to_string(cond);
    }
  } instance;
  return instance;
}

std::error_code make_error_code(errc c) noexcept { return {static_cast<int>(c), mvfmt_category()}; }

} // namespace mvfmt
