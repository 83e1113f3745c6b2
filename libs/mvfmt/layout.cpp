#include "layout.hpp"
#include "image_data.hpp"

#include <spdlog/spdlog.h>

namespace mvfmt::detail {

void log_rejection(pix_fmt fmt, extent sz, size_t stride, size_t buffer_len, errc ec) {
  spdlog::debug("{} image {} with stride {} rejected for {} byte buffer: {}", fmt, sz, stride,
      buffer_len, ec);
}

void log_region_rejection(pix_fmt fmt, extent parent, uint32_t x, uint32_t y, extent sz) {
  spdlog::debug("{} region {} at ({}, {}) does not fit into {} image", fmt, sz, x, y, parent);
}

void log_allocation(pix_fmt fmt, extent sz, size_t stride, size_t bytes) {
  spdlog::trace("allocating {} bytes for {} image {} with stride {}", bytes, fmt, sz, stride);
}

} // namespace mvfmt::detail
