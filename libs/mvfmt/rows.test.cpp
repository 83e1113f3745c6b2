#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <ranges>
#include <span>
#include <utility>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_range_equals.hpp>

#include <testing/bytes.hpp>
#include <testing/printers/mvfmt.hpp>

#include <libs/mvfmt/fixed_image.hpp>
#include <libs/mvfmt/image_view.hpp>
#include <libs/mvfmt/rows.hpp>

using namespace mvfmt;
using Catch::Matchers::RangeEquals;

static_assert(std::random_access_iterator<strided_iterator<const std::byte>>);
static_assert(std::ranges::random_access_range<row_range<const std::byte>>);
static_assert(std::ranges::sized_range<row_range<std::byte>>);
static_assert(std::ranges::borrowed_range<row_range<const std::byte>>);
static_assert(std::ranges::view<row_range<const std::byte>>);
static_assert(std::same_as<std::ranges::range_value_t<pixel_range<const std::byte, rgb8>>, std::span<const std::byte, 3>>);
static_assert(std::same_as<std::ranges::range_value_t<pixel_range<std::byte, mono32f>>, std::span<std::byte, 4>>);

template <typename I>
concept has_rows = requires(I&& img) { rows(std::forward<I>(img)); };

static_assert(has_rows<image_view<mono8>>);
static_assert(has_rows<const fixed_image<mono8, 16>&>);
static_assert(!has_rows<fixed_image<mono8, 16>>);

namespace {

// Image type implemented outside of the library: tightly packed rows in a vector.
class packed_gray {
public:
  using format_type = mono8;

  packed_gray(uint32_t width, uint32_t height) : width_{width}, height_{height}, buf_(size_t{width} * height) {}

  static constexpr pix_fmt format() noexcept { return pix_fmt::mono8; }
  uint32_t width() const noexcept { return width_; }
  uint32_t height() const noexcept { return height_; }
  size_t stride() const noexcept { return width_; }

  std::span<const std::byte> bytes() const noexcept { return buf_; }
  std::span<const std::byte> row_bytes(size_t row) const noexcept {
    return bytes().subspan(row * width_, width_);
  }

  std::byte& at(size_t x, size_t y) { return buf_[y * width_ + x]; }

private:
  uint32_t width_;
  uint32_t height_;
  std::vector<std::byte> buf_;
};

static_assert(image_of<packed_gray, mono8>);
static_assert(!validated_image<packed_gray>);

std::vector<const std::byte*> row_starts(row_range<const std::byte> range) {
  std::vector<const std::byte*> res;
  for (auto row : range)
    res.push_back(row.data());
  return res;
}

} // namespace

SCENARIO("row iteration") {
  GIVEN("mono8 frame of 4x3 pixels with two padding bytes per row") {
    const auto buf = numbered_grid(3, 6);
    auto img = image_view<mono8>::make(extent{4, 3}, 6, buf);
    REQUIRE(img);

    WHEN("rows are iterated") {
      auto range = rows(*img);

      THEN("every row is visited once in order without padding") {
        REQUIRE(range.size() == 3u);
        auto it = range.begin();
        CHECK_THAT(*it++, RangeEquals(bytes_of({0, 1, 2, 3})));
        CHECK_THAT(*it++, RangeEquals(bytes_of({10, 11, 12, 13})));
        CHECK_THAT(*it++, RangeEquals(bytes_of({20, 21, 22, 23})));
        CHECK(it == range.end());
      }

      THEN("iterating again yields the same rows") { CHECK(row_starts(range) == row_starts(rows(*img))); }

      THEN("rows can be accessed at random") {
        CHECK(range[1].data() == buf.data() + 6);
        CHECK(range.end()[-1].data() == buf.data() + 12);
        CHECK(range.end() - range.begin() == 3);
        CHECK(range.begin() < range.end());
      }

      THEN("rows can be iterated backwards") {
        auto last = *std::ranges::begin(range | std::views::reverse);
        CHECK_THAT(last, RangeEquals(bytes_of({20, 21, 22, 23})));
      }
    }

    WHEN("the buffer ends right after the pixels of the last row") {
      auto tight = image_view<mono8>::make(extent{4, 3}, 6, std::span{buf}.first(16));
      REQUIRE(tight);

      THEN("the last row stays inside the buffer") {
        auto last = rows(*tight)[2];
        CHECK(last.data() + last.size() == tight->bytes().data() + tight->bytes().size());
      }
    }
  }

  GIVEN("zero sized frames") {
    std::vector<std::byte> buf(32);

    THEN("zero height yields no rows") {
      auto img = image_view<rgb8>::make(extent{4, 0}, 12, buf);
      REQUIRE(img);
      CHECK(std::ranges::empty(rows(*img)));
    }

    THEN("zero width yields no rows") {
      auto img = image_view<rgb8>::make(extent{0, 4}, 8, buf);
      REQUIRE(img);
      CHECK(std::ranges::empty(rows(*img)));
    }
  }

  GIVEN("image implemented outside of the library") {
    packed_gray img{3, 2};
    img.at(2, 1) = std::byte{42};

    THEN("its rows are iterated the same way") {
      auto range = rows(img);
      REQUIRE(range.size() == 2u);
      CHECK_THAT(range[1], RangeEquals(bytes_of({0, 0, 42})));
    }
  }
}

SCENARIO("pixel iteration") {
  GIVEN("rgb8 frame of 2x2 pixels with two padding bytes per row") {
    const auto buf = numbered_grid(2, 8);
    auto img = image_view<rgb8>::make(extent{2, 2}, 8, buf);
    REQUIRE(img);

    WHEN("pixels of the second row are iterated") {
      auto px = pixels<rgb8>(img->row_bytes(1));

      THEN("each pixel is a three byte chunk") {
        REQUIRE(px.size() == 2u);
        CHECK_THAT(px[0], RangeEquals(bytes_of({10, 11, 12})));
        CHECK_THAT(px[1], RangeEquals(bytes_of({13, 14, 15})));
      }
    }

    WHEN("pixels of every row are counted") {
      size_t count = 0;
      for (auto row : rows(*img))
        count += pixels<rgb8>(row).size();

      THEN("it matches the image area") { CHECK(count == 4u); }
    }
  }
}

SCENARIO("mutable row iteration") {
  GIVEN("zero filled mono8 image of 3x3 pixels with padding") {
    auto img = fixed_image<mono8, 16>::make(extent{3, 3}, 4);
    REQUIRE(img);

    WHEN("each row is filled with its index") {
      uint8_t idx = 0;
      for (auto row : rows_mut(*img)) {
        for (auto px : pixels_mut<mono8>(row))
          px[0] = std::byte{idx};
        ++idx;
      }

      THEN("pixels change and padding stays zero") {
        CHECK_THAT(img->bytes(), RangeEquals(bytes_of({0, 0, 0, 0, 1, 1, 1, 0, 2, 2, 2, 0})));
      }
    }
  }
}
