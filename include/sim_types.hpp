// ============================================================================
// sim_types.hpp -- Array types shared across the generation pipeline
//
// All arrays are dense and row-major. A `Footprint` is one H×W plane, a
// `Movie` is F×H×W uint8 pixels, and spike/trace arrays are one vector per
// cell.
// ============================================================================
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace simcad {

using SpikeTrain   = std::vector<std::uint8_t>;
using CalciumTrace = std::vector<double>;

// ============================================================================
// `Shift` struct
// Integer translation applied to one frame: content moves down by `dy` rows
// and right by `dx` columns.
// ============================================================================
struct Shift {
  int dy{0};
  int dx{0};

  friend bool operator==(const Shift& a, const Shift& b) noexcept {
    return a.dy == b.dy && a.dx == b.dx;
  }
};

using MotionShift = std::vector<Shift>;

// ============================================================================
// `Plane` class
// Dense H×W plane of T, row-major.
// ============================================================================
template<typename T>
struct Plane {
  std::size_t    height{0};
  std::size_t    width{0};
  std::vector<T> data;

  Plane() = default;
  Plane(std::size_t h, std::size_t w, T fill = T{})
  : height{h}, width{w}, data(h * w, fill) {}

  [[nodiscard]] T& at(std::size_t y, std::size_t x) noexcept {
    return data[y * width + x];
  }
  [[nodiscard]] const T& at(std::size_t y, std::size_t x) const noexcept {
    return data[y * width + x];
  }
  [[nodiscard]] std::size_t size() const noexcept { return data.size(); }
};

using Footprint = Plane<float>;
using RawFrame  = Plane<double>;

// ============================================================================
// `Movie` struct
// F×H×W 8-bit pixels; frame `t` starts at `t * height * width`.
// ============================================================================
struct Movie {
  std::size_t               frames{0};
  std::size_t               height{0};
  std::size_t               width{0};
  std::vector<std::uint8_t> pixels;

  Movie() = default;
  Movie(std::size_t f, std::size_t h, std::size_t w)
  : frames{f}, height{h}, width{w}, pixels(f * h * w, 0) {}

  [[nodiscard]] std::size_t frame_pixels() const noexcept { return height * width; }

  [[nodiscard]] std::uint8_t* frame(std::size_t t) noexcept {
    return pixels.data() + t * frame_pixels();
  }
  [[nodiscard]] const std::uint8_t* frame(std::size_t t) const noexcept {
    return pixels.data() + t * frame_pixels();
  }
  [[nodiscard]] std::uint8_t at(std::size_t t, std::size_t y,
                                std::size_t x) const noexcept {
    return pixels[t * frame_pixels() + y * width + x];
  }
};

} // namespace simcad
