#pragma once
#include <cstdint>

namespace drvsim {

using EntityId = std::uint32_t;

struct Rgb {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
};

// Normalized axis-aligned box (screen space, y grows downward)
struct CollisionRect {
  double left = 0.0;
  double top = 0.0;
  double right = 0.0;
  double bottom = 0.0;

  bool overlaps(const CollisionRect& o) const {
    return right > o.left && left < o.right && bottom > o.top && top < o.bottom;
  }
};

} // namespace drvsim
