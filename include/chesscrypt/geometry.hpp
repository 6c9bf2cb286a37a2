#pragma once
#include <cstddef>
#include "chesscrypt/types.hpp"

namespace chesscrypt {

// True modulo: result is in [0, side) for negative values too.
inline constexpr int wrap(int value, int side) {
  return ((value % side) + side) % side;
}

// Cyclic side x side board. Moving past an edge re-enters on the opposite one.
class Torus {
public:
  explicit Torus(int side);

  int side() const { return side_; }
  int cells() const { return side_ * side_; }

  Coord wrap(Coord c) const { return { chesscrypt::wrap(c.row, side_), chesscrypt::wrap(c.col, side_) }; }
  Coord offset(Coord c, int dr, int dc) const { return wrap(Coord{ c.row + dr, c.col + dc }); }
  bool contains(Coord c) const { return c.row >= 0 && c.row < side_ && c.col >= 0 && c.col < side_; }

  // Row-major index <-> coordinate
  std::size_t index(Coord c) const {
    return static_cast<std::size_t>(c.row) * static_cast<std::size_t>(side_) + static_cast<std::size_t>(c.col);
  }
  Coord coord(int index) const;

private:
  int side_;
};

// Throws InvalidArgument unless MIN_SIDE <= side <= MAX_SIDE.
void check_side(int side);

} // namespace chesscrypt
