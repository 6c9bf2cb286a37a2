#include "chesscrypt/geometry.hpp"
#include "chesscrypt/errors.hpp"
#include <string>

namespace chesscrypt {

void check_side(int side) {
  if (side < MIN_SIDE)
    throw InvalidArgument("board side must be at least " + std::to_string(MIN_SIDE) +
                          ", got " + std::to_string(side));
  if (side > MAX_SIDE)
    throw InvalidArgument("board side too large: " + std::to_string(side));
}

Torus::Torus(int side) : side_(side) { check_side(side); }

Coord Torus::coord(int index) const {
  if (index < 0 || index >= cells())
    throw OutOfRange("index " + std::to_string(index) + " outside board of " +
                     std::to_string(cells()) + " cells");
  return { index / side_, index % side_ };
}

} // namespace chesscrypt
