#include <cassert>
#include "chesscrypt/geometry.hpp"
#include "chesscrypt/movegen.hpp"

int main() {
  using namespace chesscrypt;

  // King on the corner of a 5x5 torus reaches across both edges.
  Torus t(5);
  MoveList ml;
  king_moves(Coord{0, 0}, t, ml);
  const Coord want[8] = {{4, 4}, {4, 0}, {4, 1}, {0, 4}, {0, 1}, {1, 4}, {1, 0}, {1, 1}};
  assert(ml.size() == 8);
  for (int i = 0; i < 8; ++i) assert(ml[static_cast<std::size_t>(i)] == want[i]);

  // Never the start square on boards of side >= 3
  for (int side = 3; side <= 9; ++side) {
    Torus ts(side);
    for (int r = 0; r < side; ++r)
      for (int c = 0; c < side; ++c) {
        king_moves(Coord{r, c}, ts, ml);
        assert(ml.size() == move_count(Piece::King, side));
        for (const auto& m : ml) assert(ts.contains(m) && !(m == Coord{r, c}));
      }
  }

  // Generating again from the same square gives the same list
  MoveList a, b;
  generate_moves(Piece::King, Coord{2, 3}, t, a);
  generate_moves(Piece::King, Coord{2, 3}, t, b);
  assert(a.size() == b.size());
  for (std::size_t i = 0; i < a.size(); ++i) assert(a[i] == b[i]);

  return 0;
}
