#include <cassert>
#include "chesscrypt/geometry.hpp"
#include "chesscrypt/movegen.hpp"

int main() {
  using namespace chesscrypt;

  // 3x3 from the corner: each diagonal cycles back to the start square.
  {
    Torus t(3);
    MoveList ml;
    bishop_moves(Coord{0, 0}, t, ml);
    const Coord want[12] = {
      {1, 1}, {2, 2}, {0, 0},
      {1, 2}, {2, 1}, {0, 0},
      {2, 1}, {1, 2}, {0, 0},
      {2, 2}, {1, 1}, {0, 0},
    };
    assert(ml.size() == 12);
    for (int i = 0; i < 12; ++i) assert(ml[static_cast<std::size_t>(i)] == want[i]);
  }

  // 16x16 from (15,15): first step of the down-right diagonal wraps to (0,0).
  {
    Torus t(16);
    MoveList ml;
    generate_moves(Piece::Bishop, Coord{15, 15}, t, ml);
    assert(ml.size() == 64);
    assert((ml[0] == Coord{0, 0}));
    assert((ml[1] == Coord{1, 1}));
    assert((ml[15] == Coord{15, 15}));
    assert((ml[16] == Coord{0, 14}));
    for (std::size_t dir = 0; dir < 4; ++dir) assert((ml[dir * 16 + 15] == Coord{15, 15}));
  }

  // Always 4 * side, every square on a diagonal of the start
  for (int side = 3; side <= 11; ++side) {
    Torus t(side);
    MoveList ml;
    for (int r = 0; r < side; ++r)
      for (int c = 0; c < side; ++c) {
        bishop_moves(Coord{r, c}, t, ml);
        assert(ml.size() == move_count(Piece::Bishop, side));
        assert(ml.size() == static_cast<std::size_t>(4 * side));
        for (const auto& m : ml) {
          assert(t.contains(m));
          const int dr = wrap(m.row - r, side);
          const int dc = wrap(m.col - c, side);
          assert(dr == dc || dr == wrap(-dc, side));
        }
      }
  }

  return 0;
}
