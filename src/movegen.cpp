#include "chesscrypt/movegen.hpp"
#include "chesscrypt/types.hpp"
#include "chesscrypt/geometry.hpp"

namespace chesscrypt {

// Knight offsets (row, col), in draw order
static constexpr int KN_DR[8] = {+2, +2, -2, -2, +1, +1, -1, -1};
static constexpr int KN_DC[8] = {+1, -1, +1, -1, +2, -2, +2, -2};

// Diagonals: down-right, down-left, up-right, up-left
static constexpr int DRb[4] = {+1, +1, -1, -1};
static constexpr int DCb[4] = {+1, -1, +1, -1};

void knight_moves(Coord from, const Torus& t, MoveList& out) {
  out.clear();
  out.reserve(8);
  for (int i = 0; i < 8; ++i) out.push(t.offset(from, KN_DR[i], KN_DC[i]));
}

void king_moves(Coord from, const Torus& t, MoveList& out) {
  out.clear();
  out.reserve(8);
  for (int dr = -1; dr <= 1; ++dr) {
    for (int dc = -1; dc <= 1; ++dc) {
      if (!dr && !dc) continue;
      out.push(t.offset(from, dr, dc));
    }
  }
}

void bishop_moves(Coord from, const Torus& t, MoveList& out) {
  out.clear();
  out.reserve(move_count(Piece::Bishop, t.side()));
  for (int dir = 0; dir < 4; ++dir) {
    Coord cur = from;
    for (int step = 0; step < t.side(); ++step) {
      // step from the previous wrapped square, not from `from`
      cur = t.offset(cur, DRb[dir], DCb[dir]);
      out.push(cur);
    }
  }
}

void generate_moves(Piece p, Coord from, const Torus& t, MoveList& out) {
  switch (p) {
    case Piece::Knight: knight_moves(from, t, out); return;
    case Piece::King:   king_moves(from, t, out);   return;
    case Piece::Bishop: bishop_moves(from, t, out); return;
  }
  out.clear();
}

std::size_t move_count(Piece p, int side) {
  switch (p) {
    case Piece::Knight:
    case Piece::King:   return 8;
    case Piece::Bishop: return 4 * static_cast<std::size_t>(side);
  }
  return 0;
}

} // namespace chesscrypt
