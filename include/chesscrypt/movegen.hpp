#pragma once
#include <cstddef>
#include "chesscrypt/geometry.hpp"
#include "chesscrypt/movelist.hpp"


namespace chesscrypt {


// All generators clear `out` first and wrap every destination onto the torus.
void knight_moves(Coord from, const Torus& t, MoveList& out);
void king_moves(Coord from, const Torus& t, MoveList& out);
// side cumulative steps along each diagonal; the last one lands on `from` again.
void bishop_moves(Coord from, const Torus& t, MoveList& out);

void generate_moves(Piece p, Coord from, const Torus& t, MoveList& out);

// Size of the move set, independent of position (8, 8, 4*side).
std::size_t move_count(Piece p, int side);


} // namespace chesscrypt
