#pragma once
#include <array>
#include <cstdint>


namespace chesscrypt {


using U64 = std::uint64_t;


struct Coord {
int row = 0;
int col = 0;
};

inline constexpr bool operator==(Coord a, Coord b) { return a.row == b.row && a.col == b.col; }
inline constexpr bool operator!=(Coord a, Coord b) { return !(a == b); }


enum class Piece : int { Knight = 0, King = 1, Bishop = 2 };


constexpr int PIECE_N = 3;

// Order in which the pieces move inside one iteration.
inline constexpr std::array<Piece, PIECE_N> WALK_ORDER = { Piece::Knight, Piece::King, Piece::Bishop };

constexpr int MIN_SIDE = 2;
constexpr int MIN_WALK_SIDE = 3;
constexpr int MAX_SIDE = 46340; // side*side still fits in int


inline const char* piece_name(Piece p) {
switch (p) {
case Piece::Knight: return "knight";
case Piece::King:   return "king";
case Piece::Bishop: return "bishop";
}
return "?";
}


} // namespace chesscrypt
