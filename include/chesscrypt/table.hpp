#pragma once
#include <cstddef>
#include <vector>
#include "chesscrypt/geometry.hpp"
#include "chesscrypt/types.hpp"


namespace chesscrypt {


// side x side grid holding a permutation of 0..side*side-1, row-major.
// Starts as the identity; the only mutation is swap(), so every state is a bijection.
class Table {
public:
explicit Table(int side);
void reset();


int side() const { return torus_.side(); }
const Torus& torus() const { return torus_; }
std::size_t size() const { return cells_.size(); }


// Unchecked: callers pass wrapped coordinates.
int at(Coord c) const { return cells_[torus_.index(c)]; }
int at_checked(Coord c) const;


void swap(Coord a, Coord b);


const std::vector<int>& values() const { return cells_; }
std::vector<int> flatten() const { return cells_; }


// splitmix64-mixed digest of the row-major contents
U64 fingerprint() const;


private:
Torus torus_;
std::vector<int> cells_;
};


bool operator==(const Table& a, const Table& b);
inline bool operator!=(const Table& a, const Table& b) { return !(a == b); }


} // namespace chesscrypt
