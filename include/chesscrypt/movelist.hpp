#pragma once
#include <cstddef>
#include <vector>
#include "chesscrypt/types.hpp"


namespace chesscrypt {


// Candidate destinations for one piece, in generation order.
// Duplicates are kept: each entry is one equally likely draw.
struct MoveList {
std::vector<Coord> data;


void clear() { data.clear(); }
void reserve(std::size_t n) { data.reserve(n); }
void push(const Coord& c) { data.push_back(c); }
const Coord* begin() const { return data.data(); }
const Coord* end() const { return data.data() + data.size(); }
const Coord& operator[](std::size_t i) const { return data[i]; }
std::size_t size() const { return data.size(); }
bool empty() const { return data.empty(); }
};


} // namespace chesscrypt
