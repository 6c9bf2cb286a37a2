#include "chesscrypt/table.hpp"
#include "chesscrypt/errors.hpp"
#include "chesscrypt/random.hpp"
#include <numeric>
#include <string>
#include <utility>


namespace chesscrypt {


Table::Table(int side) : torus_(side) { reset(); }


void Table::reset() {
cells_.resize(static_cast<std::size_t>(torus_.cells()));
std::iota(cells_.begin(), cells_.end(), 0);
}


int Table::at_checked(Coord c) const {
if (!torus_.contains(c))
throw OutOfRange("cell (" + std::to_string(c.row) + "," + std::to_string(c.col) +
") outside " + std::to_string(side()) + "x" + std::to_string(side()) + " table");
return at(c);
}


void Table::swap(Coord a, Coord b) {
std::swap(cells_[torus_.index(a)], cells_[torus_.index(b)]);
}


U64 Table::fingerprint() const {
// Deterministic but order sensitive: fold each value through one splitmix step
U64 x = static_cast<U64>(side());
U64 h = splitmix64(x);
for (int v : cells_) {
x ^= static_cast<U64>(v) + 0x632be59bd9b4e019ULL;
h ^= splitmix64(x);
h = (h << 7) | (h >> 57);
}
return h;
}


bool operator==(const Table& a, const Table& b) {
return a.side() == b.side() && a.values() == b.values();
}


} // namespace chesscrypt
