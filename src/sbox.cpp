#include "chesscrypt/sbox.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "chesscrypt/errors.hpp"

namespace chesscrypt {

// Permutation of 0..n-1 <=> every value in range and seen once.
static bool is_permutation_of_range(std::span<const int> values) {
  const std::size_t n = values.size();
  std::vector<bool> seen(n, false);
  for (int v : values) {
    if (v < 0 || static_cast<std::size_t>(v) >= n) return false;
    if (seen[static_cast<std::size_t>(v)]) return false;
    seen[static_cast<std::size_t>(v)] = true;
  }
  return true;
}

Diagnostics diagnostics(std::span<const int> values) {
  Diagnostics d;
  if (values.empty()) return d;

  // distinct count == size
  std::vector<int> sorted(values.begin(), values.end());
  std::sort(sorted.begin(), sorted.end());
  d.is_bijective = std::adjacent_find(sorted.begin(), sorted.end()) == sorted.end();

  d.min = sorted.front();
  d.max = sorted.back();

  const double n = static_cast<double>(values.size());
  double sum = 0.0;
  for (int v : values) sum += v;
  d.mean = sum / n;

  double var = 0.0;
  for (int v : values) {
    const double dv = v - d.mean;
    var += dv * dv;
  }
  d.std_dev = std::sqrt(var / n);
  return d;
}

Diagnostics diagnostics(const Table& t) {
  return diagnostics(std::span<const int>(t.values().data(), t.values().size()));
}

void check_bijective(std::span<const int> values) {
  if (!is_permutation_of_range(values))
    throw BijectivityViolation("table of " + std::to_string(values.size()) +
                               " cells is not a permutation of 0.." +
                               std::to_string(values.size() == 0 ? 0 : values.size() - 1));
}

void check_bijective(const Table& t) {
  const std::size_t want = static_cast<std::size_t>(t.side()) * static_cast<std::size_t>(t.side());
  if (t.size() != want)
    throw BijectivityViolation("table holds " + std::to_string(t.size()) + " cells, expected " +
                               std::to_string(want));
  check_bijective(std::span<const int>(t.values().data(), t.values().size()));
}

SBox::SBox(Table t) : table_(std::move(t)) {
  check_bijective(table_);
  inverse_.assign(table_.size(), 0);
  const auto& v = table_.values();
  for (std::size_t i = 0; i < v.size(); ++i)
    inverse_[static_cast<std::size_t>(v[i])] = static_cast<int>(i);
}

int SBox::substitute(int input) const {
  if (input < 0 || input >= domain())
    throw OutOfRange("substitution input " + std::to_string(input) +
                     " outside [0, " + std::to_string(domain()) + ")");
  const int side = table_.side();
  return table_.at(Coord{ input / side, input % side });
}

int SBox::inverse_substitute(int output) const {
  if (output < 0 || output >= domain())
    throw OutOfRange("inverse substitution input " + std::to_string(output) +
                     " outside [0, " + std::to_string(domain()) + ")");
  return inverse_[static_cast<std::size_t>(output)];
}

std::vector<std::uint8_t> SBox::substitute(std::span<const std::uint8_t> bytes) const {
  if (domain() != 256)
    throw InvalidArgument("byte substitution needs a 16x16 table, have " +
                          std::to_string(table_.side()) + "x" + std::to_string(table_.side()));
  std::vector<std::uint8_t> out;
  out.reserve(bytes.size());
  for (std::uint8_t b : bytes) out.push_back(static_cast<std::uint8_t>(substitute(b)));
  return out;
}

} // namespace chesscrypt
