#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "chesscrypt/table.hpp"

namespace chesscrypt {

struct Diagnostics {
  bool is_bijective = false;
  int min = 0;
  int max = 0;
  double mean = 0.0;
  double std_dev = 0.0;     // population (divides by n)
};

Diagnostics diagnostics(std::span<const int> values);
Diagnostics diagnostics(const Table& t);

// Throws BijectivityViolation unless values is a permutation of 0..n-1.
void check_bijective(std::span<const int> values);
void check_bijective(const Table& t);

// Read-only substitution over a finished table.
class SBox {
public:
  explicit SBox(Table t);   // throws BijectivityViolation

  int domain() const { return static_cast<int>(table_.size()); }
  const Table& table() const { return table_; }

  // input in [0, side*side), else OutOfRange
  int substitute(int input) const;
  int inverse_substitute(int output) const;

  // Byte-wise; only for a 256-entry table (side 16), else InvalidArgument.
  std::vector<std::uint8_t> substitute(std::span<const std::uint8_t> bytes) const;

private:
  Table table_;
  std::vector<int> inverse_;
};

} // namespace chesscrypt
