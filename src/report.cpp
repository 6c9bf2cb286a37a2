#include "chesscrypt/report.hpp"

#include <iomanip>
#include <limits>
#include <ostream>
#include <string>

#include "chesscrypt/sbox.hpp"
#include "chesscrypt/table.hpp"

namespace chesscrypt {

void print_diagnostics(std::ostream& out, const Diagnostics& d) {
  out << "is_bijective: " << (d.is_bijective ? "true" : "false") << "\n";
  out << "min_value: " << d.min << "\n";
  out << "max_value: " << d.max << "\n";
  const auto prec = out.precision(std::numeric_limits<double>::max_digits10);
  out << "mean_value: " << d.mean << "\n";
  out << "std_dev: " << d.std_dev << "\n";
  out.precision(prec);
}

void print_table(std::ostream& out, const Table& t) {
  const int width = static_cast<int>(std::to_string(t.size() - 1).size()) + 1;
  for (int r = 0; r < t.side(); ++r) {
    for (int c = 0; c < t.side(); ++c) out << std::setw(width) << t.at(Coord{ r, c });
    out << "\n";
  }
}

void print_substitution(std::ostream& out, int input, int output) {
  out << "Example substitution:\n";
  out << "Input byte: " << input << "\n";
  out << "Output byte: " << output << "\n";
}

} // namespace chesscrypt
