#pragma once
#include <iosfwd>

namespace chesscrypt {

struct Diagnostics;
class Table;

void print_diagnostics(std::ostream& out, const Diagnostics& d);
void print_table(std::ostream& out, const Table& t);
void print_substitution(std::ostream& out, int input, int output);

} // namespace chesscrypt
