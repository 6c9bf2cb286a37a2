#pragma once
#include <stdexcept>

namespace chesscrypt {

// Degenerate board side, negative iteration count, bad configuration.
struct InvalidArgument : std::invalid_argument { using std::invalid_argument::invalid_argument; };

// Substitution input or coordinate outside the table's domain.
struct OutOfRange : std::out_of_range { using std::out_of_range::out_of_range; };

// The table stopped being a permutation. Always a logic defect.
struct BijectivityViolation : std::logic_error { using std::logic_error::logic_error; };

} // namespace chesscrypt
