#include "chesscrypt/random.hpp"
#include "chesscrypt/errors.hpp"

namespace chesscrypt {

static void check_upper(std::size_t upper) {
  if (upper == 0) throw InvalidArgument("next_index: upper bound must be positive");
}

std::size_t SplitMix64Source::next_index(std::size_t upper) {
  check_upper(upper);
  const std::uint64_t u = static_cast<std::uint64_t>(upper);
  // Reject the low tail so every residue is equally likely.
  const std::uint64_t threshold = (0 - u) % u;
  std::uint64_t r = next();
  while (r < threshold) r = next();
  return static_cast<std::size_t>(r % u);
}

std::size_t StdRandomSource::next_index(std::size_t upper) {
  check_upper(upper);
  std::uniform_int_distribution<std::size_t> dist(0, upper - 1);
  return dist(gen_);
}

std::uint64_t entropy_seed() {
  std::random_device rd;
  std::uint64_t hi = rd();
  std::uint64_t lo = rd();
  std::uint64_t x = (hi << 32) ^ lo;
  return splitmix64(x);
}

} // namespace chesscrypt
