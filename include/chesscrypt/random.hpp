#pragma once
#include <cstddef>
#include <cstdint>
#include <random>

namespace chesscrypt {

inline constexpr std::uint64_t DEFAULT_SEED = 0x9E3779B97F4A7C15ULL;

// Mix helper for deterministic RNG seeding
inline std::uint64_t splitmix64(std::uint64_t& x) {
  x += 0x9e3779b97f4a7c15ULL;
  std::uint64_t z = x;
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

// Uniform index generator consumed by the walk engine.
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Uniform in [0, upper). Throws InvalidArgument when upper == 0.
  virtual std::size_t next_index(std::size_t upper) = 0;
};

class SplitMix64Source : public RandomSource {
public:
  explicit SplitMix64Source(std::uint64_t seed = DEFAULT_SEED) : state_(seed) {}

  std::size_t next_index(std::size_t upper) override;
  std::uint64_t next() { return splitmix64(state_); }

private:
  std::uint64_t state_;
};

class StdRandomSource : public RandomSource {
public:
  explicit StdRandomSource(std::uint64_t seed = DEFAULT_SEED) : gen_(seed) {}

  std::size_t next_index(std::size_t upper) override;

private:
  std::mt19937_64 gen_;
};

// Nondeterministic seed for runs where the caller did not pick one.
std::uint64_t entropy_seed();

} // namespace chesscrypt
