#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "chesscrypt/movelist.hpp"
#include "chesscrypt/random.hpp"
#include "chesscrypt/table.hpp"
#include "chesscrypt/types.hpp"

namespace chesscrypt {

struct WalkConfig {
  int side = 16;                       // board side; table holds side*side values
  int iterations = 1000;               // each iteration moves all three pieces
  std::uint64_t seed = DEFAULT_SEED;
  bool seeded = false;                 // false => CLI draws entropy_seed()
};

// One piece move: the cells at `from` and `to` were exchanged.
struct WalkStep {
  Piece piece = Piece::Knight;
  Coord from{};
  Coord to{};
};

using WalkTrace = std::vector<WalkStep>;

struct WalkStats {
  std::array<std::uint64_t, PIECE_N> swaps{};       // per piece
  std::array<std::uint64_t, PIECE_N> self_swaps{};  // destination == cursor
};

class WalkEngine {
public:
  // Throws InvalidArgument for side < MIN_WALK_SIDE.
  WalkEngine(int side, RandomSource& rng);

  // Runs `iterations` rounds of {knight, king, bishop}. Continues from the
  // current cursors and table; nothing is reset between calls.
  void run(int iterations, WalkTrace* trace = nullptr);

  // Both throw InvalidArgument once release() has handed the table over.
  const Table& table() const;
  Coord cursor(Piece p) const;
  std::uint64_t iterations_done() const { return iterations_done_; }
  const WalkStats& stats() const { return stats_; }
  bool finished() const { return finished_; }

  // Hands the table over; the engine can no longer run.
  Table release();

private:
  void step_(Piece p, WalkTrace* trace);
  void check_live_(const char* what) const;

  Table table_;
  RandomSource* rng_;
  std::array<Coord, PIECE_N> cursors_{};
  MoveList moves_;
  WalkStats stats_{};
  std::uint64_t iterations_done_ = 0;
  bool finished_ = false;
};

// Construct, run cfg.iterations, verify bijectivity, return the table.
Table generate_sbox(const WalkConfig& cfg, RandomSource& rng);

// Apply the recorded swaps to a fresh identity table.
Table replay(int side, const WalkTrace& trace);

} // namespace chesscrypt
