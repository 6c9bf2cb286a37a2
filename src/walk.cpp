#include "chesscrypt/walk.hpp"

#include <string>
#include <utility>

#include "chesscrypt/errors.hpp"
#include "chesscrypt/movegen.hpp"
#include "chesscrypt/sbox.hpp"

namespace chesscrypt {

static int checked_walk_side(int side) {
  if (side < MIN_WALK_SIDE)
    throw InvalidArgument("walk needs a board side of at least " + std::to_string(MIN_WALK_SIDE) +
                          ", got " + std::to_string(side));
  return side;
}

WalkEngine::WalkEngine(int side, RandomSource& rng)
  : table_(checked_walk_side(side)), rng_(&rng) {
  cursors_[static_cast<std::size_t>(Piece::King)]   = Coord{ 0, 0 };
  cursors_[static_cast<std::size_t>(Piece::Knight)] = Coord{ side / 2, side / 2 };
  cursors_[static_cast<std::size_t>(Piece::Bishop)] = Coord{ side - 1, side - 1 };
  moves_.reserve(move_count(Piece::Bishop, side));
}

void WalkEngine::check_live_(const char* what) const {
  if (finished_) throw InvalidArgument(std::string(what) + ": walk engine already released its table");
}

const Table& WalkEngine::table() const {
  check_live_("table");
  return table_;
}

Coord WalkEngine::cursor(Piece p) const {
  check_live_("cursor");
  return cursors_[static_cast<std::size_t>(p)];
}

void WalkEngine::step_(Piece p, WalkTrace* trace) {
  const std::size_t pi = static_cast<std::size_t>(p);
  const Coord from = cursors_[pi];

  generate_moves(p, from, table_.torus(), moves_);
  const std::size_t pick = rng_->next_index(moves_.size());
  if (pick >= moves_.size())
    throw OutOfRange("random source returned index " + std::to_string(pick) +
                     " for " + std::to_string(moves_.size()) + " " + piece_name(p) + " moves");
  const Coord to = moves_[pick];

  table_.swap(from, to);
  cursors_[pi] = to;

  ++stats_.swaps[pi];
  if (from == to) ++stats_.self_swaps[pi];
  if (trace) trace->push_back(WalkStep{ p, from, to });
}

void WalkEngine::run(int iterations, WalkTrace* trace) {
  check_live_("run");
  if (iterations < 0)
    throw InvalidArgument("iteration count must be non-negative, got " + std::to_string(iterations));

  if (trace) trace->reserve(trace->size() + static_cast<std::size_t>(iterations) * PIECE_N);

  for (int it = 0; it < iterations; ++it) {
    // Order matters: each piece sees the table left by the previous swap.
    for (Piece p : WALK_ORDER) step_(p, trace);
    ++iterations_done_;
  }
}

Table WalkEngine::release() {
  check_live_("release");
  finished_ = true;
  return std::move(table_);
}

Table generate_sbox(const WalkConfig& cfg, RandomSource& rng) {
  WalkEngine engine(cfg.side, rng);
  engine.run(cfg.iterations);
  check_bijective(engine.table());
  return engine.release();
}

Table replay(int side, const WalkTrace& trace) {
  Table t(side);
  for (const auto& s : trace) {
    if (!t.torus().contains(s.from) || !t.torus().contains(s.to))
      throw OutOfRange("trace step outside the board");
    t.swap(s.from, s.to);
  }
  return t;
}

} // namespace chesscrypt
