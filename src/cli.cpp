#include "chesscrypt/cli.hpp"

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "chesscrypt/errors.hpp"
#include "chesscrypt/random.hpp"
#include "chesscrypt/report.hpp"
#include "chesscrypt/sbox.hpp"
#include "chesscrypt/walk.hpp"

namespace chesscrypt {

static void usage(std::ostream& out) {
  out <<
    "ChessCrypt CLI\n"
    "Usage:\n"
    "  chesscrypt_cli [demo] [side <N>] [iterations <N>] [seed <N>] [input <N>]\n"
    "  chesscrypt_cli table  [side <N>] [iterations <N>] [seed <N>]\n"
    "  chesscrypt_cli help\n"
    "Defaults: side 16, iterations 1000, input 123. Without seed a random one is drawn.\n";
}

static int to_int(const std::string& key, const std::string& s) {
  std::size_t used = 0;
  int v = 0;
  try {
    v = std::stoi(s, &used);
  } catch (const std::logic_error&) {
    throw InvalidArgument("bad value for " + key + ": " + s);
  }
  if (used != s.size()) throw InvalidArgument("bad value for " + key + ": " + s);
  return v;
}

static std::uint64_t to_u64(const std::string& key, const std::string& s) {
  std::size_t used = 0;
  unsigned long long v = 0;
  try {
    v = std::stoull(s, &used, 0);
  } catch (const std::logic_error&) {
    throw InvalidArgument("bad value for " + key + ": " + s);
  }
  // stoull skips leading blanks and wraps negatives
  if (used != s.size() || s.find('-') != std::string::npos) throw InvalidArgument("bad value for " + key + ": " + s);
  return static_cast<std::uint64_t>(v);
}

void parse_walk_options(const std::vector<std::string>& args, std::size_t start,
                        WalkConfig& cfg, int& input) {
  for (std::size_t i = start; i < args.size(); i += 2) {
    const std::string& tok = args[i];
    if (i + 1 >= args.size()) throw InvalidArgument("missing value for " + tok);
    const std::string& val = args[i + 1];

    if      (tok == "side")       cfg.side = to_int(tok, val);
    else if (tok == "iterations") cfg.iterations = to_int(tok, val);
    else if (tok == "input")      input = to_int(tok, val);
    else if (tok == "seed")     { cfg.seed = to_u64(tok, val); cfg.seeded = true; }
    else throw InvalidArgument("unknown option " + tok);
  }
}

static void print_seed(std::ostream& out, std::uint64_t seed) {
  out << "seed 0x" << std::hex << seed << std::dec << "\n";
}

int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
  std::string cmd = "demo";
  std::size_t optStart = 0;
  if (!args.empty() && (args[0] == "demo" || args[0] == "table" || args[0] == "help")) {
    cmd = args[0];
    optStart = 1;
  }
  if (cmd == "help") { usage(out); return 0; }

  WalkConfig cfg;
  int input = 123;
  try {
    parse_walk_options(args, optStart, cfg, input);
    if (!cfg.seeded) cfg.seed = entropy_seed();

    SplitMix64Source rng(cfg.seed);
    SBox sbox(generate_sbox(cfg, rng));

    if (cmd == "table") {
      print_seed(out, cfg.seed);
      print_table(out, sbox.table());
      out << "fingerprint 0x" << std::hex << sbox.table().fingerprint() << std::dec << "\n";
      return 0;
    }

    // keep stdout to the statistics and the example; the drawn seed goes to err
    if (!cfg.seeded) print_seed(err, cfg.seed);
    out << "S-Box Statistics:\n";
    print_diagnostics(out, diagnostics(sbox.table()));
    out << "\n";
    print_substitution(out, input, sbox.substitute(input));
    return 0;
  } catch (const InvalidArgument& e) {
    err << "error: " << e.what() << "\n";
    usage(err);
    return 1;
  } catch (const OutOfRange& e) {
    err << "error: " << e.what() << "\n";
    return 1;
  }
}

} // namespace chesscrypt
