#include <cassert>
#include <sstream>
#include <string>
#include <vector>

#include "chesscrypt/cli.hpp"
#include "chesscrypt/errors.hpp"
#include "chesscrypt/walk.hpp"

using namespace chesscrypt;

static bool has(const std::string& s, const std::string& needle) {
  return s.find(needle) != std::string::npos;
}

int main() {
  // Demo output shape
  {
    std::ostringstream out, err;
    const int rc = run_cli({"seed", "42"}, out, err);
    assert(rc == 0);
    const std::string s = out.str();
    assert(has(s, "S-Box Statistics:"));
    assert(has(s, "is_bijective: true"));
    assert(has(s, "min_value: 0"));
    assert(has(s, "max_value: 255"));
    assert(has(s, "mean_value: 127.5\n"));
    // full double precision, as the population std-dev of 0..255
    assert(has(s, "std_dev: 73.90027063549"));
    assert(has(s, "Input byte: 123"));
    assert(has(s, "Output byte: "));
    assert(err.str().empty());

    // seeded runs are reproducible
    std::ostringstream out2, err2;
    assert(run_cli({"demo", "seed", "42"}, out2, err2) == 0);
    assert(out2.str() == s);
  }

  // Unseeded: stdout starts with the statistics, the drawn seed goes to err
  {
    std::ostringstream out, err;
    assert(run_cli({}, out, err) == 0);
    assert(out.str().rfind("S-Box Statistics:\n", 0) == 0);
    assert(!has(out.str(), "seed"));
    assert(has(err.str(), "seed 0x"));
  }

  // Table dump
  {
    std::ostringstream out, err;
    assert(run_cli({"table", "side", "4", "iterations", "10", "seed", "0x10"}, out, err) == 0);
    assert(has(out.str(), "fingerprint 0x"));
    assert(has(out.str(), "seed 0x10"));
  }

  // Option parsing
  {
    WalkConfig cfg;
    int input = 123;
    parse_walk_options({"side", "8", "iterations", "5", "input", "9", "seed", "77"}, 0, cfg, input);
    assert(cfg.side == 8 && cfg.iterations == 5 && input == 9);
    assert(cfg.seeded && cfg.seed == 77);

    bool threw = false;
    try { parse_walk_options({"side"}, 0, cfg, input); } catch (const InvalidArgument&) { threw = true; }
    assert(threw);
    threw = false;
    try { parse_walk_options({"side", "4x"}, 0, cfg, input); } catch (const InvalidArgument&) { threw = true; }
    assert(threw);
    threw = false;
    try { parse_walk_options({"seed", "-3"}, 0, cfg, input); } catch (const InvalidArgument&) { threw = true; }
    assert(threw);
    threw = false;
    try { parse_walk_options({"seed", " -3"}, 0, cfg, input); } catch (const InvalidArgument&) { threw = true; }
    assert(threw);
    assert(cfg.seed == 77);
  }

  // Errors go to err with a non-zero code
  {
    std::ostringstream out, err;
    assert(run_cli({"side", "2", "seed", "1"}, out, err) == 1);
    assert(has(err.str(), "error:"));
  }
  {
    std::ostringstream out, err;
    assert(run_cli({"colour", "white"}, out, err) == 1);
    assert(has(err.str(), "unknown option colour"));
  }
  {
    std::ostringstream out, err;
    assert(run_cli({"side", "3", "seed", "1", "input", "9"}, out, err) == 1);
    assert(has(err.str(), "outside [0, 9)"));
  }
  {
    std::ostringstream out, err;
    assert(run_cli({"help"}, out, err) == 0);
    assert(has(out.str(), "Usage:"));
  }

  return 0;
}
