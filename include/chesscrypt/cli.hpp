// include/chesscrypt/cli.hpp
#pragma once
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace chesscrypt {

struct WalkConfig;

// Parses "side <N> iterations <N> seed <N> input <N>" pairs starting at `start`.
// Throws InvalidArgument on unknown keys, missing values or bad numbers.
void parse_walk_options(const std::vector<std::string>& args, std::size_t start,
                        WalkConfig& cfg, int& input);

// Demo driver; returns the process exit code.
int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace chesscrypt
