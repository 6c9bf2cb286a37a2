#include <iostream>
#include <string>
#include <vector>

#include "chesscrypt/cli.hpp"

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  return chesscrypt::run_cli(args, std::cout, std::cerr);
}
