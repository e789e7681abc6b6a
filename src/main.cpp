#include <iostream>

#include "loghive/cli.hpp"

int main(int argc, char** argv) {
  return loghive::run_cli(argc, argv, std::cout, std::cerr);
}
