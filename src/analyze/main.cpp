#include "analyze/scenario.hpp"
#include "common/throw.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <cstdlib>


int main(int const argc, char const *argv[])
{
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <scenario.textproto>...\n";
    return EXIT_FAILURE;
  }

  bool failed = false;
  for (int i = 1; i < argc; ++i) {
    std::filesystem::path const path(argv[i]);
    try {
      Hupai::report(Hupai::loadScenario(path), std::cout);
    }
    catch (std::exception const &) {
      std::cerr << path << ": Failed to analyze.\n";
      Hupai::printCurrentException(std::cerr);
      failed = true;
    }
  }

  return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
