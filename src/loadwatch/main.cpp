#include "loadwatch/cli/router.hpp"

int main(int argc, char** argv) {
  // Command parsing, signal wiring and exit-code contracts live in the router.
  return loadwatch::cli::Dispatch(argc, argv);
}
