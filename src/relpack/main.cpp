#include "relpack/cli/router.hpp"

int main(int argc, char** argv) {
  return relpack::cli::Dispatch(argc, argv);
}
