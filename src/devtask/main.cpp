#include "devtask/cli/router.hpp"

int main(int argc, char** argv) {
  return devtask::cli::Dispatch(argc, argv);
}
