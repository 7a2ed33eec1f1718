#include <modgraph/tools/policy_cli.h>

#include <iostream>

int main(int argc, char** argv) {
  return modgraph::tools::run_policy_cli(argc, argv, std::cout, std::cerr);
}
