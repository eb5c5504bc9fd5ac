#include "sheet_table/cli.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char** argv) {
  st::CliOptions cli;
  try {
    cli = st::parse_cli(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << "[sheet-table] " << e.what() << "\n";
    st::print_usage(std::cerr);
    return 2;
  }

  if (cli.help) { st::print_usage(std::cout); return 0; }
  if (cli.version) { std::cout << "sheet-table " << st::kVersion << "\n"; return 0; }

  std::ios::sync_with_stdio(false);
  return st::run_cli(cli, std::cout, std::cerr);
}
