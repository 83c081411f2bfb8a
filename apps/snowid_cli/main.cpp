#include "snowid/core/version.h"

#include "commands/decode.h"
#include "commands/generate.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "snowid_cli v" << snowid::core::kBuildVersion << "\n"
            << "Usage:\n"
            << "  snowid_cli generate [--config <file>] [--version N] [--datacenter N]\n"
            << "                      [--worker N] [--process N] [--default-sequence N]\n"
            << "                      [--count N] [--format decimal|hex|json|debug]\n"
            << "  snowid_cli decode [--compact] <id> [<id> ...]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "decode") {
    return cmd_decode(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown subcommand: " << subcommand << "\n";
  print_usage();
  return 1;
}
