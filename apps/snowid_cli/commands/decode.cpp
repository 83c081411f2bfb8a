#include "decode.h"

#include "decode_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct DecodeCliConfig {
  bool compact{false};  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_decode(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<snowid::apps::Option<DecodeCliConfig>> options = {
      {"--compact", false, "Print each id as single-line JSON",
       [](DecodeCliConfig& c, const std::string& /*value*/) {
         c.compact = true;
         return true;
       }},
  };
  const auto parsed = snowid::apps::parse_options(argc, argv, options, 2);

  if (!parsed.ok || parsed.positional.empty()) {
    std::cerr << "Usage: snowid_cli decode [--compact] <id> [<id> ...]\n";
    return 1;
  }

  int status = 0;
  for (const auto& text : parsed.positional) {
    if (execute_decode(text, std::cout, parsed.config.compact) != 0) {
      status = 1;
    }
  }
  return status;
}
