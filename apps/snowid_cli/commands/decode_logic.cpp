#include "decode_logic.h"

#include "snowid/app/app_service.h"
#include "snowid/core/id128_codec.h"

#include <iostream>

int execute_decode(const std::string& text, std::ostream& out, const bool compact) {
  const auto decoded = snowid::app::decode_id(text);
  if (!decoded.has_value()) {
    std::cerr << "Error: cannot decode '" << text
              << "': " << snowid::core::describe(decoded.error()) << "\n";
    return 1;
  }

  const auto j = snowid::core::id128_to_json(decoded.value());
  out << (compact ? j.dump() : j.dump(2)) << "\n";
  return 0;
}
