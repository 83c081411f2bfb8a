#pragma once

#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace snowid::apps {

// Option describes one command-line flag. Config is the caller's settings struct.
//
// handler returns false when the value is rejected; it is expected to print the
// reason itself. Parsing continues either way so every bad flag is reported.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParsedArgs is the outcome of parse_options.
// ok is false if any handler rejected its value, a flag was missing its value,
// or an unknown flag was seen.
template <typename Config>
struct ParsedArgs {
  Config config;                        // NOLINT(readability-identifier-naming)
  std::vector<std::string> positional;  // NOLINT(readability-identifier-naming)
  bool ok{true};                        // NOLINT(readability-identifier-naming)
};

// parse_options walks argv[start..argc-1]. Registered flags go to their handler,
// any other "-"-prefixed token is an unknown flag, and everything else is kept
// in order as a positional argument.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 1,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, true};

  std::unordered_map<std::string, const Option<Config>*> by_name;
  for (const auto& opt : options) {
    by_name[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    const auto it = by_name.find(arg);
    if (it == by_name.end()) {
      if (!arg.empty() && arg[0] == '-') {
        std::cerr << "Unknown option: " << arg << "\n";
        parsed.ok = false;
      } else {
        parsed.positional.push_back(arg);
      }
      continue;
    }

    const Option<Config>& opt = *it->second;
    if (!opt.requires_value) {
      parsed.ok = opt.handler(parsed.config, "") && parsed.ok;
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "Option " << arg << " requires a value\n";
      parsed.ok = false;
      continue;
    }
    const std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    parsed.ok = opt.handler(parsed.config, value) && parsed.ok;
  }

  return parsed;
}

// parse_uint64 accepts a non-empty string of decimal digits that fits in 64 bits.
// Signs, whitespace and suffixes are rejected.
inline std::optional<std::uint64_t> parse_uint64(const std::string& value) {
  if (value.empty() || value.size() > 20) {
    return std::nullopt;
  }
  std::uint64_t result = 0;
  for (const char c : value) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    const auto digit = static_cast<std::uint64_t>(c - '0');
    if (result > (UINT64_MAX - digit) / 10) {
      return std::nullopt;
    }
    result = result * 10 + digit;
  }
  return result;
}

}  // namespace snowid::apps
