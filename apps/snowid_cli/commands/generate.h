#pragma once

// cmd_generate: generate ids from the system clock and print them to stdout.
// Usage: snowid_cli generate [--config <file>] [--version N] [--datacenter N] [--worker N]
//                            [--process N] [--default-sequence N] [--count N]
//                            [--format decimal|hex|json|debug]
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
