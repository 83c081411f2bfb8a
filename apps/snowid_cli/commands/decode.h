#pragma once

// cmd_decode: print the fields of one or more ids.
// Usage: snowid_cli decode [--compact] <id> [<id> ...]
int cmd_decode(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
