#pragma once

#include <ostream>
#include <string>

// execute_decode: decode a 40-digit decimal or 32-character hex id and print its
// fields as JSON to out (indented, or on one line when compact).
// Returns 1 (error on stderr) if the text is not a valid id.
int execute_decode(const std::string& text, std::ostream& out, bool compact = false);
