#pragma once

#include <string>

// Double-quote s, escaping backslash, quote and control characters
// (\n, \r, \t, other bytes below 0x20 and 0x7f as \xNN). The result never
// contains an unescaped quote, so quoted fields can be joined unambiguously.
std::string quote(const std::string& s);

