#pragma once
#include <string>

// True when s is well-formed UTF-8 (no overlongs, surrogates or code points
// above U+10FFFF).
bool is_valid_utf8(const std::string& s);

// s with every byte that does not start a well-formed sequence dropped.
// Valid input comes back unchanged.
std::string drop_invalid_utf8(const std::string& s);
