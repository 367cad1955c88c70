#pragma once

#include <string>

namespace workq::util {

// Well-formed UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF
bool is_valid_utf8(const std::string& text);

// True if text can be stored as PostgreSQL TEXT: valid UTF-8 without NUL bytes
bool is_storable_text(const std::string& text);

// Replaces NUL bytes and malformed UTF-8 sequences with '?'
std::string to_storable_text(const std::string& text);

} // namespace workq::util
