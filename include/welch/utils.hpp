#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace welch {

std::string trim(const std::string& s);

// Remove a UTF-8 BOM (0xEF,0xBB,0xBF) from the beginning of a string if present.
std::string strip_utf8_bom(std::string s);

std::string to_lower(std::string s);

// Split a single CSV row into fields.
//
// Supports double-quoted fields with "" escaping; delimiters inside quotes are
// preserved. Returned fields are unquoted. Multi-line fields are not supported.
std::vector<std::string> split_csv_row(const std::string& row, char delim);

// Strict numeric parsing helpers.
//
// Leading/trailing whitespace is trimmed and the remaining string must be a
// complete number ("12abc" is rejected). to_double() parses with the classic
// "C" locale and also accepts a single decimal comma ("0,5") when no '.' is
// present. to_size() rejects negative values. All throw std::runtime_error.
size_t to_size(const std::string& s);
double to_double(const std::string& s);

} // namespace welch
