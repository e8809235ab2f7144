#pragma once

#include <string>
#include <vector>

namespace biostream {

std::string trim(const std::string& s);

std::vector<std::string> split(const std::string& s, char delim);

std::string to_lower(std::string s);
std::string to_upper(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Strict numeric parsing helpers.
//
// These functions trim leading/trailing whitespace and then require that the
// entire remaining string is a valid number (no trailing "abc" fragments).
// Doubles are parsed in the classic "C" locale so that '.' is always the
// decimal separator.
int to_int(const std::string& s);
double to_double(const std::string& s);

// Parse common boolean spellings: 1/0, true/false, yes/no, on/off.
bool to_bool(const std::string& s);

bool file_exists(const std::string& path);
void ensure_directory(const std::string& path);

} // namespace biostream
