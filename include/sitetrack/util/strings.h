#pragma once

#include <string>
#include <vector>

namespace sitetrack {

std::string to_lower(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim_copy(const std::string& s);

// Splits on a single delimiter. Empty fields are kept.
std::vector<std::string> split(const std::string& s, char delim);

// Escapes a string for safe inclusion in a CSV cell.
//
// If the string contains a comma, quote, or newline, the result will be wrapped
// in double-quotes and any internal quotes will be doubled.
std::string csv_escape(const std::string& s);

// Fixed-point formatting for percentages and pixel values ("12.50").
std::string format_fixed(double v, int decimals);

} // namespace sitetrack
