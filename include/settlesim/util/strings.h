#pragma once

#include <string>

namespace settlesim {

std::string to_lower(std::string s);
std::string to_upper(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim(const std::string& s);

// Fixed-point formatting for log lines, e.g. format_fixed(12.3456, 2) == "12.35".
std::string format_fixed(double v, int decimals);

} // namespace settlesim
