#pragma once

#include <string>
#include <vector>

namespace tabula {

std::string trim(const std::string& s);
std::string to_lower(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Splits on every occurrence of sep; keeps empty pieces.
std::vector<std::string> split(const std::string& s, char sep);

// Splits on runs of whitespace; never yields empty pieces.
std::vector<std::string> split_whitespace(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

bool is_blank_row(const std::vector<std::string>& row);

} // namespace tabula
