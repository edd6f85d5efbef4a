#pragma once
#include <string>
#include <vector>

namespace core {

std::string trim(const std::string& s);
std::string to_lower(std::string s);

// Lowercase alphanumeric tokens, everything else is a separator
std::vector<std::string> tokenize_words(const std::string& s);

// Joins with one space, skipping empty parts
std::string join_words(const std::vector<std::string>& parts);

} // namespace core
