#ifndef FLUENT_UTIL_HPP
#define FLUENT_UTIL_HPP

#include <string>
#include <vector>

namespace fluent {

// ASCII lower-casing; other bytes are left alone.
std::string to_lower(std::string s);

// Split on a delimiter, dropping empty tokens.
std::vector<std::string> split(const std::string& s, char delim);

// Strip leading/trailing whitespace.
std::string trim(const std::string& s);

// Transliterate UTF-8 text to plain ASCII: Latin accented letters lose their
// accents ("é" -> "e", "ß" -> "ss"), other non-ASCII code points are dropped.
std::string fold_ascii(const std::string& s);

// Natural-order comparison ("img2" < "img10"). Returns <0, 0 or >0.
int natural_compare(const std::string& a, const std::string& b, bool fold_case = false);

} // namespace fluent

#endif // FLUENT_UTIL_HPP
