#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <string>
#include <vector>

std::string ToLower(const std::string& str);
std::string Trim(const std::string& str);
std::vector<std::string> SplitWhitespace(const std::string& str);
bool StartsWith(const std::string& str, const std::string& prefix);
bool Contains(const std::string& str, const std::string& substr);
bool ParseInt(const std::string& str, int& value);
std::string EscapeJson(const std::string& str);

#endif // STRING_UTILS_H
