#pragma once
#include <string>
#include <vector>

namespace TextUtils {

std::string trim(const std::string& value);

// Splits on '\n' and drops a trailing '\r' from every line. Empty lines are kept.
std::vector<std::string> splitLines(const std::string& text);

// Splits on runs of spaces and tabs.
std::vector<std::string> splitWhitespace(const std::string& text);

std::vector<std::string> split(const std::string& text, char delimiter);

bool startsWith(const std::string& value, const std::string& prefix);
bool contains(const std::string& haystack, const std::string& needle);
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

std::string toLower(const std::string& value);

// "SAMSUNG electronics" -> "Samsung Electronics"
std::string capitalizeWords(const std::string& value);

std::string removeAll(const std::string& value, char ch);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

// $HOME, falling back to the passwd entry of the current user
std::string homeDirectory();

// Replaces a leading "~" with the home directory
std::string expandHome(const std::string& path);

bool readFile(const std::string& path, std::string& contents);

} // namespace TextUtils
