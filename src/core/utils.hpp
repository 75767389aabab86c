#pragma once

#include <string>
#include <vector>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::string to_lower(std::string s);

// Case-insensitive substring test.
bool contains_icase(const std::string& haystack, const std::string& needle);

// Split on a delimiter, trimming each piece and dropping empty ones.
std::vector<std::string> split_trimmed(const std::string& s, char delim);
