#include "utils.hpp"
#include <chrono>
#include <ctime>
#include <cctype>
#include <algorithm>
#include <sstream>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        return used == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains_icase(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::vector<std::string> split_trimmed(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string piece;
    while (std::getline(in, piece, delim)) {
        trim(piece);
        if (!piece.empty()) out.push_back(piece);
    }
    return out;
}
