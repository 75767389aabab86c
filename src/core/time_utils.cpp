#include "time_utils.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <regex>

std::optional<int64_t> parse_duration_ms(const std::string& spec) {
    static const std::regex re("^(\\d+)([smh])$");
    std::string s = spec;
    trim(s);
    std::smatch m;
    if (!std::regex_match(s, m, re)) return std::nullopt;

    int64_t value;
    try {
        value = std::stoll(m[1].str());
    } catch (const std::exception&) {
        return std::nullopt;
    }
    switch (m[2].str()[0]) {
        case 's': return value * 1000;
        case 'm': return value * 60 * 1000;
        case 'h': return value * 60 * 60 * 1000;
    }
    return std::nullopt;
}

std::string format_remaining(int64_t ms) {
    if (ms <= 0) return "expired";

    int64_t minutes = (ms + 60000 - 1) / 60000;
    if (minutes < 60) return fmt::format("{}m", minutes);

    int64_t hours = minutes / 60;
    int64_t rest = minutes % 60;
    if (rest == 0) return fmt::format("{}h", hours);
    return fmt::format("{}h {}m", hours, rest);
}

std::string format_elapsed(int64_t ms) {
    if (ms < 1000) return fmt::format("{}ms", ms < 0 ? 0 : ms);
    if (ms < 60000) return fmt::format("{:.1f}s", static_cast<double>(ms) / 1000.0);
    int64_t secs = ms / 1000;
    return fmt::format("{}m{}s", secs / 60, secs % 60);
}
