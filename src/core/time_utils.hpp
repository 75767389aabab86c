#pragma once

#include <string>
#include <optional>
#include <cstdint>

// Parse "30s", "15m", "2h". Returns nullopt for anything else
// (no bare numbers, no compound forms).
std::optional<int64_t> parse_duration_ms(const std::string& spec);

// Format a remaining lifetime, rounding minutes up: "14m", "1h", "1h 5m".
// Zero or negative input yields "expired".
std::string format_remaining(int64_t ms);

// Format a probe duration: "350ms", "1.2s", "2m5s".
std::string format_elapsed(int64_t ms);
