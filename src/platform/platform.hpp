#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the passwd entry).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Expands a leading "~/" against home_dir().
std::filesystem::path expand_home(const std::string& path);

// Absolute path of the running executable (/proc/self/exe).
std::filesystem::path self_exe_path();

// True if stdin is attached to a terminal.
bool stdin_is_tty();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
