#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

inline std::string& sshgate_log_path_ref() {
    static std::string path = (platform::temp_dir() / "sshgate_debug.log").string();
    return path;
}

inline std::string sshgate_log_path() {
    return sshgate_log_path_ref();
}

// Redirect the debug log (from config). Empty keeps the default.
inline void set_sshgate_log_path(const std::string& path) {
    if (!path.empty()) sshgate_log_path_ref() = path;
}

inline void sshgate_log(const std::string& msg) {
    std::ofstream out(sshgate_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

// Never pass an argv that carries a secret; password attempts keep it in
// the child's environment instead.
inline void sshgate_log_cmd(const std::string& label, const std::vector<std::string>& argv,
                            const CommandResult& r) {
    sshgate_log(fmt::format("{} CMD: {}", label, fmt::join(argv, " ")));
    sshgate_log(fmt::format("{} exit={}{} stdout({})={}", label, r.exit_code,
                            r.timed_out ? " (timed out)" : "",
                            r.stdout_data.size(), r.stdout_data.substr(0, LOG_OUTPUT_TRUNCATE)));
    if (!r.stderr_data.empty())
        sshgate_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, LOG_OUTPUT_TRUNCATE)));
}
