#include "platform.hpp"
#include <cstdlib>
#include <climits>
#include <unistd.h>
#include <pwd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) return fs::path(pw->pw_dir);
    return temp_dir();
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path expand_home(const std::string& path) {
    if (path == "~") return home_dir();
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/')
        return home_dir() / path.substr(2);
    return fs::path(path);
}

fs::path self_exe_path() {
    char buf[PATH_MAX];
    ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return fs::path();
    buf[n] = '\0';
    return fs::path(buf);
}

bool stdin_is_tty() {
    return isatty(STDIN_FILENO) == 1;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
