#include "key_locator.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <set>
#include <string>

namespace fs = std::filesystem;

KeyLocator::KeyLocator(fs::path ssh_dir) : ssh_dir_(std::move(ssh_dir)) {}

bool KeyLocator::looks_like_private_key(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::string head(KEY_HEADER_PEEK_BYTES, '\0');
    in.read(&head[0], KEY_HEADER_PEEK_BYTES);
    head.resize(static_cast<size_t>(in.gcount()));
    return head.find("-----BEGIN") != std::string::npos &&
           head.find("PRIVATE KEY") != std::string::npos;
}

std::vector<fs::path> KeyLocator::discover() const {
    std::vector<fs::path> keys;
    std::error_code ec;

    for (const char* name : DEFAULT_KEY_NAMES) {
        fs::path p = ssh_dir_ / name;
        if (fs::is_regular_file(p, ec)) keys.push_back(p);
    }
    if (!keys.empty()) return keys;

    if (!fs::is_directory(ssh_dir_, ec)) return keys;

    static const std::set<std::string> skip = {"known_hosts", "authorized_keys", "config"};
    std::vector<fs::path> candidates;
    for (fs::directory_iterator it(ssh_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        std::string name = it->path().filename().string();
        if (name.find('.') != std::string::npos || skip.count(name)) continue;
        candidates.push_back(it->path());
    }
    std::sort(candidates.begin(), candidates.end());
    if (candidates.size() > static_cast<size_t>(KEY_SCAN_MAX_FILES))
        candidates.resize(KEY_SCAN_MAX_FILES);

    for (const auto& c : candidates) {
        if (looks_like_private_key(c)) keys.push_back(c);
    }
    if (!keys.empty())
        sshgate_log(fmt::format("keys: {} non-default key(s) found in {}", keys.size(), ssh_dir_.string()));
    return keys;
}
