#pragma once

#include <filesystem>
#include <vector>

// Finds private keys in an ssh directory. Default identity names come
// first in fixed order; only when none exist is the directory scanned for
// other extension-less files that carry a private key header.
class KeyLocator {
public:
    explicit KeyLocator(std::filesystem::path ssh_dir);

    std::vector<std::filesystem::path> discover() const;
    bool has_keys() const { return !discover().empty(); }

    const std::filesystem::path& ssh_dir() const { return ssh_dir_; }

    // First bytes contain "-----BEGIN" and "PRIVATE KEY".
    static bool looks_like_private_key(const std::filesystem::path& path);

private:
    std::filesystem::path ssh_dir_;
};
