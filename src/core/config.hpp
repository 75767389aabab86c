#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

struct SshSettings {
    std::string binary = DEFAULT_SSH_BINARY;
    std::string strict_host_key_checking = DEFAULT_HOST_KEY_CHECKING;
    std::string method_probe = "ssh";           // "ssh" or "libssh2"
    std::string key_dir;                        // empty: ~/.ssh
};

struct TimeoutSettings {
    int dns_ms = DNS_TIMEOUT_MS;
    int port_ms = PORT_TIMEOUT_MS;
    int method_probe_ms = METHOD_PROBE_TIMEOUT_MS;
    int auth_ms = AUTH_TIMEOUT_MS;
};

struct RetrySettings {
    int max_attempts = DEFAULT_MAX_ATTEMPTS;
    int backoff_ms = RETRY_BACKOFF_MS;
};

struct HostEntry {
    std::string name;
    ConnectionTarget target;
};

class Config {
public:
    // Load ~/.sshgate/config.yaml. A missing file yields the defaults.
    static Result<Config> load_global();

    // Load a specific file. A missing file is an error here.
    static Result<Config> load(const fs::path& path);

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const SshSettings& ssh() const { return ssh_; }
    const TimeoutSettings& timeouts() const { return timeouts_; }
    const RetrySettings& retry() const { return retry_; }
    const std::string& cache_ttl() const { return cache_ttl_; }
    const std::string& log_path() const { return log_path_; }
    const std::vector<HostEntry>& hosts() const { return hosts_; }

    // Host entry by name, or by "user@host" display form.
    std::optional<HostEntry> find_host(const std::string& name) const;

    fs::path key_dir() const;

public:
    Config() = default;

private:
    SshSettings ssh_;
    TimeoutSettings timeouts_;
    RetrySettings retry_;
    std::string cache_ttl_ = DEFAULT_CACHE_TTL;
    std::string log_path_;
    std::vector<HostEntry> hosts_;

    friend class ConfigBuilder;
};

// "user@host", "user@host:2222", "host", "user@[::1]:2222". The user
// defaults to $USER; the last '@' separates user from host.
Result<ConnectionTarget> parse_target(const std::string& spec);

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
bool global_config_exists();
