#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <utility>
#include <cstdlib>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / ".sshgate";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

// ── Targets ─────────────────────────────────────────────────

Result<ConnectionTarget> parse_target(const std::string& spec) {
    std::string s = spec;
    trim(s);
    if (s.empty()) return Result<ConnectionTarget>::Err("empty target");

    ConnectionTarget t;
    std::string hostport = s;
    auto at = s.rfind('@');
    if (at != std::string::npos) {
        t.user = s.substr(0, at);
        hostport = s.substr(at + 1);
    } else {
        const char* env_user = std::getenv("USER");
        t.user = env_user ? env_user : "";
    }
    if (t.user.empty()) return Result<ConnectionTarget>::Err("no user in \"" + spec + "\" and $USER is unset");

    std::string port_str;
    if (!hostport.empty() && hostport[0] == '[') {
        auto close = hostport.find(']');
        if (close == std::string::npos)
            return Result<ConnectionTarget>::Err("unterminated '[' in \"" + spec + "\"");
        t.host = hostport.substr(1, close - 1);
        if (close + 1 < hostport.size()) {
            if (hostport[close + 1] != ':')
                return Result<ConnectionTarget>::Err("unexpected text after ']' in \"" + spec + "\"");
            port_str = hostport.substr(close + 2);
        }
    } else {
        auto colon = hostport.find(':');
        if (colon != std::string::npos && hostport.find(':', colon + 1) == std::string::npos) {
            t.host = hostport.substr(0, colon);
            port_str = hostport.substr(colon + 1);
        } else {
            t.host = hostport;   // bare IPv6 literal or plain host
        }
    }
    if (t.host.empty()) return Result<ConnectionTarget>::Err("no host in \"" + spec + "\"");

    if (!port_str.empty()) {
        int port = safe_stoi(port_str, -1);
        if (port < 1 || port > 65535)
            return Result<ConnectionTarget>::Err("invalid port \"" + port_str + "\"");
        t.port = port;
    }
    return Result<ConnectionTarget>::Ok(t);
}

// ── Sections ────────────────────────────────────────────────

static SshSettings parse_ssh_settings(const YAML::Node& node) {
    SshSettings ssh;
    ssh.binary = node["binary"].as<std::string>(DEFAULT_SSH_BINARY);
    ssh.strict_host_key_checking = node["strict_host_key_checking"].as<std::string>(DEFAULT_HOST_KEY_CHECKING);
    ssh.method_probe = node["method_probe"].as<std::string>("ssh");
    ssh.key_dir = node["key_dir"].as<std::string>("");
    return ssh;
}

static TimeoutSettings parse_timeouts(const YAML::Node& node) {
    TimeoutSettings t;
    t.dns_ms = node["dns_ms"].as<int>(DNS_TIMEOUT_MS);
    t.port_ms = node["port_ms"].as<int>(PORT_TIMEOUT_MS);
    t.method_probe_ms = node["method_probe_ms"].as<int>(METHOD_PROBE_TIMEOUT_MS);
    t.auth_ms = node["auth_ms"].as<int>(AUTH_TIMEOUT_MS);
    return t;
}

static RetrySettings parse_retry(const YAML::Node& node) {
    RetrySettings r;
    r.max_attempts = node["max_attempts"].as<int>(DEFAULT_MAX_ATTEMPTS);
    r.backoff_ms = node["backoff_ms"].as<int>(RETRY_BACKOFF_MS);
    return r;
}

static Result<HostEntry> parse_host_entry(const YAML::Node& node) {
    HostEntry e;
    e.name = node["name"].as<std::string>("");
    e.target.host = node["host"].as<std::string>("");
    e.target.port = node["port"].as<int>(22);
    e.target.user = node["user"].as<std::string>("");
    if (node["identity_file"]) {
        e.target.identity_file = node["identity_file"].as<std::string>();
    }
    if (e.target.host.empty()) return Result<HostEntry>::Err("host entry without 'host'");
    if (e.target.user.empty()) return Result<HostEntry>::Err("host entry '" + e.target.host + "' without 'user'");
    if (e.name.empty()) e.name = e.target.host;
    return Result<HostEntry>::Ok(e);
}

// ── Loading ─────────────────────────────────────────────────


class ConfigBuilder {
public:
    static Result<Config> build(const YAML::Node& root) {
        Config config;
        if (!root || root.IsNull()) return Result<Config>::Ok(config);
        if (!root.IsMap()) return Result<Config>::Err("top level must be a mapping");

        if (root["ssh"]) config.ssh_ = parse_ssh_settings(root["ssh"]);
        if (root["timeouts"]) config.timeouts_ = parse_timeouts(root["timeouts"]);
        if (root["retry"]) config.retry_ = parse_retry(root["retry"]);
        if (root["credentials"]) {
            config.cache_ttl_ = root["credentials"]["cache_ttl"].as<std::string>(DEFAULT_CACHE_TTL);
        }
        if (root["log"]) config.log_path_ = root["log"]["path"].as<std::string>("");

        if (config.ssh_.method_probe != "ssh" && config.ssh_.method_probe != "libssh2") {
            return Result<Config>::Err("ssh.method_probe must be 'ssh' or 'libssh2', got '" +
                                       config.ssh_.method_probe + "'");
        }
        if (config.retry_.max_attempts < 1) {
            return Result<Config>::Err("retry.max_attempts must be at least 1");
        }
        if (config.retry_.backoff_ms < 0) {
            return Result<Config>::Err("retry.backoff_ms must not be negative");
        }
        const std::pair<const char*, int> timeouts[] = {
            {"dns_ms", config.timeouts_.dns_ms},
            {"port_ms", config.timeouts_.port_ms},
            {"method_probe_ms", config.timeouts_.method_probe_ms},
            {"auth_ms", config.timeouts_.auth_ms},
        };
        for (const auto& t : timeouts) {
            if (t.second < 1) {
                return Result<Config>::Err(fmt::format("timeouts.{} must be at least 1, got {}",
                                                       t.first, t.second));
            }
        }

        if (root["hosts"]) {
            if (!root["hosts"].IsSequence()) return Result<Config>::Err("'hosts' must be a list");
            for (const auto& node : root["hosts"]) {
                auto entry = parse_host_entry(node);
                if (entry.is_err()) return Result<Config>::Err(entry.error);
                config.hosts_.push_back(entry.value);
            }
        }
        return Result<Config>::Ok(config);
    }
};

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        return ConfigBuilder::build(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Failed to parse config: " + std::string(e.what()));
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }
    try {
        auto result = ConfigBuilder::build(YAML::LoadFile(path.string()));
        if (result.is_err()) result.error = path.string() + ": " + result.error;
        return result;
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Failed to parse " + path.string() + ": " + std::string(e.what()));
    }
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) return Result<Config>::Ok(Config());
    return load(get_global_config_path());
}

// ── Queries ─────────────────────────────────────────────────

std::optional<HostEntry> Config::find_host(const std::string& name) const {
    for (const auto& h : hosts_) {
        if (h.name == name || h.target.display() == name) return h;
    }
    return std::nullopt;
}

fs::path Config::key_dir() const {
    if (ssh_.key_dir.empty()) return platform::home_dir() / ".ssh";
    return platform::expand_home(ssh_.key_dir);
}
