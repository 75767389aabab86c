#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

struct KnownConnection {
    std::string host;
    int port = 22;
    std::string user;
    std::string auth;                       // "key" or "password"
    std::optional<std::string> key_path;
    std::string last_connected;             // ISO 8601
};

// Successful resolutions remembered across runs in a YAML file. Records
// how a host was reached, never the password itself.
class KnownConnections {
public:
    explicit KnownConnections(std::filesystem::path path);

    // ~/.sshgate/connections.yaml
    static std::filesystem::path default_path();

    Result<std::vector<KnownConnection>> load() const;

    // Replaces any entry for the same (host, port, user).
    Result<void> save(const ResolvedConnection& rc) const;

    std::optional<KnownConnection> find(const std::string& host, const std::string& user) const;

    // Starts a target from its last successful connection: a recorded key
    // becomes the identity file unless one is already set.
    void apply(ConnectionTarget& target) const;

private:
    std::filesystem::path path_;

    Result<void> write(const std::vector<KnownConnection>& entries) const;
};
