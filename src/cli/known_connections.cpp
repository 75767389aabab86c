#include "known_connections.hpp"
#include <core/config.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

KnownConnections::KnownConnections(fs::path path) : path_(std::move(path)) {}

fs::path KnownConnections::default_path() {
    return get_global_config_dir() / "connections.yaml";
}

Result<std::vector<KnownConnection>> KnownConnections::load() const {
    std::vector<KnownConnection> entries;
    if (!fs::exists(path_)) return Result<std::vector<KnownConnection>>::Ok(entries);

    try {
        YAML::Node root = YAML::LoadFile(path_.string());
        for (const auto& node : root["connections"]) {
            KnownConnection c;
            c.host = node["host"].as<std::string>("");
            c.port = node["port"].as<int>(22);
            c.user = node["user"].as<std::string>("");
            c.auth = node["auth"].as<std::string>("key");
            if (node["key_path"]) c.key_path = node["key_path"].as<std::string>();
            c.last_connected = node["last_connected"].as<std::string>("");
            if (!c.host.empty()) entries.push_back(c);
        }
    } catch (const YAML::Exception& e) {
        return Result<std::vector<KnownConnection>>::Err(
            "Failed to read " + path_.string() + ": " + std::string(e.what()));
    }
    return Result<std::vector<KnownConnection>>::Ok(entries);
}

Result<void> KnownConnections::save(const ResolvedConnection& rc) const {
    auto loaded = load();
    if (loaded.is_err()) return Result<void>::Err(loaded.error);

    KnownConnection c;
    c.host = rc.target.host;
    c.port = rc.target.port;
    c.user = rc.target.user;
    c.auth = to_string(rc.auth_type);
    if (rc.auth_type == CredentialType::Key) c.key_path = rc.key_path;
    c.last_connected = now_iso();

    std::vector<KnownConnection> entries;
    for (const auto& e : loaded.value) {
        if (e.host == c.host && e.port == c.port && e.user == c.user) continue;
        entries.push_back(e);
    }
    entries.push_back(c);
    return write(entries);
}

std::optional<KnownConnection> KnownConnections::find(const std::string& host,
                                                      const std::string& user) const {
    auto loaded = load();
    if (loaded.is_err()) return std::nullopt;
    for (const auto& e : loaded.value) {
        if (e.host == host && e.user == user) return e;
    }
    return std::nullopt;
}

void KnownConnections::apply(ConnectionTarget& target) const {
    if (target.identity_file) return;
    auto entry = find(target.host, target.user);
    if (!entry || entry->port != target.port) return;
    if (entry->auth == "key" && entry->key_path) target.identity_file = entry->key_path;
}

Result<void> KnownConnections::write(const std::vector<KnownConnection>& entries) const {
    YAML::Emitter out;
    out << YAML::BeginMap << YAML::Key << "connections" << YAML::Value << YAML::BeginSeq;
    for (const auto& e : entries) {
        out << YAML::BeginMap;
        out << YAML::Key << "host" << YAML::Value << e.host;
        out << YAML::Key << "port" << YAML::Value << e.port;
        out << YAML::Key << "user" << YAML::Value << e.user;
        out << YAML::Key << "auth" << YAML::Value << e.auth;
        if (e.key_path) out << YAML::Key << "key_path" << YAML::Value << *e.key_path;
        out << YAML::Key << "last_connected" << YAML::Value << e.last_connected;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq << YAML::EndMap;

    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) return Result<void>::Err("Failed to create " + path_.parent_path().string() + ": " + ec.message());

    std::ofstream f(path_);
    if (!f) return Result<void>::Err("Failed to write " + path_.string());
    f << out.c_str() << "\n";
    return Result<void>::Ok();
}
