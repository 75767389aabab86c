#pragma once

#include <string>
#include <map>
#include <utility>
#include <optional>
#include <chrono>
#include <functional>
#include <core/types.hpp>
#include <core/constants.hpp>

// Process-lifetime credential store. Nothing is written to disk; entries
// expire lazily when read. Keyed by (host, user) so an '@' in either part
// cannot collide with another target.
class SessionCredentialCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit SessionCredentialCache(std::chrono::milliseconds default_ttl =
                                        std::chrono::milliseconds(DEFAULT_CACHE_TTL_MS),
                                    Clock clock = nullptr);

    void store(const std::string& host, const std::string& user,
               CredentialType type, const std::string& value,
               std::chrono::milliseconds ttl);
    void store(const std::string& host, const std::string& user,
               CredentialType type, const std::string& value);

    // Evicts and returns nullopt once expired.
    std::optional<CachedCredential> get(const std::string& host, const std::string& user);

    bool contains(const std::string& host, const std::string& user) {
        return get(host, user).has_value();
    }

    void clear(const std::string& host, const std::string& user);
    void clear_all();

    // Live entries only.
    size_t size();

    // nullopt when absent or expired.
    std::optional<std::chrono::milliseconds> remaining(const std::string& host, const std::string& user);

    std::chrono::milliseconds default_ttl() const { return default_ttl_; }

    // "30s" / "15m" / "2h". Anything else logs a warning and yields the
    // 15 minute default.
    static std::chrono::milliseconds parse_ttl(const std::string& spec);

    // "14m", "1h 5m", "expired"
    static std::string format_remaining(std::chrono::milliseconds ms);

private:
    using Key = std::pair<std::string, std::string>;   // (host, user)

    std::chrono::milliseconds default_ttl_;
    Clock clock_;
    std::map<Key, CachedCredential> entries_;

    std::chrono::steady_clock::time_point now() const { return clock_(); }
    bool expired(const CachedCredential& c) const { return c.expires_at < now(); }
};
