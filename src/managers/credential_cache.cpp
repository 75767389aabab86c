#include "credential_cache.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>

SessionCredentialCache::SessionCredentialCache(std::chrono::milliseconds default_ttl, Clock clock)
    : default_ttl_(default_ttl), clock_(std::move(clock)) {
    if (!clock_) clock_ = [] { return std::chrono::steady_clock::now(); };
}

void SessionCredentialCache::store(const std::string& host, const std::string& user,
                                   CredentialType type, const std::string& value,
                                   std::chrono::milliseconds ttl) {
    CachedCredential c;
    c.value = value;
    c.type = type;
    c.expires_at = now() + ttl;
    entries_[Key(host, user)] = std::move(c);
    sshgate_log(fmt::format("cache: stored {} for {}@{} (expires in {})",
                            to_string(type), user, host, format_remaining(ttl)));
}

void SessionCredentialCache::store(const std::string& host, const std::string& user,
                                   CredentialType type, const std::string& value) {
    store(host, user, type, value, default_ttl_);
}

std::optional<CachedCredential> SessionCredentialCache::get(const std::string& host,
                                                           const std::string& user) {
    auto it = entries_.find(Key(host, user));
    if (it == entries_.end()) return std::nullopt;
    if (expired(it->second)) {
        entries_.erase(it);
        sshgate_log(fmt::format("cache: {}@{} expired", user, host));
        return std::nullopt;
    }
    return it->second;
}

void SessionCredentialCache::clear(const std::string& host, const std::string& user) {
    entries_.erase(Key(host, user));
}

void SessionCredentialCache::clear_all() {
    entries_.clear();
}

size_t SessionCredentialCache::size() {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (expired(it->second)) it = entries_.erase(it);
        else ++it;
    }
    return entries_.size();
}

std::optional<std::chrono::milliseconds> SessionCredentialCache::remaining(const std::string& host,
                                                                         const std::string& user) {
    auto c = get(host, user);
    if (!c) return std::nullopt;
    return std::chrono::duration_cast<std::chrono::milliseconds>(c->expires_at - now());
}

std::chrono::milliseconds SessionCredentialCache::parse_ttl(const std::string& spec) {
    auto ms = parse_duration_ms(spec);
    if (!ms) {
        sshgate_log(fmt::format("cache: invalid ttl \"{}\", using {}", spec, DEFAULT_CACHE_TTL));
        return std::chrono::milliseconds(DEFAULT_CACHE_TTL_MS);
    }
    return std::chrono::milliseconds(*ms);
}

std::string SessionCredentialCache::format_remaining(std::chrono::milliseconds ms) {
    return ::format_remaining(ms.count());
}
