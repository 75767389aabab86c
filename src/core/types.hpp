#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <chrono>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Subprocess execution result
struct CommandResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;

    bool success() const { return exit_code == 0 && !timed_out; }
    bool failed() const { return !success(); }

    // ssh writes its diagnostics to stderr; parsers want everything.
    std::string combined() const { return stdout_data + stderr_data; }
};

// ── Targets ─────────────────────────────────────────────────

struct ConnectionTarget {
    std::string host;
    int port = 22;
    std::string user;
    std::optional<std::string> identity_file;   // explicit key, tried before discovery

    std::string display() const {
        return user + "@" + host + (port == 22 ? "" : ":" + std::to_string(port));
    }
};

// ── Error taxonomy ──────────────────────────────────────────

enum class ErrorCategory {
    Dns,
    Port,
    Timeout,
    Network,
    Authentication,
    Unknown,
};

enum class AuthFailureKind {
    None,
    KeyFormat,
    KeyNotFound,
    KeyRejected,
    PasswordIncorrect,
    PasswordDisabledOnServer,
    HostKeyMismatch,
    Other,
};

struct NetworkErrorDetail {
    ErrorCategory category = ErrorCategory::Unknown;
    std::string code;
    std::string message;
    bool is_retryable = false;
    std::vector<std::string> suggestions;
    AuthFailureKind auth_kind = AuthFailureKind::None;   // only for Authentication
};

struct ConnectivityResult {
    bool dns_ok = false;
    bool port_ok = false;
    std::optional<NetworkErrorDetail> detail;   // absent on success
    int64_t duration_ms = 0;

    bool success() const { return dns_ok && port_ok; }
};

// ── Authentication ──────────────────────────────────────────

enum class AuthStrategyKind {
    PasswordOnly,
    KeyOnly,
    MultipleMethods,
    Unknown,
};

struct AuthStrategy {
    AuthStrategyKind kind = AuthStrategyKind::Unknown;
    std::string primary_method = "publickey";
    std::vector<std::string> fallback_methods = {"password"};
    bool should_prompt_user = true;
    std::vector<std::string> methods;       // as reported by the server
    std::string server_banner;

    bool offers(const std::string& method) const {
        for (const auto& m : methods)
            if (m == method) return true;
        return false;
    }

    // Unknown means "assume nothing", which includes password.
    bool supports_password() const {
        return kind == AuthStrategyKind::Unknown ||
               offers("password") || offers("keyboard-interactive");
    }
};

enum class CredentialType {
    Key,
    Password,
};

enum class AuthStatus {
    NotTested,              // an earlier stage failed
    Accepted,
    Rejected,
    CredentialsRequired,    // nothing local worked, the user must supply something
};

struct AuthResult {
    AuthStatus status = AuthStatus::NotTested;
    bool success = false;
    std::optional<CredentialType> method;
    std::optional<std::string> key_path;
    std::string message;
    AuthFailureKind failure = AuthFailureKind::None;

    bool tested() const { return status != AuthStatus::NotTested; }
};

enum class PrimaryIssue {
    None,
    Network,
    Port,
    Authentication,
};

struct ConnectionDiagnostics {
    ConnectivityResult connectivity;
    std::optional<AuthStrategy> auth_strategy;
    AuthResult auth_result;
    bool overall_success = false;
    PrimaryIssue primary_issue = PrimaryIssue::None;
    std::string detailed_message;
    std::vector<std::string> suggestions;
    bool password_required = false;
    std::optional<NetworkErrorDetail> failure_detail;   // classified cause of the failing stage
};

// ── Credentials ─────────────────────────────────────────────

struct CredentialAttempt {
    CredentialType type = CredentialType::Password;
    std::string value;          // password or key path
    int attempt_number = 1;
    int max_attempts = 1;
};

struct CachedCredential {
    std::string value;
    CredentialType type = CredentialType::Password;
    std::chrono::steady_clock::time_point expires_at;
};

// What the persistence collaborator receives after a successful resolution.
// Passwords are never part of it.
struct ResolvedConnection {
    ConnectionTarget target;
    CredentialType auth_type = CredentialType::Key;
    std::optional<std::string> key_path;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

// ── Display names ───────────────────────────────────────────

inline const char* to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::Dns:            return "dns";
        case ErrorCategory::Port:           return "port";
        case ErrorCategory::Timeout:        return "timeout";
        case ErrorCategory::Network:        return "network";
        case ErrorCategory::Authentication: return "authentication";
        case ErrorCategory::Unknown:        break;
    }
    return "unknown";
}

inline const char* to_string(AuthFailureKind k) {
    switch (k) {
        case AuthFailureKind::None:                     return "none";
        case AuthFailureKind::KeyFormat:                return "key-format";
        case AuthFailureKind::KeyNotFound:              return "key-not-found";
        case AuthFailureKind::KeyRejected:              return "key-rejected";
        case AuthFailureKind::PasswordIncorrect:        return "password-incorrect";
        case AuthFailureKind::PasswordDisabledOnServer: return "password-disabled-on-server";
        case AuthFailureKind::HostKeyMismatch:          return "host-key-mismatch";
        case AuthFailureKind::Other:                    break;
    }
    return "other";
}

inline const char* to_string(AuthStrategyKind k) {
    switch (k) {
        case AuthStrategyKind::PasswordOnly:    return "password-only";
        case AuthStrategyKind::KeyOnly:         return "key-only";
        case AuthStrategyKind::MultipleMethods: return "multiple-methods";
        case AuthStrategyKind::Unknown:         break;
    }
    return "unknown";
}

inline const char* to_string(PrimaryIssue p) {
    switch (p) {
        case PrimaryIssue::None:           return "none";
        case PrimaryIssue::Network:        return "network";
        case PrimaryIssue::Port:           return "port";
        case PrimaryIssue::Authentication: return "authentication";
    }
    return "none";
}

inline const char* to_string(CredentialType t) {
    return t == CredentialType::Key ? "key" : "password";
}
