#include "diagnostics_engine.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace fs = std::filesystem;

std::string compose_message(const std::string& headline, const std::vector<std::string>& suggestions) {
    if (suggestions.empty()) return headline;
    return headline + "\n\n" + format_suggestions(suggestions);
}

DiagnosticsEngine::DiagnosticsEngine(ConnectivityProbe& connectivity, AuthMethodProbe& methods,
                                     Authenticator& authenticator, const KeyLocator& keys,
                                     SessionCredentialCache& cache, DiagnosticsTimeouts timeouts)
    : connectivity_(connectivity), methods_(methods), authenticator_(authenticator),
      keys_(keys), cache_(cache), timeouts_(timeouts) {}

void DiagnosticsEngine::report(const std::string& msg) const {
    if (status_ && !quiet_) status_(msg);
}

// ── diagnose ────────────────────────────────────────────────

ConnectionDiagnostics DiagnosticsEngine::diagnose(const ConnectionTarget& target,
                                                  const DiagnoseOptions& opts) {
    quiet_ = opts.suppress_debug_output;
    ConnectionDiagnostics d;
    sshgate_log(fmt::format("diagnose {}: start", target.display()));

    // Stage 1: DNS + TCP
    report(fmt::format("Checking {}:{}...", target.host, target.port));
    d.connectivity = connectivity_.probe(target.host, target.port, timeouts_.dns_ms, timeouts_.port_ms);
    if (!d.connectivity.success()) {
        const NetworkErrorDetail& detail = *d.connectivity.detail;
        std::string headline;
        if (!d.connectivity.dns_ok || detail.category == ErrorCategory::Network) {
            d.primary_issue = PrimaryIssue::Network;
            headline = fmt::format("Cannot reach host {}: {}", target.host, detail.message);
        } else {
            d.primary_issue = PrimaryIssue::Port;
            headline = fmt::format("SSH port {} is not accessible: {}", target.port, detail.message);
        }
        d.failure_detail = detail;
        d.suggestions = detail.suggestions;
        d.detailed_message = compose_message(headline, d.suggestions);
        sshgate_log(fmt::format("diagnose {}: {} failure ({})", target.display(),
                                to_string(d.primary_issue), detail.code));
        return d;
    }

    // Stage 2: what will the server accept
    std::vector<fs::path> keys = keys_.discover();
    bool has_keys = !keys.empty() || target.identity_file.has_value();
    report("Detecting authentication methods...");
    d.auth_strategy = methods_.detect(target, timeouts_.method_probe_ms, has_keys);
    report(AuthMethodProbe::describe(*d.auth_strategy));

    // Stage 3: real attempts
    authenticate(target, d, keys);
    sshgate_log(fmt::format("diagnose {}: primary issue {}, auth {}", target.display(),
                            to_string(d.primary_issue), to_string(d.auth_result.failure)));
    return d;
}

// ── Authentication stage ────────────────────────────────────

AuthAttemptOutcome DiagnosticsEngine::try_credential(const ConnectionTarget& target,
                                                     CredentialType type,
                                                     const std::string& value) {
    if (type == CredentialType::Password)
        return authenticator_.try_password(target, value, timeouts_.auth_ms);
    return authenticator_.try_key(target, value, timeouts_.auth_ms);
}

void DiagnosticsEngine::authenticate(const ConnectionTarget& target, ConnectionDiagnostics& d,
                                     const std::vector<fs::path>& keys) {
    const AuthStrategy& strategy = *d.auth_strategy;
    std::optional<CredentialType> last_type;
    SshFailure last_failure;

    // Cached credential from earlier in this run
    if (auto cached = cache_.get(target.host, target.user)) {
        report(fmt::format("Trying cached {}...", to_string(cached->type)));
        AuthAttemptOutcome out = try_credential(target, cached->type, cached->value);
        if (out.accepted) {
            record_success(d, cached->type, cached->value);
            return;
        }
        if (out.failure.transport) {
            record_transport_failure(d, *out.failure.transport);
            return;
        }
        if (out.failure.kind == AuthFailureKind::HostKeyMismatch) {
            record_auth_failure(d, cached->type, out.failure);
            return;
        }
        cache_.clear(target.host, target.user);
        last_type = cached->type;
        last_failure = out.failure;
    }

    // Explicit identity first, then discovered keys in priority order
    std::vector<std::string> candidates;
    if (target.identity_file)
        candidates.push_back(platform::expand_home(*target.identity_file).string());
    for (const auto& k : keys) {
        if (std::find(candidates.begin(), candidates.end(), k.string()) == candidates.end())
            candidates.push_back(k.string());
    }

    for (const auto& key : candidates) {
        report(fmt::format("Trying key {}...", key));
        AuthAttemptOutcome out = authenticator_.try_key(target, key, timeouts_.auth_ms);
        if (out.accepted) {
            record_success(d, CredentialType::Key, key);
            return;
        }
        if (out.failure.transport) {
            record_transport_failure(d, *out.failure.transport);
            return;
        }
        // A missing file never reached the server; keep the last real answer.
        if (out.failure.kind == AuthFailureKind::KeyNotFound) {
            if (last_failure.kind == AuthFailureKind::None) {
                last_type = CredentialType::Key;
                last_failure = out.failure;
            }
            continue;
        }
        last_type = CredentialType::Key;
        last_failure = out.failure;

        if (out.failure.kind == AuthFailureKind::HostKeyMismatch) {
            record_auth_failure(d, last_type, last_failure);
            return;
        }
        if (out.failure.kind == AuthFailureKind::KeyRejected) {
            const auto& offered = out.failure.offered_methods;
            bool key_possible = std::find(offered.begin(), offered.end(), "publickey") != offered.end();
            if (strategy.kind == AuthStrategyKind::PasswordOnly || (!offered.empty() && !key_possible))
                break;
        }
    }

    record_auth_failure(d, last_type, last_failure);
}

void DiagnosticsEngine::record_success(ConnectionDiagnostics& d, CredentialType type,
                                       const std::string& value) {
    d.auth_result = AuthResult{};
    d.auth_result.status = AuthStatus::Accepted;
    d.auth_result.success = true;
    d.auth_result.method = type;
    if (type == CredentialType::Key) {
        d.auth_result.key_path = value;
        d.auth_result.message = "Authenticated with key " + value;
    } else {
        d.auth_result.message = "Authenticated with password";
    }
    d.overall_success = true;
    d.primary_issue = PrimaryIssue::None;
    d.password_required = false;
    d.failure_detail.reset();
    d.suggestions.clear();
    d.detailed_message = "Connection successful";
}

// The client died before authentication finished: a network problem
// that appeared after the connectivity stage passed.
void DiagnosticsEngine::record_transport_failure(ConnectionDiagnostics& d, const RawError& err) {
    NetworkErrorDetail detail = classify_ssh_error(err);
    d.auth_result = AuthResult{};
    d.auth_result.status = AuthStatus::Rejected;
    d.auth_result.failure = AuthFailureKind::Other;
    d.auth_result.message = err.message;
    d.overall_success = false;
    d.primary_issue = detail.category == ErrorCategory::Port ? PrimaryIssue::Port : PrimaryIssue::Network;
    d.failure_detail = detail;
    d.suggestions = detail.suggestions;
    d.detailed_message = compose_message(
        fmt::format("Connection lost during authentication: {}", detail.message), d.suggestions);
}

void DiagnosticsEngine::record_auth_failure(ConnectionDiagnostics& d,
                                            std::optional<CredentialType> last_type,
                                            const SshFailure& failure) {
    const AuthStrategy strategy = d.auth_strategy.value_or(AuthStrategy{});

    // What the server said it still accepts, when it said anything.
    bool password_possible = strategy.supports_password();
    if (!failure.offered_methods.empty()) {
        password_possible = false;
        for (const auto& m : failure.offered_methods)
            if (m == "password" || m == "keyboard-interactive") password_possible = true;
    }

    AuthFailureKind kind = failure.kind;
    if (!last_type) {
        kind = AuthFailureKind::KeyNotFound;    // nothing local to try
    } else if (*last_type == CredentialType::Password && kind == AuthFailureKind::KeyRejected) {
        kind = AuthFailureKind::PasswordIncorrect;
    }
    // Only a key the server actually refused proves it wants nothing else.
    if (kind == AuthFailureKind::KeyRejected && !password_possible &&
        last_type == CredentialType::Key) {
        kind = AuthFailureKind::PasswordDisabledOnServer;
    }

    NetworkErrorDetail detail;
    if (kind == AuthFailureKind::Other) {
        detail = classify_ssh_error(RawError::from_message(failure.summary));
        if (detail.category != ErrorCategory::Authentication) {
            detail = auth_failure_detail(AuthFailureKind::Other);
            if (!failure.summary.empty()) detail.message += ": " + failure.summary;
        }
    } else {
        detail = auth_failure_detail(kind);
    }

    d.auth_result = AuthResult{};
    d.auth_result.failure = kind;
    d.auth_result.method = last_type;
    d.overall_success = false;
    d.primary_issue = PrimaryIssue::Authentication;
    d.failure_detail = detail;
    d.suggestions = detail.suggestions;
    d.password_required = password_possible && kind != AuthFailureKind::HostKeyMismatch &&
                          kind != AuthFailureKind::PasswordDisabledOnServer;

    std::string headline = detail.message;
    if (d.password_required || !last_type || kind == AuthFailureKind::KeyNotFound) {
        d.auth_result.status = AuthStatus::CredentialsRequired;
        if (d.password_required && last_type != CredentialType::Password)
            headline += ". Password authentication required.";
    } else {
        d.auth_result.status = AuthStatus::Rejected;
    }
    d.auth_result.message = headline;
    d.detailed_message = compose_message(headline, d.suggestions);
}

// ── verify_credential ───────────────────────────────────────

ConnectionDiagnostics DiagnosticsEngine::verify_credential(const ConnectionTarget& target,
                                                           const CredentialAttempt& attempt,
                                                           const ConnectionDiagnostics& previous) {
    ConnectionDiagnostics d = previous;
    if (!d.auth_strategy) d.auth_strategy = AuthStrategy{};

    if (attempt.type == CredentialType::Password) {
        report(fmt::format("Trying password ({}/{})...", attempt.attempt_number, attempt.max_attempts));
    } else {
        report(fmt::format("Trying key {}...", attempt.value));
    }

    AuthAttemptOutcome out = try_credential(target, attempt.type, attempt.value);
    if (out.accepted) {
        record_success(d, attempt.type, attempt.value);
    } else if (out.failure.transport) {
        record_transport_failure(d, *out.failure.transport);
    } else {
        record_auth_failure(d, attempt.type, out.failure);
    }
    sshgate_log(fmt::format("verify {} {}: {}", target.display(), to_string(attempt.type),
                            d.overall_success ? "accepted" : to_string(d.auth_result.failure)));
    return d;
}
