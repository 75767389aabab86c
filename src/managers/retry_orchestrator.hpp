#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <chrono>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <managers/diagnostics_engine.hpp>
#include <managers/credential_flow.hpp>
#include <managers/credential_cache.hpp>

struct RetryPolicy {
    int max_attempts = DEFAULT_MAX_ATTEMPTS;
    bool interactive = true;
    // Interactive only. Unset: ask the prompter (default yes without one).
    std::function<bool(int next_attempt, int max_attempts)> on_retry_decision;
    std::chrono::milliseconds backoff{RETRY_BACKOFF_MS};    // non-interactive pause
    DiagnoseOptions diagnose;
};

enum class AttemptStatus {
    Succeeded,
    Exhausted,                  // outer attempts used up
    Cancelled,                  // user declined a retry or a prompt
    NetworkFailed,              // non-retryable dns/port/network failure
    CredentialsUnavailable,     // auth failed, non-interactive
    PasswordAttemptsExceeded,
    AuthenticationFailed,       // unrecoverable (host key, password disabled)
};

const char* to_string(AttemptStatus s);

struct AttemptResult {
    AttemptStatus status = AttemptStatus::Exhausted;
    bool success = false;
    std::optional<ConnectionDiagnostics> diagnostics;
    std::string error_message;
    int attempts = 0;                   // diagnose() calls made
    std::optional<ResolvedConnection> resolved;

    // Outcomes that should end the whole command. The library never exits;
    // the CLI decides.
    bool fatal() const {
        return status == AttemptStatus::CredentialsUnavailable ||
               status == AttemptStatus::PasswordAttemptsExceeded ||
               status == AttemptStatus::AuthenticationFailed;
    }
};

// Called once per successful resolution. Failures are logged and ignored.
using PersistFn = std::function<Result<void>(const ResolvedConnection&)>;
using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Batch hooks, for the caller's own output around each target.
using TargetStartFn = std::function<void(const ConnectionTarget&)>;
using TargetDoneFn = std::function<void(const ConnectionTarget&, const AttemptResult&)>;

// The outer loop: at most policy.max_attempts diagnose() passes per target.
class RetryOrchestrator {
public:
    RetryOrchestrator(DiagnosticsEngine& engine, SessionCredentialCache& cache,
                      PersistFn persist = nullptr, Sleeper sleeper = nullptr);

    // Exceptions thrown by the prompter propagate.
    AttemptResult attempt(const ConnectionTarget& target, Prompter* prompter, const RetryPolicy& policy);

    // Targets one after another, each fully resolved before the next.
    // A cancellation or a fatal() result stops the batch; the returned list
    // then ends with that result.
    std::vector<AttemptResult> attempt_all(const std::vector<ConnectionTarget>& targets,
                                           Prompter* prompter, const RetryPolicy& policy,
                                           TargetStartFn on_start = nullptr,
                                           TargetDoneFn on_done = nullptr);

    void set_status_callback(StatusCallback cb) { status_ = std::move(cb); }

private:
    DiagnosticsEngine& engine_;
    SessionCredentialCache& cache_;
    PersistFn persist_;
    Sleeper sleeper_;
    StatusCallback status_;

    bool should_retry(int next_attempt, Prompter* prompter, const RetryPolicy& policy);
    void persist(AttemptResult& result, const ConnectionTarget& target, const FlowOutcome& outcome);
};
