#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <managers/diagnostics_engine.hpp>
#include <managers/credential_cache.hpp>

struct PromptContext {
    ConnectionTarget target;
    AuthStrategy strategy;
    int attempt_number = 1;             // outer attempt
    int max_attempts = 1;
    int password_attempt = 0;           // 1-based while asking for a password
    int max_password_attempts = 0;
    std::string last_error;
};

// Whoever can supply credentials: a terminal, an API, a test double.
// Returning nullopt from a request means the user cancelled.
class Prompter {
public:
    virtual ~Prompter() = default;

    virtual std::optional<CredentialType> choose_method(const PromptContext& ctx) = 0;
    virtual std::optional<std::string> request_password(const PromptContext& ctx) = 0;
    virtual std::optional<std::string> request_key_path(const PromptContext& ctx) = 0;

    // Asked before every outer attempt after the first (interactive only).
    virtual bool confirm_retry(int next_attempt, int max_attempts) = 0;
};

enum class FlowState {
    Init,
    Probing,
    NetworkFailed,
    PortFailed,
    AuthFailed,
    AwaitingCredential,
    Succeeded,
    Exhausted,
    Cancelled,
};

const char* to_string(FlowState s);

// How an AuthFailed outcome may continue.
enum class AuthFailureDisposition {
    None,
    NonInteractive,     // nobody to ask
    Unrecoverable,      // host key mismatch, password disabled on server
    RetryNextAttempt,   // a supplied key failed; costs an outer attempt
};

struct FlowOutcome {
    FlowState state = FlowState::Init;
    ConnectionDiagnostics diagnostics;
    std::string message;
    AuthFailureDisposition disposition = AuthFailureDisposition::None;
    std::optional<CredentialAttempt> accepted;      // what finally worked, if supplied by the user
};

// One probe plus, after an authentication failure, one round of asking for
// credentials. Passwords get their own limit of three inside the round.
// Anything the user supplies is cached before it is tried, and evicted
// again when the server rejects it.
class CredentialResolutionFlow {
public:
    CredentialResolutionFlow(DiagnosticsEngine& engine, SessionCredentialCache& cache,
                             Prompter* prompter, bool interactive);

    FlowOutcome run(const ConnectionTarget& target, int attempt_number, int max_attempts,
                    const DiagnoseOptions& opts = {});

    FlowState state() const { return state_; }
    const std::vector<FlowState>& history() const { return history_; }

    static constexpr int max_password_attempts() { return MAX_PASSWORD_ATTEMPTS; }

private:
    DiagnosticsEngine& engine_;
    SessionCredentialCache& cache_;
    Prompter* prompter_;
    bool interactive_;
    FlowState state_ = FlowState::Init;
    std::vector<FlowState> history_;

    void transition(FlowState next);

    FlowOutcome finish(FlowState state, const ConnectionDiagnostics& d, const std::string& message,
                       AuthFailureDisposition disposition = AuthFailureDisposition::None);
    FlowOutcome after_probe(const ConnectionDiagnostics& d);
    FlowOutcome await_credential(const ConnectionTarget& target, const ConnectionDiagnostics& d,
                                 int attempt_number, int max_attempts);
    FlowOutcome key_attempt(const ConnectionTarget& target, const ConnectionDiagnostics& d,
                            PromptContext ctx);
    FlowOutcome password_round(const ConnectionTarget& target, const ConnectionDiagnostics& d,
                               PromptContext ctx);
};
