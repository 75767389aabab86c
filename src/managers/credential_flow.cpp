#include "credential_flow.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <stdexcept>

static const char* NON_INTERACTIVE_MESSAGE =
    "Authentication failed and cannot prompt for credentials in non-interactive mode.";
static const char* CANCELLED_MESSAGE = "Connection process cancelled by user.";

const char* to_string(FlowState s) {
    switch (s) {
        case FlowState::Init:               return "INIT";
        case FlowState::Probing:            return "PROBING";
        case FlowState::NetworkFailed:      return "NETWORK_FAILED";
        case FlowState::PortFailed:         return "PORT_FAILED";
        case FlowState::AuthFailed:         return "AUTH_FAILED";
        case FlowState::AwaitingCredential: return "AWAITING_CREDENTIAL";
        case FlowState::Succeeded:          return "SUCCEEDED";
        case FlowState::Exhausted:          return "EXHAUSTED";
        case FlowState::Cancelled:          return "CANCELLED";
    }
    return "?";
}

static bool allowed(FlowState from, FlowState to) {
    switch (to) {
        case FlowState::Probing:
            return from == FlowState::Init || from == FlowState::NetworkFailed ||
                   from == FlowState::PortFailed || from == FlowState::AuthFailed ||
                   from == FlowState::AwaitingCredential;
        case FlowState::NetworkFailed:
        case FlowState::PortFailed:
        case FlowState::AuthFailed:
        case FlowState::Succeeded:
            return from == FlowState::Probing;
        case FlowState::AwaitingCredential:
            return from == FlowState::AuthFailed;
        case FlowState::Exhausted:
        case FlowState::Cancelled:
            return from == FlowState::AuthFailed || from == FlowState::AwaitingCredential;
        case FlowState::Init:
            break;
    }
    return false;
}

CredentialResolutionFlow::CredentialResolutionFlow(DiagnosticsEngine& engine,
                                                   SessionCredentialCache& cache,
                                                   Prompter* prompter, bool interactive)
    : engine_(engine), cache_(cache), prompter_(prompter), interactive_(interactive) {
    history_.push_back(state_);
}

void CredentialResolutionFlow::transition(FlowState next) {
    if (!allowed(state_, next)) {
        throw std::logic_error(fmt::format("invalid credential flow transition {} -> {}",
                                           to_string(state_), to_string(next)));
    }
    sshgate_log(fmt::format("flow: {} -> {}", to_string(state_), to_string(next)));
    state_ = next;
    history_.push_back(next);
}

FlowOutcome CredentialResolutionFlow::finish(FlowState state, const ConnectionDiagnostics& d,
                                             const std::string& message,
                                             AuthFailureDisposition disposition) {
    if (state_ != state) transition(state);
    FlowOutcome out;
    out.state = state;
    out.diagnostics = d;
    out.message = message;
    out.disposition = disposition;
    return out;
}

// ── run ─────────────────────────────────────────────────────

FlowOutcome CredentialResolutionFlow::run(const ConnectionTarget& target, int attempt_number,
                                          int max_attempts, const DiagnoseOptions& opts) {
    transition(FlowState::Probing);
    ConnectionDiagnostics d = engine_.diagnose(target, opts);

    if (d.primary_issue != PrimaryIssue::Authentication || d.overall_success)
        return after_probe(d);

    transition(FlowState::AuthFailed);
    if (d.auth_result.failure == AuthFailureKind::HostKeyMismatch ||
        d.auth_result.failure == AuthFailureKind::PasswordDisabledOnServer) {
        return finish(FlowState::AuthFailed, d, d.detailed_message, AuthFailureDisposition::Unrecoverable);
    }
    if (!interactive_ || !prompter_) {
        return finish(FlowState::AuthFailed, d, NON_INTERACTIVE_MESSAGE,
                      AuthFailureDisposition::NonInteractive);
    }
    return await_credential(target, d, attempt_number, max_attempts);
}

// Outcome of a PROBING step that did not end in an auth failure.
FlowOutcome CredentialResolutionFlow::after_probe(const ConnectionDiagnostics& d) {
    if (d.overall_success) return finish(FlowState::Succeeded, d, d.detailed_message);
    if (d.primary_issue == PrimaryIssue::Port) return finish(FlowState::PortFailed, d, d.detailed_message);
    return finish(FlowState::NetworkFailed, d, d.detailed_message);
}

// ── AWAITING_CREDENTIAL ─────────────────────────────────────

FlowOutcome CredentialResolutionFlow::await_credential(const ConnectionTarget& target,
                                                       const ConnectionDiagnostics& d,
                                                       int attempt_number, int max_attempts) {
    transition(FlowState::AwaitingCredential);

    PromptContext ctx;
    ctx.target = target;
    ctx.strategy = d.auth_strategy.value_or(AuthStrategy{});
    ctx.attempt_number = attempt_number;
    ctx.max_attempts = max_attempts;
    ctx.last_error = d.auth_result.message;

    std::optional<CredentialType> type;
    switch (ctx.strategy.kind) {
        case AuthStrategyKind::PasswordOnly: type = CredentialType::Password; break;
        case AuthStrategyKind::KeyOnly:      type = CredentialType::Key; break;
        default:                             type = prompter_->choose_method(ctx); break;
    }
    if (!type) return finish(FlowState::Cancelled, d, CANCELLED_MESSAGE);

    if (*type == CredentialType::Key) return key_attempt(target, d, ctx);
    return password_round(target, d, ctx);
}

FlowOutcome CredentialResolutionFlow::key_attempt(const ConnectionTarget& target,
                                                  const ConnectionDiagnostics& d,
                                                  PromptContext ctx) {
    auto path = prompter_->request_key_path(ctx);
    if (!path) return finish(FlowState::Cancelled, d, CANCELLED_MESSAGE);

    CredentialAttempt attempt;
    attempt.type = CredentialType::Key;
    attempt.value = platform::expand_home(path->empty() ? DEFAULT_KEY_PROMPT_PATH : *path).string();
    attempt.attempt_number = ctx.attempt_number;
    attempt.max_attempts = ctx.max_attempts;

    cache_.store(target.host, target.user, CredentialType::Key, attempt.value);
    transition(FlowState::Probing);
    ConnectionDiagnostics result = engine_.verify_credential(target, attempt, d);

    if (result.overall_success) {
        FlowOutcome out = finish(FlowState::Succeeded, result, result.detailed_message);
        out.accepted = attempt;
        return out;
    }
    cache_.clear(target.host, target.user);
    if (result.primary_issue != PrimaryIssue::Authentication) return after_probe(result);

    transition(FlowState::AuthFailed);
    auto disposition = result.auth_result.failure == AuthFailureKind::HostKeyMismatch
                           ? AuthFailureDisposition::Unrecoverable
                           : AuthFailureDisposition::RetryNextAttempt;
    return finish(FlowState::AuthFailed, result, result.detailed_message, disposition);
}

FlowOutcome CredentialResolutionFlow::password_round(const ConnectionTarget& target,
                                                     const ConnectionDiagnostics& d,
                                                     PromptContext ctx) {
    ConnectionDiagnostics current = d;
    ctx.max_password_attempts = MAX_PASSWORD_ATTEMPTS;

    for (int i = 1; i <= MAX_PASSWORD_ATTEMPTS; i++) {
        if (state_ != FlowState::AwaitingCredential) transition(FlowState::AwaitingCredential);
        ctx.password_attempt = i;

        auto password = prompter_->request_password(ctx);
        if (!password) return finish(FlowState::Cancelled, current, CANCELLED_MESSAGE);

        CredentialAttempt attempt;
        attempt.type = CredentialType::Password;
        attempt.value = *password;
        attempt.attempt_number = i;
        attempt.max_attempts = MAX_PASSWORD_ATTEMPTS;

        cache_.store(target.host, target.user, CredentialType::Password, attempt.value);
        transition(FlowState::Probing);
        current = engine_.verify_credential(target, attempt, current);

        if (current.overall_success) {
            FlowOutcome out = finish(FlowState::Succeeded, current, current.detailed_message);
            out.accepted = attempt;
            return out;
        }
        cache_.clear(target.host, target.user);

        // A network blip ends the round; the outer loop decides about retrying.
        if (current.primary_issue != PrimaryIssue::Authentication) return after_probe(current);

        transition(FlowState::AuthFailed);
        if (current.auth_result.failure == AuthFailureKind::PasswordDisabledOnServer ||
            current.auth_result.failure == AuthFailureKind::HostKeyMismatch) {
            return finish(FlowState::AuthFailed, current, current.detailed_message,
                          AuthFailureDisposition::Unrecoverable);
        }
        ctx.last_error = current.auth_result.message;
    }

    return finish(FlowState::Exhausted, current,
                  fmt::format("Password authentication failed after {} attempts.", MAX_PASSWORD_ATTEMPTS));
}
