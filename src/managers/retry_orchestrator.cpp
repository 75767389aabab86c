#include "retry_orchestrator.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

const char* to_string(AttemptStatus s) {
    switch (s) {
        case AttemptStatus::Succeeded:                return "succeeded";
        case AttemptStatus::Exhausted:                return "exhausted";
        case AttemptStatus::Cancelled:                return "cancelled";
        case AttemptStatus::NetworkFailed:            return "network-failed";
        case AttemptStatus::CredentialsUnavailable:   return "credentials-unavailable";
        case AttemptStatus::PasswordAttemptsExceeded: return "password-attempts-exceeded";
        case AttemptStatus::AuthenticationFailed:     return "authentication-failed";
    }
    return "?";
}

RetryOrchestrator::RetryOrchestrator(DiagnosticsEngine& engine, SessionCredentialCache& cache,
                                     PersistFn persist, Sleeper sleeper)
    : engine_(engine), cache_(cache), persist_(std::move(persist)), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds ms) { platform::sleep_ms(static_cast<int>(ms.count())); };
    }
}

bool RetryOrchestrator::should_retry(int next_attempt, Prompter* prompter, const RetryPolicy& policy) {
    if (!policy.interactive) {
        if (status_) status_(fmt::format("Retrying in {}ms (attempt {}/{})...", policy.backoff.count(),
                                         next_attempt, policy.max_attempts));
        sleeper_(policy.backoff);
        return true;
    }
    if (policy.on_retry_decision) return policy.on_retry_decision(next_attempt, policy.max_attempts);
    if (prompter) return prompter->confirm_retry(next_attempt, policy.max_attempts);
    return true;
}

void RetryOrchestrator::persist(AttemptResult& result, const ConnectionTarget& target,
                                const FlowOutcome& outcome) {
    ResolvedConnection rc;
    rc.target = target;
    const AuthResult& auth = outcome.diagnostics.auth_result;
    rc.auth_type = auth.method.value_or(CredentialType::Key);
    rc.key_path = auth.key_path;
    result.resolved = rc;

    if (!persist_) return;
    Result<void> saved = persist_(rc);
    if (saved.is_err()) {
        sshgate_log(fmt::format("persist {}: {}", target.display(), saved.error));
        if (status_) status_("Could not save connection info: " + saved.error);
    }
}

AttemptResult RetryOrchestrator::attempt(const ConnectionTarget& target, Prompter* prompter,
                                         const RetryPolicy& policy) {
    CredentialResolutionFlow flow(engine_, cache_, prompter, policy.interactive);
    AttemptResult result;
    int max_attempts = std::max(1, policy.max_attempts);

    for (int n = 1; n <= max_attempts; n++) {
        if (n > 1 && !should_retry(n, prompter, policy)) {
            result.status = AttemptStatus::Cancelled;
            result.error_message = "Connection process cancelled by user.";
            return result;
        }

        result.attempts = n;
        sshgate_log(fmt::format("attempt {} ({}/{})", target.display(), n, max_attempts));
        FlowOutcome outcome = flow.run(target, n, max_attempts, policy.diagnose);
        result.diagnostics = outcome.diagnostics;

        switch (outcome.state) {
            case FlowState::Succeeded:
                result.status = AttemptStatus::Succeeded;
                result.success = true;
                result.error_message.clear();
                persist(result, target, outcome);
                return result;

            case FlowState::Cancelled:
                result.status = AttemptStatus::Cancelled;
                result.error_message = outcome.message;
                return result;

            case FlowState::Exhausted:
                result.status = AttemptStatus::PasswordAttemptsExceeded;
                result.error_message = outcome.message;
                return result;

            case FlowState::AuthFailed:
                result.error_message = outcome.message;
                if (outcome.disposition == AuthFailureDisposition::NonInteractive) {
                    result.status = AttemptStatus::CredentialsUnavailable;
                    return result;
                }
                if (outcome.disposition == AuthFailureDisposition::Unrecoverable) {
                    result.status = AttemptStatus::AuthenticationFailed;
                    return result;
                }
                break;  // a supplied key failed; next outer attempt

            case FlowState::NetworkFailed:
            case FlowState::PortFailed: {
                result.error_message = outcome.message;
                const auto& detail = outcome.diagnostics.failure_detail;
                if (detail && !detail->is_retryable) {
                    result.status = AttemptStatus::NetworkFailed;
                    return result;
                }
                break;
            }

            default:
                break;
        }
    }

    result.status = AttemptStatus::Exhausted;
    std::string last = result.error_message;
    result.error_message = fmt::format("Connection failed after {} attempts.", max_attempts);
    if (!last.empty()) result.error_message += "\n" + last;
    return result;
}

std::vector<AttemptResult> RetryOrchestrator::attempt_all(const std::vector<ConnectionTarget>& targets,
                                                          Prompter* prompter,
                                                          const RetryPolicy& policy,
                                                          TargetStartFn on_start,
                                                          TargetDoneFn on_done) {
    std::vector<AttemptResult> results;
    for (const auto& target : targets) {
        if (on_start) on_start(target);
        if (status_) status_("Testing " + target.display());
        results.push_back(attempt(target, prompter, policy));
        const AttemptResult& last = results.back();
        if (on_done) on_done(target, last);

        if (last.status == AttemptStatus::Cancelled || last.fatal()) {
            if (results.size() < targets.size()) {
                sshgate_log(fmt::format("batch stopped after {} ({}), {} target(s) skipped",
                                        target.display(), to_string(last.status),
                                        targets.size() - results.size()));
            }
            break;
        }
    }
    return results;
}
