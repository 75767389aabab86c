#include <gtest/gtest.h>
#include <managers/retry_orchestrator.hpp>
#include <cerrno>
#include "pipeline_fixture.hpp"

using namespace std::chrono;

class RetryOrchestratorTest : public PipelineTest {
protected:
    std::vector<milliseconds> sleeps;
    std::vector<ResolvedConnection> persisted;
    Result<void> persist_result = Result<void>::Ok();
    std::vector<std::string> status_lines;

    RetryOrchestrator orchestrator{
        engine, cache,
        [this](const ResolvedConnection& rc) {
            persisted.push_back(rc);
            return persist_result;
        },
        [this](milliseconds ms) { sleeps.push_back(ms); }};

    RetryPolicy interactive_policy(int max_attempts = 3) {
        RetryPolicy p;
        p.max_attempts = max_attempts;
        p.interactive = true;
        return p;
    }

    RetryPolicy batch_policy(int max_attempts = 3) {
        RetryPolicy p;
        p.max_attempts = max_attempts;
        p.interactive = false;
        p.backoff = milliseconds(250);
        return p;
    }

    void SetUp() override {
        PipelineTest::SetUp();
        orchestrator.set_status_callback([this](const std::string& m) { status_lines.push_back(m); });
    }
};

// ── Connectivity failures ───────────────────────────────────

TEST_F(RetryOrchestratorTest, DnsFailureReportsImmediatelyWithoutPrompting) {
    dns_fails();
    auto r = orchestrator.attempt(target, &prompter, interactive_policy());

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.status, AttemptStatus::NetworkFailed);
    EXPECT_EQ(r.attempts, 1);
    EXPECT_EQ(engine.diagnose_calls, 1);
    EXPECT_EQ(prompter.total_calls(), 0);
    ASSERT_TRUE(r.diagnostics.has_value());
    EXPECT_EQ(r.diagnostics->primary_issue, PrimaryIssue::Network);
    EXPECT_EQ(r.diagnostics->auth_result.status, AuthStatus::NotTested);
    EXPECT_FALSE(r.fatal());
}

TEST_F(RetryOrchestratorTest, ClosedPortNeverAuthenticates) {
    add_key("id_rsa");
    net.connects["192.0.2.10"] = RawError::from_errno(ECONNREFUSED);
    auto r = orchestrator.attempt(target, &prompter, interactive_policy());

    EXPECT_EQ(r.status, AttemptStatus::NetworkFailed);
    EXPECT_EQ(r.diagnostics->primary_issue, PrimaryIssue::Port);
    EXPECT_EQ(r.diagnostics->auth_result.status, AuthStatus::NotTested);
    EXPECT_TRUE(auth.keys_tried.empty());
    EXPECT_EQ(methods.calls, 0);
}

TEST_F(RetryOrchestratorTest, RetryableFailureUsesEveryAttempt) {
    net.connects["192.0.2.10"] = RawError::from_errno(ETIMEDOUT);
    auto r = orchestrator.attempt(target, &prompter, batch_policy(3));

    EXPECT_EQ(r.status, AttemptStatus::Exhausted);
    EXPECT_EQ(r.attempts, 3);
    EXPECT_EQ(engine.diagnose_calls, 3);
    ASSERT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(sleeps[0], milliseconds(250));
    EXPECT_EQ(r.error_message.rfind("Connection failed after 3 attempts.", 0), 0u);
    EXPECT_NE(r.error_message.find("SSH port 22 is not accessible"), std::string::npos);
    EXPECT_EQ(prompter.total_calls(), 0);
}

TEST_F(RetryOrchestratorTest, DiagnoseCallsNeverExceedMaxAttempts) {
    net.connects["192.0.2.10"] = RawError::from_errno(ECONNRESET);
    for (int max : {1, 2, 5}) {
        engine.diagnose_calls = 0;
        orchestrator.attempt(target, &prompter, batch_policy(max));
        EXPECT_EQ(engine.diagnose_calls, max);
    }
}

TEST_F(RetryOrchestratorTest, ZeroMaxAttemptsStillTriesOnce) {
    net.connects["192.0.2.10"] = RawError::from_errno(ETIMEDOUT);
    auto r = orchestrator.attempt(target, &prompter, batch_policy(0));
    EXPECT_EQ(r.attempts, 1);
    EXPECT_EQ(r.error_message.rfind("Connection failed after 1 attempts.", 0), 0u);
}

TEST_F(RetryOrchestratorTest, InteractiveRetryAsksThePrompter) {
    net.connects["192.0.2.10"] = RawError::from_errno(ETIMEDOUT);
    auto r = orchestrator.attempt(target, &prompter, interactive_policy(3));
    EXPECT_EQ(prompter.retry_calls, 2);
    EXPECT_TRUE(sleeps.empty());
    EXPECT_EQ(r.status, AttemptStatus::Exhausted);
}

TEST_F(RetryOrchestratorTest, DecliningARetryCancels) {
    net.connects["192.0.2.10"] = RawError::from_errno(ETIMEDOUT);
    auto policy = interactive_policy(3);
    std::vector<int> asked;
    policy.on_retry_decision = [&](int next, int max) {
        asked.push_back(next);
        EXPECT_EQ(max, 3);
        return false;
    };

    auto r = orchestrator.attempt(target, &prompter, policy);
    EXPECT_EQ(r.status, AttemptStatus::Cancelled);
    EXPECT_EQ(engine.diagnose_calls, 1);
    ASSERT_EQ(asked.size(), 1u);
    EXPECT_EQ(asked[0], 2);
    EXPECT_EQ(prompter.retry_calls, 0);
}

// ── Authentication ──────────────────────────────────────────

TEST_F(RetryOrchestratorTest, NonInteractiveAuthFailureFailsFast) {
    methods.offer({"publickey", "password"});
    auto r = orchestrator.attempt(target, &prompter, batch_policy(3));

    EXPECT_EQ(r.status, AttemptStatus::CredentialsUnavailable);
    EXPECT_TRUE(r.fatal());
    EXPECT_EQ(r.attempts, 1);
    EXPECT_EQ(prompter.total_calls(), 0);
    EXPECT_TRUE(sleeps.empty());
    EXPECT_EQ(r.error_message,
              "Authentication failed and cannot prompt for credentials in non-interactive mode.");
}

TEST_F(RetryOrchestratorTest, InteractiveAuthFailurePromptsOnFirstAttempt) {
    methods.offer({"publickey", "password"});
    prompter.method = CredentialType::Password;
    prompter.passwords = {std::string("pw")};
    auth.accepted_password = "pw";

    auto r = orchestrator.attempt(target, &prompter, interactive_policy(3));
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.attempts, 1);
    EXPECT_EQ(prompter.method_calls, 1);
}

TEST_F(RetryOrchestratorTest, PasswordLimitIsFatal) {
    methods.offer({"password"});
    prompter.passwords = {std::string("a"), std::string("b"), std::string("c")};

    auto r = orchestrator.attempt(target, &prompter, interactive_policy(3));
    EXPECT_EQ(r.status, AttemptStatus::PasswordAttemptsExceeded);
    EXPECT_TRUE(r.fatal());
    EXPECT_NE(r.error_message.find("3 attempts"), std::string::npos);
    EXPECT_EQ(engine.diagnose_calls, 1);
    EXPECT_EQ(prompter.password_calls, 3);
    EXPECT_TRUE(persisted.empty());
}

TEST_F(RetryOrchestratorTest, PasswordOnlyServerWithoutKeys) {
    methods.offer({"password"});
    auth.accepted_password = "correct-pw";
    prompter.passwords = {std::string("correct-pw")};

    auto r = orchestrator.attempt(target, &prompter, interactive_policy(3));
    EXPECT_EQ(r.status, AttemptStatus::Succeeded);
    ASSERT_TRUE(r.diagnostics.has_value());
    EXPECT_EQ(r.diagnostics->auth_strategy->kind, AuthStrategyKind::PasswordOnly);
    ASSERT_TRUE(r.diagnostics->auth_result.method.has_value());
    EXPECT_EQ(*r.diagnostics->auth_result.method, CredentialType::Password);

    auto cached = cache.get("api.example.test", "deploy");
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->type, CredentialType::Password);

    ASSERT_EQ(persisted.size(), 1u);
    EXPECT_EQ(persisted[0].auth_type, CredentialType::Password);
    EXPECT_FALSE(persisted[0].key_path.has_value());
    ASSERT_TRUE(r.resolved.has_value());
    EXPECT_EQ(r.resolved->target.host, "api.example.test");
}

TEST_F(RetryOrchestratorTest, CachedPasswordSkipsPromptNextTime) {
    methods.offer({"password"});
    auth.accepted_password = "correct-pw";
    prompter.passwords = {std::string("correct-pw")};

    ASSERT_TRUE(orchestrator.attempt(target, &prompter, interactive_policy()).success);
    auto again = orchestrator.attempt(target, &prompter, interactive_policy());
    EXPECT_TRUE(again.success);
    EXPECT_EQ(prompter.password_calls, 1);
}

TEST_F(RetryOrchestratorTest, RejectedKeyMovesToNextAttempt) {
    methods.offer({"publickey", "password"});
    prompter.method = CredentialType::Key;
    prompter.key_paths = {std::string("/keys/wrong"), std::string("/keys/right")};
    auth.accepted_keys = {"/keys/right"};

    auto r = orchestrator.attempt(target, &prompter, interactive_policy(3));
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.attempts, 2);
    EXPECT_EQ(prompter.retry_calls, 1);
    EXPECT_EQ(engine.diagnose_calls, 2);
    ASSERT_EQ(persisted.size(), 1u);
    EXPECT_EQ(persisted[0].auth_type, CredentialType::Key);
    EXPECT_EQ(persisted[0].key_path.value_or(""), "/keys/right");
}

TEST_F(RetryOrchestratorTest, RejectedKeysExhaustAttempts) {
    methods.offer({"publickey", "password"});
    prompter.method = CredentialType::Key;
    prompter.key_paths = {std::string("/k1"), std::string("/k2")};

    auto r = orchestrator.attempt(target, &prompter, interactive_policy(2));
    EXPECT_EQ(r.status, AttemptStatus::Exhausted);
    EXPECT_EQ(engine.diagnose_calls, 2);
    EXPECT_FALSE(r.fatal());
}

TEST_F(RetryOrchestratorTest, MissingIdentityFileStillUsesDiscoveredKey) {
    std::string ed = add_key("id_ed25519");
    target.identity_file = "/missing/id";
    methods.offer({"publickey"});
    auth.key_failures["/missing/id"].kind = AuthFailureKind::KeyNotFound;
    auth.accepted_keys = {ed};

    auto r = orchestrator.attempt(target, &prompter, interactive_policy());
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.status, AttemptStatus::Succeeded);
    EXPECT_EQ(prompter.key_calls, 0);
    ASSERT_EQ(persisted.size(), 1u);
    EXPECT_EQ(persisted[0].key_path.value_or(""), ed);
}

TEST_F(RetryOrchestratorTest, MissingIdentityFileOnKeyOnlyServerPromptsForKey) {
    target.identity_file = "/missing/id";
    methods.offer({"publickey"});
    auth.key_failures["/missing/id"].kind = AuthFailureKind::KeyNotFound;
    auth.accepted_keys = {"/keys/right"};
    prompter.key_paths = {std::string("/keys/right")};

    auto r = orchestrator.attempt(target, &prompter, interactive_policy());
    EXPECT_TRUE(r.success);
    EXPECT_FALSE(r.fatal());
    EXPECT_EQ(prompter.key_calls, 1);
    EXPECT_EQ(prompter.password_calls, 0);
}

TEST_F(RetryOrchestratorTest, HostKeyMismatchIsFatal) {
    add_key("id_rsa");
    methods.offer({"publickey", "password"});
    auth.key_failure = SshFailure{};
    auth.key_failure.kind = AuthFailureKind::HostKeyMismatch;

    auto r = orchestrator.attempt(target, &prompter, interactive_policy(3));
    EXPECT_EQ(r.status, AttemptStatus::AuthenticationFailed);
    EXPECT_TRUE(r.fatal());
    EXPECT_EQ(prompter.total_calls(), 0);
}

TEST_F(RetryOrchestratorTest, PersistFailureDoesNotFailTheConnection) {
    std::string key = add_key("id_rsa");
    auth.accepted_keys = {key};
    persist_result = Result<void>::Err("disk full");

    auto r = orchestrator.attempt(target, &prompter, interactive_policy());
    EXPECT_TRUE(r.success);
    ASSERT_FALSE(status_lines.empty());
    EXPECT_NE(status_lines.back().find("disk full"), std::string::npos);
}

TEST_F(RetryOrchestratorTest, PromptExceptionsPropagate) {
    class ThrowingPrompter : public FakePrompter {
    public:
        std::optional<std::string> request_password(const PromptContext&) override {
            throw std::runtime_error("terminal went away");
        }
    } throwing;
    methods.offer({"password"});

    EXPECT_THROW(orchestrator.attempt(target, &throwing, interactive_policy()), std::runtime_error);
}

// ── Batches ─────────────────────────────────────────────────

TEST_F(RetryOrchestratorTest, AttemptAllRunsTargetsInOrder) {
    std::string key = add_key("id_rsa");
    auth.accepted_keys = {key};
    ConnectionTarget second = target;
    second.host = "db.example.test";
    net.reachable(second.host, "192.0.2.11");

    auto results = orchestrator.attempt_all({target, second}, &prompter, interactive_policy());
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].success);
    EXPECT_TRUE(results[1].success);
    EXPECT_EQ(results[1].resolved->target.host, "db.example.test");
}

TEST_F(RetryOrchestratorTest, CancellationStopsTheBatch) {
    methods.offer({"password"});
    prompter.passwords = {std::nullopt};
    ConnectionTarget second = target;
    second.host = "db.example.test";
    net.reachable(second.host, "192.0.2.11");

    auto results = orchestrator.attempt_all({target, second}, &prompter, interactive_policy());
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].status, AttemptStatus::Cancelled);
}

TEST_F(RetryOrchestratorTest, FatalResultStopsTheBatch) {
    add_key("id_rsa");
    methods.offer({"publickey", "password"});
    auth.key_failure = SshFailure{};
    auth.key_failure.kind = AuthFailureKind::HostKeyMismatch;
    ConnectionTarget second = target;
    second.host = "db.example.test";
    net.reachable(second.host, "192.0.2.11");

    std::vector<std::string> started;
    std::vector<AttemptStatus> finished;
    auto results = orchestrator.attempt_all(
        {target, second}, &prompter, interactive_policy(),
        [&](const ConnectionTarget& t) { started.push_back(t.host); },
        [&](const ConnectionTarget&, const AttemptResult& r) { finished.push_back(r.status); });

    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].fatal());
    EXPECT_EQ(started, std::vector<std::string>{"api.example.test"});
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0], AttemptStatus::AuthenticationFailed);
    EXPECT_EQ(engine.diagnose_calls, 1);
}

TEST_F(RetryOrchestratorTest, NetworkFailureDoesNotStopTheBatch) {
    ConnectionTarget second = target;
    second.host = "db.example.test";
    net.reachable(second.host, "192.0.2.11");
    net.connects["192.0.2.10"] = RawError::from_errno(ECONNREFUSED);
    methods.offer({"password"});
    auth.accepted_password = "pw";
    prompter.passwords = {std::string("pw")};

    auto results = orchestrator.attempt_all({target, second}, &prompter, interactive_policy());
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].status, AttemptStatus::NetworkFailed);
    EXPECT_TRUE(results[1].success);
}

TEST(AttemptStatusNames, ToString) {
    EXPECT_STREQ(to_string(AttemptStatus::Succeeded), "succeeded");
    EXPECT_STREQ(to_string(AttemptStatus::PasswordAttemptsExceeded), "password-attempts-exceeded");
}
