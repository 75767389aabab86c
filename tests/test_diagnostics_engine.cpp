#include <gtest/gtest.h>
#include <managers/diagnostics_engine.hpp>
#include <cerrno>
#include "pipeline_fixture.hpp"

using DiagnosticsEngineTest = PipelineTest;

// ── Connectivity stage ──────────────────────────────────────

TEST_F(DiagnosticsEngineTest, DnsFailureStopsEverything) {
    dns_fails();
    auto d = engine.diagnose(target);

    EXPECT_FALSE(d.overall_success);
    EXPECT_EQ(d.primary_issue, PrimaryIssue::Network);
    EXPECT_FALSE(d.connectivity.dns_ok);
    EXPECT_FALSE(d.auth_strategy.has_value());
    EXPECT_EQ(d.auth_result.status, AuthStatus::NotTested);
    EXPECT_EQ(methods.calls, 0);
    EXPECT_TRUE(auth.keys_tried.empty());
    EXPECT_EQ(d.detailed_message.rfind("Cannot reach host api.example.test: DNS resolution failed", 0), 0u);
    ASSERT_TRUE(d.failure_detail.has_value());
    EXPECT_EQ(d.failure_detail->code, "ENOTFOUND");
    EXPECT_EQ(d.suggestions.size(), 4u);
}

TEST_F(DiagnosticsEngineTest, ClosedPortIsPortIssue) {
    net.connects["192.0.2.10"] = RawError::from_errno(ECONNREFUSED);
    auto d = engine.diagnose(target);

    EXPECT_EQ(d.primary_issue, PrimaryIssue::Port);
    EXPECT_TRUE(d.connectivity.dns_ok);
    EXPECT_EQ(d.auth_result.status, AuthStatus::NotTested);
    EXPECT_EQ(d.detailed_message.rfind("SSH port 22 is not accessible", 0), 0u);
    EXPECT_NE(d.detailed_message.find("Suggestions:\n  1. "), std::string::npos);
}

TEST_F(DiagnosticsEngineTest, UnreachableNetworkIsNetworkIssue) {
    net.connects["192.0.2.10"] = RawError::from_errno(ENETUNREACH);
    auto d = engine.diagnose(target);
    EXPECT_TRUE(d.connectivity.dns_ok);
    EXPECT_EQ(d.primary_issue, PrimaryIssue::Network);
}

// ── Authentication stage ────────────────────────────────────

TEST_F(DiagnosticsEngineTest, LocalKeyAccepted) {
    std::string key = add_key("id_ed25519");
    auth.accepted_keys = {key};
    methods.offer({"publickey", "password"});

    auto d = engine.diagnose(target);
    EXPECT_TRUE(d.overall_success);
    EXPECT_EQ(d.primary_issue, PrimaryIssue::None);
    EXPECT_EQ(d.auth_result.status, AuthStatus::Accepted);
    ASSERT_TRUE(d.auth_result.method.has_value());
    EXPECT_EQ(*d.auth_result.method, CredentialType::Key);
    EXPECT_EQ(d.auth_result.key_path.value_or(""), key);
    ASSERT_TRUE(d.auth_strategy.has_value());
    EXPECT_EQ(d.auth_strategy->kind, AuthStrategyKind::MultipleMethods);
    EXPECT_FALSE(d.password_required);
}

TEST_F(DiagnosticsEngineTest, NoKeysButPasswordOffered) {
    methods.offer({"publickey", "password"});
    auto d = engine.diagnose(target);

    EXPECT_FALSE(d.overall_success);
    EXPECT_EQ(d.primary_issue, PrimaryIssue::Authentication);
    EXPECT_EQ(d.auth_result.status, AuthStatus::CredentialsRequired);
    EXPECT_EQ(d.auth_result.failure, AuthFailureKind::KeyNotFound);
    EXPECT_TRUE(d.password_required);
    EXPECT_NE(d.detailed_message.find(". Password authentication required."), std::string::npos);
    EXPECT_TRUE(auth.keys_tried.empty());
}

TEST_F(DiagnosticsEngineTest, KeyRejectedByKeyOnlyServer) {
    add_key("id_rsa");
    methods.offer({"publickey"});
    auth.key_failure.offered_methods = {"publickey"};
    auth.key_failure.summary = "deploy@api.example.test: Permission denied (publickey).";

    auto d = engine.diagnose(target);
    EXPECT_EQ(d.primary_issue, PrimaryIssue::Authentication);
    EXPECT_EQ(d.auth_result.failure, AuthFailureKind::PasswordDisabledOnServer);
    EXPECT_EQ(d.auth_result.status, AuthStatus::Rejected);
    EXPECT_FALSE(d.password_required);
    EXPECT_EQ(d.detailed_message.rfind(
        "SSH key authentication failed. Server has password authentication disabled.", 0), 0u);
}

TEST_F(DiagnosticsEngineTest, TriesEveryKeyWhileKeysCanStillWork) {
    add_key("id_rsa");
    add_key("id_ed25519");
    methods.offer({"publickey", "password"});

    auto d = engine.diagnose(target);
    EXPECT_EQ(auth.keys_tried.size(), 2u);
    EXPECT_EQ(d.auth_result.failure, AuthFailureKind::KeyRejected);
    EXPECT_EQ(d.auth_result.status, AuthStatus::CredentialsRequired);
    EXPECT_TRUE(d.password_required);
}

TEST_F(DiagnosticsEngineTest, StopsAfterFirstKeyOnPasswordOnlyServer) {
    add_key("id_rsa");
    add_key("id_ed25519");
    methods.offer({"password"});

    auto d = engine.diagnose(target);
    EXPECT_EQ(auth.keys_tried.size(), 1u);
    EXPECT_EQ(d.auth_strategy->kind, AuthStrategyKind::PasswordOnly);
    EXPECT_TRUE(d.password_required);
}

TEST_F(DiagnosticsEngineTest, StopsWhenServerNoLongerOffersPublickey) {
    add_key("id_rsa");
    add_key("id_ed25519");
    methods.offer({"publickey", "password"});
    auth.key_failure.offered_methods = {"password"};

    engine.diagnose(target);
    EXPECT_EQ(auth.keys_tried.size(), 1u);
}

TEST_F(DiagnosticsEngineTest, IdentityFileFirstAndOnce) {
    std::string rsa = add_key("id_rsa");
    std::string ed = add_key("id_ed25519");
    target.identity_file = ed;
    methods.offer({"publickey", "password"});

    engine.diagnose(target);
    ASSERT_EQ(auth.keys_tried.size(), 2u);
    EXPECT_EQ(auth.keys_tried[0], ed);
    EXPECT_EQ(auth.keys_tried[1], rsa);
}

TEST_F(DiagnosticsEngineTest, MissingIdentityFileFallsThroughToDiscoveredKeys) {
    std::string rsa = add_key("id_rsa");
    std::string missing = (ssh_dir / "gone").string();
    target.identity_file = missing;
    methods.offer({"publickey"});
    auth.key_failures[missing].kind = AuthFailureKind::KeyNotFound;
    auth.accepted_keys = {rsa};

    auto d = engine.diagnose(target);
    ASSERT_EQ(auth.keys_tried.size(), 2u);
    EXPECT_EQ(auth.keys_tried[0], missing);
    EXPECT_TRUE(d.overall_success);
    EXPECT_EQ(d.auth_result.key_path.value_or(""), rsa);
}

TEST_F(DiagnosticsEngineTest, MissingIdentityFileOnKeyOnlyServerAsksForKey) {
    std::string missing = (ssh_dir / "gone").string();
    target.identity_file = missing;
    methods.offer({"publickey"});
    auth.key_failures[missing].kind = AuthFailureKind::KeyNotFound;

    auto d = engine.diagnose(target);
    EXPECT_EQ(auth.keys_tried.size(), 1u);
    EXPECT_EQ(d.auth_result.failure, AuthFailureKind::KeyNotFound);
    EXPECT_EQ(d.auth_result.status, AuthStatus::CredentialsRequired);
    EXPECT_FALSE(d.password_required);
}

TEST_F(DiagnosticsEngineTest, MissingIdentityFileKeepsLaterRejection) {
    add_key("id_rsa");
    std::string missing = (ssh_dir / "gone").string();
    target.identity_file = missing;
    methods.offer({"publickey"});
    auth.key_failures[missing].kind = AuthFailureKind::KeyNotFound;
    auth.key_failure.offered_methods = {"publickey"};

    auto d = engine.diagnose(target);
    EXPECT_EQ(auth.keys_tried.size(), 2u);
    EXPECT_EQ(d.auth_result.failure, AuthFailureKind::PasswordDisabledOnServer);
}

TEST_F(DiagnosticsEngineTest, HostKeyMismatchIsNotRecoverableByPassword) {
    add_key("id_rsa");
    add_key("id_ed25519");
    methods.offer({"publickey", "password"});
    auth.key_failure = SshFailure{};
    auth.key_failure.kind = AuthFailureKind::HostKeyMismatch;

    auto d = engine.diagnose(target);
    EXPECT_EQ(auth.keys_tried.size(), 1u);
    EXPECT_EQ(d.auth_result.failure, AuthFailureKind::HostKeyMismatch);
    EXPECT_EQ(d.auth_result.status, AuthStatus::Rejected);
    EXPECT_FALSE(d.password_required);
    ASSERT_TRUE(d.failure_detail.has_value());
    EXPECT_EQ(d.failure_detail->code, "SSH_HOST_KEY_FAILED");
}

TEST_F(DiagnosticsEngineTest, TransportFailureDuringAuthIsNetwork) {
    add_key("id_rsa");
    methods.offer({"publickey", "password"});
    auth.transport = RawError::from_errno(ECONNRESET);

    auto d = engine.diagnose(target);
    EXPECT_EQ(d.primary_issue, PrimaryIssue::Network);
    ASSERT_TRUE(d.failure_detail.has_value());
    EXPECT_TRUE(d.failure_detail->is_retryable);
    EXPECT_EQ(d.detailed_message.rfind("Connection lost during authentication", 0), 0u);
}

TEST_F(DiagnosticsEngineTest, RefusedDuringAuthIsPort) {
    add_key("id_rsa");
    auth.transport = RawError::from_errno(ECONNREFUSED);
    auto d = engine.diagnose(target);
    EXPECT_EQ(d.primary_issue, PrimaryIssue::Port);
}

TEST_F(DiagnosticsEngineTest, MethodProbeFailureStillAuthenticates) {
    std::string key = add_key("id_rsa");
    auth.accepted_keys = {key};
    methods.throw_error = true;

    auto d = engine.diagnose(target);
    ASSERT_TRUE(d.auth_strategy.has_value());
    EXPECT_EQ(d.auth_strategy->kind, AuthStrategyKind::Unknown);
    EXPECT_TRUE(d.overall_success);
}

// ── Cached credentials ──────────────────────────────────────

TEST_F(DiagnosticsEngineTest, CachedPasswordTriedFirst) {
    add_key("id_rsa");
    methods.offer({"publickey", "password"});
    cache.store(target.host, target.user, CredentialType::Password, "cached-pw");
    auth.accepted_password = "cached-pw";

    auto d = engine.diagnose(target);
    EXPECT_TRUE(d.overall_success);
    EXPECT_EQ(*d.auth_result.method, CredentialType::Password);
    EXPECT_TRUE(auth.keys_tried.empty());
    ASSERT_EQ(auth.passwords_tried.size(), 1u);
}

TEST_F(DiagnosticsEngineTest, RejectedCacheEntryIsEvicted) {
    methods.offer({"publickey", "password"});
    cache.store(target.host, target.user, CredentialType::Password, "stale");

    auto d = engine.diagnose(target);
    EXPECT_FALSE(cache.contains(target.host, target.user));
    EXPECT_EQ(d.auth_result.failure, AuthFailureKind::PasswordIncorrect);
    EXPECT_EQ(d.auth_result.status, AuthStatus::CredentialsRequired);
    EXPECT_EQ(d.detailed_message.find("Password authentication required."), std::string::npos);
}

// ── verify_credential ───────────────────────────────────────

TEST_F(DiagnosticsEngineTest, VerifyPassword) {
    methods.offer({"password"});
    auto first = engine.diagnose(target);
    ASSERT_TRUE(first.password_required);

    auth.accepted_password = "right";
    CredentialAttempt wrong{CredentialType::Password, "wrong", 1, 3};
    auto d = engine.verify_credential(target, wrong, first);
    EXPECT_FALSE(d.overall_success);
    EXPECT_EQ(d.auth_result.failure, AuthFailureKind::PasswordIncorrect);
    EXPECT_TRUE(d.connectivity.success());
    EXPECT_EQ(d.auth_strategy->kind, AuthStrategyKind::PasswordOnly);

    CredentialAttempt right{CredentialType::Password, "right", 2, 3};
    d = engine.verify_credential(target, right, d);
    EXPECT_TRUE(d.overall_success);
    EXPECT_EQ(d.detailed_message, "Connection successful");
    EXPECT_FALSE(d.failure_detail.has_value());
}

// ── Progress reporting ──────────────────────────────────────

TEST_F(DiagnosticsEngineTest, ProgressGoesToStatusCallback) {
    std::vector<std::string> lines;
    engine.set_status_callback([&](const std::string& m) { lines.push_back(m); });
    methods.offer({"password"});

    engine.diagnose(target);
    EXPECT_FALSE(lines.empty());

    lines.clear();
    DiagnoseOptions quiet;
    quiet.suppress_debug_output = true;
    engine.diagnose(target, quiet);
    EXPECT_TRUE(lines.empty());
}

TEST(ComposeMessage, HeadlineAndSuggestions) {
    EXPECT_EQ(compose_message("Broken", {}), "Broken");
    EXPECT_EQ(compose_message("Broken", {"fix it"}), "Broken\n\nSuggestions:\n  1. fix it");
}
