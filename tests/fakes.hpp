#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <deque>
#include <optional>
#include <stdexcept>
#include <core/types.hpp>
#include <platform/process.hpp>
#include <net/connectivity_probe.hpp>
#include <ssh/auth_method_probe.hpp>
#include <ssh/system_ssh.hpp>
#include <managers/credential_flow.hpp>

// Test doubles shared by the pipeline tests. Each one counts its calls so
// tests can assert that a stage was (or was not) reached.

class FakeNetworkBackend : public NetworkBackend {
public:
    std::map<std::string, Resolution> resolutions;            // host -> answer
    std::map<std::string, std::optional<RawError>> connects;  // address -> result
    int resolve_calls = 0;
    int connect_calls = 0;

    // host resolves to one address that accepts connections
    void reachable(const std::string& host, const std::string& address = "192.0.2.10") {
        resolutions[host].addresses = {address};
        connects[address] = std::nullopt;
    }

    Resolution resolve(const std::string& host, int) override {
        resolve_calls++;
        auto it = resolutions.find(host);
        if (it != resolutions.end()) return it->second;
        Resolution r;
        r.error = RawError::from_message("getaddrinfo " + host + ": Name or service not known");
        return r;
    }

    std::optional<RawError> connect(const std::string& address, int, int) override {
        connect_calls++;
        auto it = connects.find(address);
        if (it != connects.end()) return it->second;
        return RawError::from_message("no route configured for " + address);
    }
};

class FakeMethodSource : public AuthMethodSource {
public:
    MethodListing listing;
    bool throw_error = false;
    int calls = 0;

    void offer(const std::vector<std::string>& methods) {
        listing.ok = true;
        listing.methods = methods;
    }

    MethodListing list_methods(const ConnectionTarget&, int) override {
        calls++;
        if (throw_error) throw std::runtime_error("probe exploded");
        return listing;
    }
};

class FakeAuthenticator : public Authenticator {
public:
    std::set<std::string> accepted_keys;
    std::optional<std::string> accepted_password;
    SshFailure key_failure;             // returned for rejected keys
    std::map<std::string, SshFailure> key_failures;     // per-path override
    SshFailure password_failure;        // returned for wrong passwords
    std::optional<RawError> transport;  // every attempt fails with this when set

    std::vector<std::string> keys_tried;
    std::vector<std::string> passwords_tried;

    FakeAuthenticator() {
        key_failure.kind = AuthFailureKind::KeyRejected;
        key_failure.summary = "Permission denied (publickey,password).";
        key_failure.offered_methods = {"publickey", "password"};
        password_failure.kind = AuthFailureKind::PasswordIncorrect;
        password_failure.summary = "Permission denied, please try again.";
    }

    AuthAttemptOutcome try_key(const ConnectionTarget&, const std::string& key_path, int) override {
        keys_tried.push_back(key_path);
        AuthAttemptOutcome out;
        if (transport) {
            out.failure.kind = AuthFailureKind::Other;
            out.failure.transport = transport;
            return out;
        }
        out.accepted = accepted_keys.count(key_path) > 0;
        if (!out.accepted) {
            auto it = key_failures.find(key_path);
            out.failure = it != key_failures.end() ? it->second : key_failure;
        }
        return out;
    }

    AuthAttemptOutcome try_password(const ConnectionTarget&, const std::string& password, int) override {
        passwords_tried.push_back(password);
        AuthAttemptOutcome out;
        if (transport) {
            out.failure.kind = AuthFailureKind::Other;
            out.failure.transport = transport;
            return out;
        }
        out.accepted = accepted_password && *accepted_password == password;
        if (!out.accepted) out.failure = password_failure;
        return out;
    }
};

class FakePrompter : public Prompter {
public:
    std::optional<CredentialType> method = CredentialType::Password;
    std::deque<std::optional<std::string>> passwords;
    std::deque<std::optional<std::string>> key_paths;
    bool retry_answer = true;

    int method_calls = 0;
    int password_calls = 0;
    int key_calls = 0;
    int retry_calls = 0;
    std::vector<PromptContext> contexts;

    int total_calls() const { return method_calls + password_calls + key_calls + retry_calls; }

    std::optional<CredentialType> choose_method(const PromptContext& ctx) override {
        method_calls++;
        contexts.push_back(ctx);
        return method;
    }

    std::optional<std::string> request_password(const PromptContext& ctx) override {
        password_calls++;
        contexts.push_back(ctx);
        if (passwords.empty()) return std::nullopt;
        auto p = passwords.front();
        passwords.pop_front();
        return p;
    }

    std::optional<std::string> request_key_path(const PromptContext& ctx) override {
        key_calls++;
        contexts.push_back(ctx);
        if (key_paths.empty()) return std::nullopt;
        auto k = key_paths.front();
        key_paths.pop_front();
        return k;
    }

    bool confirm_retry(int, int) override {
        retry_calls++;
        return retry_answer;
    }
};

class FakeRunner : public platform::CommandRunner {
public:
    CommandResult result;
    std::vector<std::vector<std::string>> commands;
    std::vector<platform::RunOptions> options;

    CommandResult run(const std::vector<std::string>& argv, const platform::RunOptions& opts) override {
        commands.push_back(argv);
        options.push_back(opts);
        return result;
    }
};
