#pragma once

#include <string>
#include <vector>
#include <memory>
#include <core/config.hpp>
#include <platform/process.hpp>
#include <net/connectivity_probe.hpp>
#include <ssh/output_parser.hpp>
#include <ssh/auth_method_probe.hpp>
#include <ssh/system_ssh.hpp>
#include <ssh/key_locator.hpp>
#include <managers/credential_cache.hpp>
#include <managers/diagnostics_engine.hpp>
#include <managers/retry_orchestrator.hpp>
#include "known_connections.hpp"

struct TestOptions {
    std::vector<std::string> targets;
    bool all = false;
    std::string identity_file;
    bool non_interactive = false;
    int max_attempts = 0;           // 0: from config
    bool quiet = false;
};

// Parses "test" arguments. Unknown flags are errors.
Result<TestOptions> parse_test_args(const std::vector<std::string>& args);

// Owns the whole component graph for one process. The credential cache
// lives here, so cached secrets die with the command.
class SshgateCLI {
public:
    explicit SshgateCLI(Config config);

    // Both return the process exit code.
    int run_test(const std::vector<std::string>& args);
    int run_methods(const std::vector<std::string>& args);

private:
    Config config_;
    platform::ProcessRunner runner_;
    OpenSshOutputParser parser_;
    SystemNetworkBackend network_;
    std::unique_ptr<AuthMethodSource> method_source_;
    ConnectivityProbe connectivity_;
    AuthMethodProbe methods_;
    SystemSshAuthenticator authenticator_;
    KeyLocator keys_;
    SessionCredentialCache cache_;
    DiagnosticsEngine engine_;
    KnownConnections known_;

    Result<ConnectionTarget> resolve_target(const std::string& spec) const;
    void print_result(const ConnectionTarget& target, const AttemptResult& result) const;
};
