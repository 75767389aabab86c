#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <platform/process.hpp>
#include <ssh/output_parser.hpp>

struct SshClientOptions {
    std::string binary = DEFAULT_SSH_BINARY;
    std::string strict_host_key_checking = DEFAULT_HOST_KEY_CHECKING;
    std::string askpass_program;    // empty: this executable
};

struct AuthAttemptOutcome {
    bool accepted = false;
    SshFailure failure;     // meaningful when !accepted
};

// One real authentication against the server per call.
class Authenticator {
public:
    virtual ~Authenticator() = default;

    virtual AuthAttemptOutcome try_key(const ConnectionTarget& target,
                                       const std::string& key_path, int timeout_ms) = 0;

    virtual AuthAttemptOutcome try_password(const ConnectionTarget& target,
                                            const std::string& password, int timeout_ms) = 0;
};

// -o ConnectTimeout/StrictHostKeyChecking, -p, and user@host last.
std::vector<std::string> ssh_command(const SshClientOptions& opts, const ConnectionTarget& target,
                                     int timeout_ms, const std::vector<std::string>& extra);

// Drives the system ssh client. Key attempts run in batch mode. Password
// attempts hand the secret to ssh through SSH_ASKPASS with the secret in
// the child's environment, never on its command line.
class SystemSshAuthenticator : public Authenticator {
public:
    SystemSshAuthenticator(platform::CommandRunner& runner, const OutputParser& parser,
                           SshClientOptions opts = {});

    AuthAttemptOutcome try_key(const ConnectionTarget& target,
                               const std::string& key_path, int timeout_ms) override;

    AuthAttemptOutcome try_password(const ConnectionTarget& target,
                                    const std::string& password, int timeout_ms) override;

private:
    platform::CommandRunner& runner_;
    const OutputParser& parser_;
    SshClientOptions opts_;
};

// Askpass side of try_password: when SSHGATE_ASKPASS is set, main() prints
// the reply for ssh's prompt and exits. Host-key questions get "no".
bool is_askpass_invocation();
int run_askpass(const std::string& prompt);
