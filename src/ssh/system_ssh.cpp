#include "system_ssh.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <iostream>
#include <cstdlib>
#include <cerrno>

namespace fs = std::filesystem;

// ssh itself gets a whole-second ConnectTimeout; the process deadline
// leaves room for the handshake and auth exchange on top of it.
static int connect_timeout_secs(int timeout_ms) {
    int secs = timeout_ms / 1000;
    return secs < 1 ? 1 : secs;
}

std::vector<std::string> ssh_command(const SshClientOptions& opts, const ConnectionTarget& target,
                                     int timeout_ms, const std::vector<std::string>& extra) {
    std::vector<std::string> argv = {
        opts.binary,
        "-o", fmt::format("ConnectTimeout={}", connect_timeout_secs(timeout_ms)),
        "-o", "StrictHostKeyChecking=" + opts.strict_host_key_checking,
        // an existing master connection would answer for any credential
        "-o", "ControlMaster=no",
        "-o", "ControlPath=none",
    };
    argv.insert(argv.end(), extra.begin(), extra.end());
    argv.push_back("-p");
    argv.push_back(std::to_string(target.port));
    argv.push_back(target.user + "@" + target.host);
    return argv;
}

SystemSshAuthenticator::SystemSshAuthenticator(platform::CommandRunner& runner,
                                               const OutputParser& parser,
                                               SshClientOptions opts)
    : runner_(runner), parser_(parser), opts_(std::move(opts)) {}

AuthAttemptOutcome SystemSshAuthenticator::try_key(const ConnectionTarget& target,
                                                   const std::string& key_path, int timeout_ms) {
    AuthAttemptOutcome out;
    fs::path key = platform::expand_home(key_path);
    std::error_code ec;
    if (!fs::is_regular_file(key, ec)) {
        out.failure.kind = AuthFailureKind::KeyNotFound;
        out.failure.summary = "SSH key file not found: " + key.string();
        return out;
    }

    auto argv = ssh_command(opts_, target, timeout_ms, {
        "-o", "BatchMode=yes",
        "-o", "IdentitiesOnly=yes",
        "-o", "PreferredAuthentications=publickey",
        "-i", key.string(),
    });
    argv.push_back("exit");

    platform::RunOptions ro;
    ro.timeout_ms = timeout_ms + PROCESS_KILL_GRACE_MS;
    CommandResult r = runner_.run(argv, ro);
    sshgate_log_cmd("auth-key", argv, r);

    if (r.success()) {
        out.accepted = true;
        return out;
    }
    if (r.timed_out) {
        out.failure.transport = RawError::from_errno(
            ETIMEDOUT, fmt::format("ssh did not finish within {}ms", ro.timeout_ms));
        out.failure.kind = AuthFailureKind::Other;
        return out;
    }
    out.failure = parser_.classify_failure(r.combined(), key.string());
    return out;
}

AuthAttemptOutcome SystemSshAuthenticator::try_password(const ConnectionTarget& target,
                                                        const std::string& password, int timeout_ms) {
    AuthAttemptOutcome out;

    std::string askpass = opts_.askpass_program;
    if (askpass.empty()) askpass = platform::self_exe_path().string();
    if (askpass.empty()) {
        out.failure.kind = AuthFailureKind::Other;
        out.failure.summary = "no askpass helper available for password authentication";
        return out;
    }

    auto argv = ssh_command(opts_, target, timeout_ms, {
        "-o", "BatchMode=no",
        "-o", "PubkeyAuthentication=no",
        "-o", "PreferredAuthentications=password,keyboard-interactive",
        "-o", "NumberOfPasswordPrompts=1",
    });
    argv.push_back("exit");

    const char* display = std::getenv("DISPLAY");
    platform::RunOptions ro;
    ro.timeout_ms = timeout_ms + PROCESS_KILL_GRACE_MS;
    ro.env = {
        {"SSH_ASKPASS", askpass},
        {"SSH_ASKPASS_REQUIRE", "force"},
        {"DISPLAY", display && *display ? display : ":0"},
        {ASKPASS_ENV_FLAG, "1"},
        {ASKPASS_ENV_SECRET, password},
    };
    CommandResult r = runner_.run(argv, ro);
    sshgate_log_cmd("auth-password", argv, r);

    if (r.success()) {
        out.accepted = true;
        return out;
    }
    if (r.timed_out) {
        out.failure.transport = RawError::from_errno(
            ETIMEDOUT, fmt::format("ssh did not finish within {}ms", ro.timeout_ms));
        out.failure.kind = AuthFailureKind::Other;
        return out;
    }

    out.failure = parser_.classify_failure(r.combined());
    if (out.failure.kind == AuthFailureKind::KeyRejected) {
        const auto& offered = out.failure.offered_methods;
        bool password_offered = offered.empty();
        for (const auto& m : offered) {
            if (m == "password" || m == "keyboard-interactive") password_offered = true;
        }
        out.failure.kind = password_offered ? AuthFailureKind::PasswordIncorrect
                                            : AuthFailureKind::PasswordDisabledOnServer;
    }
    return out;
}

// ── askpass ─────────────────────────────────────────────────

bool is_askpass_invocation() {
    const char* flag = std::getenv(ASKPASS_ENV_FLAG);
    return flag && std::string(flag) == "1";
}

int run_askpass(const std::string& prompt) {
    if (prompt.find("yes/no") != std::string::npos) {
        std::cout << "no\n";
        return 0;
    }
    const char* secret = std::getenv(ASKPASS_ENV_SECRET);
    if (!secret) return 1;
    std::cout << secret << "\n";
    return 0;
}
