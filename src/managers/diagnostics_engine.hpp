#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <net/connectivity_probe.hpp>
#include <ssh/auth_method_probe.hpp>
#include <ssh/system_ssh.hpp>
#include <ssh/key_locator.hpp>
#include <managers/credential_cache.hpp>

struct DiagnosticsTimeouts {
    int dns_ms = DNS_TIMEOUT_MS;
    int port_ms = PORT_TIMEOUT_MS;
    int method_probe_ms = METHOD_PROBE_TIMEOUT_MS;
    int auth_ms = AUTH_TIMEOUT_MS;
};

struct DiagnoseOptions {
    bool suppress_debug_output = false;     // no progress lines through the status callback
};

// Runs the staged pipeline for one target: connectivity, then the
// advisory method probe, then real authentication attempts. A failing
// stage ends the run; later stages keep their "not tested" state.
class DiagnosticsEngine {
public:
    DiagnosticsEngine(ConnectivityProbe& connectivity, AuthMethodProbe& methods,
                      Authenticator& authenticator, const KeyLocator& keys,
                      SessionCredentialCache& cache, DiagnosticsTimeouts timeouts = {});
    virtual ~DiagnosticsEngine() = default;

    void set_status_callback(StatusCallback cb) { status_ = std::move(cb); }

    virtual ConnectionDiagnostics diagnose(const ConnectionTarget& target,
                                           const DiagnoseOptions& opts = {});

    // Authentication stage only, with one supplied credential. Connectivity
    // and strategy are carried over from previous.
    virtual ConnectionDiagnostics verify_credential(const ConnectionTarget& target,
                                                    const CredentialAttempt& attempt,
                                                    const ConnectionDiagnostics& previous);

private:
    ConnectivityProbe& connectivity_;
    AuthMethodProbe& methods_;
    Authenticator& authenticator_;
    const KeyLocator& keys_;
    SessionCredentialCache& cache_;
    DiagnosticsTimeouts timeouts_;
    StatusCallback status_;
    bool quiet_ = false;

    void report(const std::string& msg) const;

    void authenticate(const ConnectionTarget& target, ConnectionDiagnostics& d,
                      const std::vector<std::filesystem::path>& keys);

    AuthAttemptOutcome try_credential(const ConnectionTarget& target, CredentialType type,
                                      const std::string& value);

    static void record_success(ConnectionDiagnostics& d, CredentialType type,
                               const std::string& value);
    static void record_transport_failure(ConnectionDiagnostics& d, const RawError& err);
    static void record_auth_failure(ConnectionDiagnostics& d, std::optional<CredentialType> last_type,
                                    const SshFailure& failure);
};

// Message + numbered suggestions, as shown to the user.
std::string compose_message(const std::string& headline, const std::vector<std::string>& suggestions);
