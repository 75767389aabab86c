#include "auth_method_probe.hpp"
#include <core/log.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <libssh2.h>

#include <sys/socket.h>
#include <netdb.h>
#include <algorithm>
#include <cstring>
#include <mutex>

// ── SystemSshMethodSource ───────────────────────────────────

SystemSshMethodSource::SystemSshMethodSource(platform::CommandRunner& runner,
                                             const OutputParser& parser,
                                             SshClientOptions opts)
    : runner_(runner), parser_(parser), opts_(std::move(opts)) {}

MethodListing SystemSshMethodSource::list_methods(const ConnectionTarget& target, int timeout_ms) {
    // The probe never authenticates, so it neither checks nor records host keys.
    SshClientOptions probe_opts = opts_;
    probe_opts.strict_host_key_checking = "no";

    auto argv = ssh_command(probe_opts, target, timeout_ms, {
        "-v",
        "-o", "BatchMode=yes",
        "-o", "PreferredAuthentications=none",
        "-o", "UserKnownHostsFile=/dev/null",
    });
    argv.push_back("exit");

    platform::RunOptions ro;
    ro.timeout_ms = timeout_ms;
    CommandResult r = runner_.run(argv, ro);
    sshgate_log_cmd("methods", argv, r);

    MethodListing listing;
    std::string output = r.combined();
    listing.methods = parser_.auth_methods(output);
    listing.banner = parser_.server_banner(output);
    if (!listing.methods.empty()) {
        listing.ok = true;
        return listing;
    }
    if (r.timed_out) {
        listing.error = fmt::format("method probe timed out after {}ms", timeout_ms);
    } else {
        SshFailure f = parser_.classify_failure(output);
        listing.error = f.summary.empty() ? "no authentication methods reported" : f.summary;
    }
    return listing;
}

// ── Libssh2MethodSource ─────────────────────────────────────

namespace {

struct Libssh2Session {
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = SSHGATE_INVALID_SOCKET;

    ~Libssh2Session() {
        if (session) {
            libssh2_session_disconnect(session, "method probe done");
            libssh2_session_free(session);
        }
        if (sock != SSHGATE_INVALID_SOCKET) platform::close_socket(sock);
    }

    std::string last_error() const {
        char* msg = nullptr;
        libssh2_session_last_error(session, &msg, nullptr, 0);
        return msg ? msg : "unknown libssh2 error";
    }
};

int libssh2_init_once() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, []() { rc = libssh2_init(0); });
    return rc;
}

} // namespace

MethodListing Libssh2MethodSource::list_methods(const ConnectionTarget& target, int timeout_ms) {
    MethodListing listing;
    if (libssh2_init_once() != 0) {
        listing.error = "Failed to initialize libssh2";
        return listing;
    }

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* addrs = nullptr;
    std::string port = std::to_string(target.port);
    int rc = getaddrinfo(target.host.c_str(), port.c_str(), &hints, &addrs);
    if (rc != 0) {
        listing.error = "Failed to resolve host: " + target.host;
        return listing;
    }

    Libssh2Session s;
    int err = 0;
    for (auto* ai = addrs; ai && s.sock == SSHGATE_INVALID_SOCKET; ai = ai->ai_next) {
        s.sock = platform::connect_with_timeout(ai->ai_addr, ai->ai_addrlen, timeout_ms, err);
    }
    freeaddrinfo(addrs);
    if (s.sock == SSHGATE_INVALID_SOCKET) {
        listing.error = "Failed to connect: " + std::string(std::strerror(err));
        return listing;
    }
    platform::set_blocking(s.sock);

    s.session = libssh2_session_init();
    if (!s.session) {
        listing.error = "Failed to create SSH session";
        return listing;
    }
    libssh2_session_set_timeout(s.session, timeout_ms);

    if (libssh2_session_handshake(s.session, s.sock) != 0) {
        listing.error = "SSH handshake failed: " + s.last_error();
        return listing;
    }

    const char* banner = libssh2_session_banner_get(s.session);
    if (banner) {
        // "SSH-2.0-OpenSSH_9.6" -> "OpenSSH_9.6", matching what ssh -v reports
        std::string b = banner;
        auto dash = b.find('-', 4);
        listing.banner = (b.rfind("SSH-", 0) == 0 && dash != std::string::npos) ? b.substr(dash + 1) : b;
    }

    char* list = libssh2_userauth_list(s.session, target.user.c_str(),
                                       static_cast<unsigned int>(target.user.size()));
    if (!list) {
        if (libssh2_userauth_authenticated(s.session)) {
            // "none" was accepted outright; nothing to choose between.
            listing.ok = true;
            return listing;
        }
        listing.error = "Failed to list auth methods: " + s.last_error();
        return listing;
    }
    listing.methods = parse_method_list(list);
    listing.ok = !listing.methods.empty();
    if (!listing.ok) listing.error = fmt::format("no recognized methods in \"{}\"", list);
    return listing;
}

// ── AuthMethodProbe ─────────────────────────────────────────

AuthMethodProbe::AuthMethodProbe(AuthMethodSource& source) : source_(source) {}

AuthStrategy AuthMethodProbe::detect(const std::string& host, int port, const std::string& user,
                                     int timeout_ms, bool has_local_keys) {
    ConnectionTarget target;
    target.host = host;
    target.port = port;
    target.user = user;
    return detect(target, timeout_ms, has_local_keys);
}

AuthStrategy AuthMethodProbe::detect(const ConnectionTarget& target, int timeout_ms,
                                     bool has_local_keys) {
    MethodListing listing;
    try {
        listing = source_.list_methods(target, timeout_ms);
    } catch (const std::exception& e) {
        sshgate_log(fmt::format("methods {}: source threw: {}", target.display(), e.what()));
        listing.ok = false;
        listing.error = e.what();
    }

    if (!listing.ok) {
        sshgate_log(fmt::format("methods {}: {}", target.display(), listing.error));
        AuthStrategy unknown;
        unknown.server_banner = listing.banner;
        return unknown;
    }

    AuthStrategy strategy = determine_strategy(listing.methods, has_local_keys);
    strategy.server_banner = listing.banner;
    sshgate_log(fmt::format("methods {}: [{}] -> {}", target.display(),
                            fmt::join(listing.methods, ","), to_string(strategy.kind)));
    return strategy;
}

AuthStrategy AuthMethodProbe::determine_strategy(const std::vector<std::string>& methods,
                                                 bool has_local_keys) {
    AuthStrategy s;
    s.methods = methods;
    if (methods.empty()) return s;  // Unknown

    bool has_password = s.offers("password");
    bool has_publickey = s.offers("publickey");
    bool has_kbd = s.offers("keyboard-interactive");

    if (has_password && !has_publickey && !has_kbd) {
        s.kind = AuthStrategyKind::PasswordOnly;
        s.primary_method = "password";
        s.fallback_methods.clear();
        s.should_prompt_user = true;
        return s;
    }

    if (has_publickey && !has_password && !has_kbd) {
        s.kind = AuthStrategyKind::KeyOnly;
        s.primary_method = "publickey";
        s.fallback_methods.clear();
        s.should_prompt_user = !has_local_keys;
        return s;
    }

    if (methods.size() > 1) {
        s.kind = AuthStrategyKind::MultipleMethods;
        if (has_publickey) s.primary_method = "publickey";
        else if (has_password) s.primary_method = "password";
        else s.primary_method = methods.front();
        s.fallback_methods.clear();
        for (const auto& m : methods) {
            if (m != s.primary_method) s.fallback_methods.push_back(m);
        }
        s.should_prompt_user = !has_local_keys || !has_publickey;
        return s;
    }

    // A lone method we have no way to drive (keyboard-interactive, gssapi)
    AuthStrategy unknown;
    unknown.methods = methods;
    return unknown;
}

std::string AuthMethodProbe::describe(const AuthStrategy& strategy) {
    switch (strategy.kind) {
        case AuthStrategyKind::PasswordOnly:
            return "Server requires password authentication";
        case AuthStrategyKind::KeyOnly:
            return "Server requires SSH key authentication";
        case AuthStrategyKind::MultipleMethods:
            return fmt::format("Server supports multiple authentication methods (primary: {})",
                               strategy.primary_method);
        case AuthStrategyKind::Unknown:
            break;
    }
    return "Authentication requirements unknown";
}
