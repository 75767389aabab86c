#include "output_parser.hpp"
#include <core/utils.hpp>
#include <regex>
#include <sstream>
#include <cerrno>
#include <netdb.h>

bool is_recognized_auth_method(const std::string& method) {
    return method == "password" || method == "publickey" ||
           method == "keyboard-interactive" || method == "gssapi-with-mic";
}

std::vector<std::string> parse_method_list(const std::string& list) {
    std::vector<std::string> out;
    for (const auto& m : split_trimmed(list, ',')) {
        if (is_recognized_auth_method(m)) out.push_back(m);
    }
    return out;
}

static std::string last_significant_line(const std::string& output) {
    std::istringstream in(output);
    std::string line, last;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line.rfind("debug", 0) == 0) continue;
        if (line.rfind("OpenSSH_", 0) == 0) continue;   // version banner printed by -v
        last = line;
    }
    return last;
}

static bool has(const std::string& output, const char* needle) {
    return output.find(needle) != std::string::npos;
}

// ── OpenSshOutputParser ─────────────────────────────────────

std::vector<std::string> OpenSshOutputParser::auth_methods(const std::string& output) const {
    static const std::regex re("Authentications that can continue: ([^\\r\\n]+)");
    std::smatch m;
    if (!std::regex_search(output, m, re)) return {};
    return parse_method_list(m[1].str());
}

std::string OpenSshOutputParser::server_banner(const std::string& output) const {
    static const std::regex re("Remote protocol version [^,]+, remote software version ([^\\r\\n]+)");
    std::smatch m;
    if (!std::regex_search(output, m, re)) return "";
    std::string banner = m[1].str();
    trim(banner);
    return banner;
}

SshFailure OpenSshOutputParser::classify_failure(const std::string& output,
                                                 const std::string& key_path) const {
    SshFailure f;
    f.summary = last_significant_line(output);

    // Trust first: a changed host key aborts before any authentication.
    if (has(output, "Host key verification failed") ||
        has(output, "REMOTE HOST IDENTIFICATION HAS CHANGED")) {
        f.kind = AuthFailureKind::HostKeyMismatch;
        return f;
    }

    // Transport: the client never reached the server's auth layer.
    if (has(output, "Could not resolve hostname")) {
        int rc = contains_icase(output, "temporary failure") ? EAI_AGAIN : EAI_NONAME;
        f.transport = RawError::from_resolver(rc, f.summary);
    } else if (has(output, "Connection refused")) {
        f.transport = RawError::from_errno(ECONNREFUSED, f.summary);
    } else if (has(output, "No route to host")) {
        f.transport = RawError::from_errno(EHOSTUNREACH, f.summary);
    } else if (has(output, "Network is unreachable")) {
        f.transport = RawError::from_errno(ENETUNREACH, f.summary);
    } else if (has(output, "Connection timed out") || has(output, "Operation timed out")) {
        f.transport = RawError::from_errno(ETIMEDOUT, f.summary);
    } else if (has(output, "Connection reset")) {
        f.transport = RawError::from_errno(ECONNRESET, f.summary);
    }
    if (f.transport) {
        f.kind = AuthFailureKind::Other;
        return f;
    }

    // Local key problems, before the "Permission denied" that usually follows them.
    if (has(output, "no such identity") ||
        (!key_path.empty() && has(output, "No such file or directory") && has(output, key_path.c_str()))) {
        f.kind = AuthFailureKind::KeyNotFound;
        return f;
    }
    if (has(output, "invalid format") || has(output, "bad permissions") ||
        has(output, "UNPROTECTED PRIVATE KEY FILE") || has(output, "error in libcrypto")) {
        f.kind = AuthFailureKind::KeyFormat;
        return f;
    }

    static const std::regex denied_re("Permission denied \\(([^)]*)\\)");
    std::smatch m;
    if (std::regex_search(output, m, denied_re)) {
        f.kind = AuthFailureKind::KeyRejected;
        f.offered_methods = parse_method_list(m[1].str());
        return f;
    }
    if (has(output, "Permission denied") || has(output, "Authentication failed") ||
        has(output, "Too many authentication failures")) {
        f.kind = AuthFailureKind::KeyRejected;
        return f;
    }

    f.kind = AuthFailureKind::Other;
    return f;
}
