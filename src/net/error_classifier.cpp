#include "error_classifier.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <netdb.h>
#include <cerrno>
#include <cstring>

// ── RawError ────────────────────────────────────────────────

RawError RawError::from_errno(int err, const std::string& message) {
    return {Source::Errno, err, message.empty() ? std::string(std::strerror(err)) : message};
}

RawError RawError::from_resolver(int rc, const std::string& message) {
    return {Source::Resolver, rc, message.empty() ? std::string(gai_strerror(rc)) : message};
}

RawError RawError::from_message(const std::string& message) {
    return {Source::None, 0, message};
}

// ── Known codes ─────────────────────────────────────────────

static NetworkErrorDetail dns_not_found() {
    return {ErrorCategory::Dns, "ENOTFOUND",
            "DNS resolution failed - hostname not found", false,
            {"Check if the hostname is spelled correctly",
             "Verify the domain exists and is accessible",
             "Check your DNS settings",
             "Try using an IP address instead"}};
}

static NetworkErrorDetail dns_temporary() {
    return {ErrorCategory::Dns, "EAI_AGAIN",
            "DNS lookup timeout - temporary DNS failure", true,
            {"Retry the connection after a short delay",
             "Check your internet connection",
             "Try using a different DNS server",
             "Check if your network has DNS issues"}};
}

static NetworkErrorDetail connection_refused() {
    return {ErrorCategory::Port, "ECONNREFUSED",
            "Connection refused - port is closed or blocked", false,
            {"Check if the SSH service is running on the target server",
             "Verify the port number is correct (default SSH port is 22)",
             "Check if a firewall is blocking the connection",
             "Ensure the service is listening on the specified port"}};
}

static NetworkErrorDetail unreachable(const std::string& code, const std::string& message) {
    return {ErrorCategory::Network, code, message, false,
            {"Check your network connection",
             "Verify the host IP address is correct",
             "Check if there are routing issues",
             "Ensure the host is online and accessible"}};
}

static NetworkErrorDetail timed_out() {
    return {ErrorCategory::Timeout, "ETIMEDOUT",
            "Connection timeout - host did not respond in time", true,
            {"Retry with a longer timeout",
             "Check if the host is responding slowly",
             "Verify network connectivity",
             "Check if there are network congestion issues"}};
}

static NetworkErrorDetail connection_reset() {
    return {ErrorCategory::Network, "ECONNRESET",
            "Connection reset by peer", true,
            {"Retry the connection",
             "Check if the server is overloaded",
             "Verify network stability",
             "Check server logs for issues"}};
}

static bool resolver_not_found(int rc) {
    switch (rc) {
        case EAI_NONAME:
        case EAI_FAIL:
#ifdef EAI_NODATA
        case EAI_NODATA:
#endif
#ifdef EAI_ADDRFAMILY
        case EAI_ADDRFAMILY:
#endif
            return true;
    }
    return false;
}

// ── classify_error ──────────────────────────────────────────

NetworkErrorDetail classify_error(const RawError& err) {
    if (err.source == RawError::Source::Resolver) {
        if (resolver_not_found(err.value)) return dns_not_found();
        if (err.value == EAI_AGAIN) return dns_temporary();
    } else if (err.source == RawError::Source::Errno) {
        switch (err.value) {
            case ECONNREFUSED: return connection_refused();
            case EHOSTUNREACH: return unreachable("EHOSTUNREACH", "Host unreachable - no route to host");
            case ENETUNREACH:  return unreachable("ENETUNREACH", "Network unreachable");
            case ETIMEDOUT:    return timed_out();
            case ECONNRESET:   return connection_reset();
        }
    }

    // Last resort: the message text.
    if (contains_icase(err.message, "timeout") || contains_icase(err.message, "timed out")) {
        return {ErrorCategory::Timeout, "TIMEOUT", "Connection timeout detected", true,
                {"Retry with a longer timeout", "Check network connectivity"}};
    }
    if (contains_icase(err.message, "refused")) {
        return {ErrorCategory::Port, "CONNECTION_REFUSED", "Connection refused detected", false,
                {"Check if the service is running", "Verify the port number"}};
    }
    return {ErrorCategory::Unknown, "UNKNOWN",
            "Unknown network error: " + (err.message.empty() ? std::string("no details") : err.message),
            false,
            {"Check the error details", "Verify network configuration"}};
}

// ── SSH-specific ────────────────────────────────────────────

NetworkErrorDetail classify_ssh_error(const RawError& err) {
    if (err.message.find("Authentication failed") != std::string::npos ||
        err.message.find("Permission denied") != std::string::npos) {
        return auth_failure_detail(AuthFailureKind::Other);
    }
    if (err.message.find("Host key verification failed") != std::string::npos) {
        return auth_failure_detail(AuthFailureKind::HostKeyMismatch);
    }

    NetworkErrorDetail base = classify_error(err);
    if (base.category == ErrorCategory::Port && base.code == "ECONNREFUSED") {
        base.suggestions = {
            "Check if SSH daemon (sshd) is running on the server",
            "Verify the SSH port (default is 22)",
            "Check firewall rules on both client and server",
            "Ensure SSH service is enabled and started",
        };
    }
    return base;
}

NetworkErrorDetail auth_failure_detail(AuthFailureKind kind) {
    NetworkErrorDetail d;
    d.category = ErrorCategory::Authentication;
    d.is_retryable = false;
    d.auth_kind = kind;

    switch (kind) {
        case AuthFailureKind::KeyFormat:
            d.code = "SSH_KEY_FORMAT";
            d.message = "SSH key format issue detected";
            d.suggestions = {"Check that the file is a private key, not the .pub half",
                             "Restrict the key permissions with chmod 600",
                             "Re-export the key with ssh-keygen if its format is unsupported"};
            break;
        case AuthFailureKind::KeyNotFound:
            d.code = "SSH_KEY_NOT_FOUND";
            d.message = "SSH key file not found";
            d.suggestions = {"Verify the key path is correct",
                             "Generate a key pair with ssh-keygen",
                             "Use password authentication instead"};
            break;
        case AuthFailureKind::KeyRejected:
            d.code = "SSH_KEY_REJECTED";
            d.message = "Authentication failed with key";
            d.suggestions = {"Ensure the public key is in ~/.ssh/authorized_keys on the server",
                             "Verify the key belongs to this user",
                             "Try password authentication"};
            break;
        case AuthFailureKind::PasswordIncorrect:
            d.code = "SSH_PASSWORD_INCORRECT";
            d.message = "Password authentication failed";
            d.suggestions = {"Check your username and password",
                             "Check that Caps Lock is off",
                             "Ensure the user has SSH access on the server"};
            break;
        case AuthFailureKind::PasswordDisabledOnServer:
            d.code = "SSH_PASSWORD_DISABLED";
            d.message = "SSH key authentication failed. Server has password authentication disabled.";
            d.suggestions = {"Check your SSH keys",
                             "Ask the server administrator to install your public key"};
            break;
        case AuthFailureKind::HostKeyMismatch:
            d.code = "SSH_HOST_KEY_FAILED";
            d.message = "SSH host key verification failed";
            d.suggestions = {"Update your known_hosts file",
                             "Verify the server's host key",
                             "Use ssh-keyscan to get the correct host key",
                             "Check if the server key has changed"};
            break;
        case AuthFailureKind::None:
        case AuthFailureKind::Other:
            d.code = "SSH_AUTH_FAILED";
            d.message = "SSH authentication failed";
            d.suggestions = {"Check your username and password",
                             "Verify SSH key permissions and path",
                             "Ensure the user has SSH access on the server",
                             "Check if the authentication method is supported"};
            break;
    }
    return d;
}

bool is_retryable_error(const RawError& err) {
    return classify_error(err).is_retryable;
}

std::string format_suggestions(const std::vector<std::string>& suggestions) {
    if (suggestions.empty()) return "";
    std::string out = "Suggestions:";
    for (size_t i = 0; i < suggestions.size(); i++) {
        out += fmt::format("\n  {}. {}", i + 1, suggestions[i]);
    }
    return out;
}

std::string format_error_message(const RawError& err, const std::string& context) {
    NetworkErrorDetail d = classify_error(err);
    std::string message = fmt::format("{} failed: {}", context, d.message);
    if (!d.suggestions.empty()) message += "\n\n" + format_suggestions(d.suggestions);
    return message;
}
