#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// An OS-level failure before classification: an errno value from a socket
// call, an EAI_* code from the resolver, or just a message (ssh output).
struct RawError {
    enum class Source {
        None,
        Errno,
        Resolver,
    };

    Source source = Source::None;
    int value = 0;
    std::string message;

    // message defaults to strerror(err) / gai_strerror(rc).
    static RawError from_errno(int err, const std::string& message = "");
    static RawError from_resolver(int rc, const std::string& message = "");
    static RawError from_message(const std::string& message);
};

// ── Classification ──────────────────────────────────────────
// Both functions are total: unrecognized input yields category Unknown
// with is_retryable=false.

// Codes first, then "timeout"/"refused" substrings of the message.
NetworkErrorDetail classify_error(const RawError& err);

// classify_error plus the SSH-specific phrases. Authentication rejection and
// host-key mismatch leave the network taxonomy (category Authentication).
NetworkErrorDetail classify_ssh_error(const RawError& err);

// Remediation for an authentication sub-kind reported by the SSH client.
NetworkErrorDetail auth_failure_detail(AuthFailureKind kind);

bool is_retryable_error(const RawError& err);

// "<context> failed: <message>" followed by numbered suggestions.
std::string format_error_message(const RawError& err, const std::string& context = "connection");

// "Suggestions:\n  1. ...". Empty for an empty list.
std::string format_suggestions(const std::vector<std::string>& suggestions);
