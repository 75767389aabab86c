#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <net/error_classifier.hpp>

// What a failed ssh client run tells us.
struct SshFailure {
    AuthFailureKind kind = AuthFailureKind::None;
    std::optional<RawError> transport;          // set when the client never got to authentication
    std::vector<std::string> offered_methods;   // "Permission denied (publickey,password)."
    std::string summary;                        // last non-debug line of output

    bool reached_auth() const { return !transport.has_value(); }
};

// Reads the SSH client's human-oriented diagnostics. The text differs
// across client versions and locales, so it stays behind this interface.
class OutputParser {
public:
    virtual ~OutputParser() = default;

    // Recognized methods from "Authentications that can continue: ..."
    virtual std::vector<std::string> auth_methods(const std::string& output) const = 0;

    // Remote software version from the protocol exchange, or "".
    virtual std::string server_banner(const std::string& output) const = 0;

    // key_path lets "No such file or directory" be pinned to the identity file.
    virtual SshFailure classify_failure(const std::string& output,
                                        const std::string& key_path = "") const = 0;
};

// OpenSSH (ssh -v) wording.
class OpenSshOutputParser : public OutputParser {
public:
    std::vector<std::string> auth_methods(const std::string& output) const override;
    std::string server_banner(const std::string& output) const override;
    SshFailure classify_failure(const std::string& output,
                                const std::string& key_path = "") const override;
};

// password, publickey, keyboard-interactive, gssapi-with-mic
bool is_recognized_auth_method(const std::string& method);

// "publickey,password,hostbased" -> {"publickey", "password"}
std::vector<std::string> parse_method_list(const std::string& csv);
