#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <platform/process.hpp>
#include <ssh/output_parser.hpp>
#include <ssh/system_ssh.hpp>

struct MethodListing {
    bool ok = false;
    std::vector<std::string> methods;
    std::string banner;
    std::string error;
};

// Something that can ask a server which authentication methods it accepts.
class AuthMethodSource {
public:
    virtual ~AuthMethodSource() = default;
    virtual MethodListing list_methods(const ConnectionTarget& target, int timeout_ms) = 0;
};

// ssh -v with PreferredAuthentications=none: the server answers the
// "none" request with the list of methods that can continue.
class SystemSshMethodSource : public AuthMethodSource {
public:
    SystemSshMethodSource(platform::CommandRunner& runner, const OutputParser& parser,
                          SshClientOptions opts = {});

    MethodListing list_methods(const ConnectionTarget& target, int timeout_ms) override;

private:
    platform::CommandRunner& runner_;
    const OutputParser& parser_;
    SshClientOptions opts_;
};

// libssh2_userauth_list over a plain TCP session. No client output to parse.
class Libssh2MethodSource : public AuthMethodSource {
public:
    MethodListing list_methods(const ConnectionTarget& target, int timeout_ms) override;
};

class AuthMethodProbe {
public:
    explicit AuthMethodProbe(AuthMethodSource& source);

    // Advisory: any failure, including an exception from the source,
    // degrades to an Unknown strategy.
    AuthStrategy detect(const std::string& host, int port, const std::string& user,
                        int timeout_ms, bool has_local_keys = false);
    AuthStrategy detect(const ConnectionTarget& target, int timeout_ms, bool has_local_keys);

    static AuthStrategy determine_strategy(const std::vector<std::string>& methods,
                                           bool has_local_keys);

    static std::string describe(const AuthStrategy& strategy);

private:
    AuthMethodSource& source_;
};
