#pragma once

#include <string>
#include <vector>
#include <optional>
#include <map>
#include <memory>
#include <core/types.hpp>
#include <net/error_classifier.hpp>

// OS resolver and socket access behind one seam, so the probe's ordering
// and classification can be driven without a network.
class NetworkBackend {
public:
    struct Resolution {
        std::vector<std::string> addresses;     // numeric, connect() accepts them
        std::optional<RawError> error;
    };

    virtual ~NetworkBackend() = default;

    virtual Resolution resolve(const std::string& host, int timeout_ms) = 0;

    // nullopt on success.
    virtual std::optional<RawError> connect(const std::string& address, int port, int timeout_ms) = 0;
};

// getaddrinfo_a bounded by gai_suspend, and a non-blocking connect bounded
// by poll. At most one lookup per host name is in flight.
class SystemNetworkBackend : public NetworkBackend {
public:
    SystemNetworkBackend();
    ~SystemNetworkBackend() override;

    SystemNetworkBackend(const SystemNetworkBackend&) = delete;
    SystemNetworkBackend& operator=(const SystemNetworkBackend&) = delete;

    Resolution resolve(const std::string& host, int timeout_ms) override;
    std::optional<RawError> connect(const std::string& address, int port, int timeout_ms) override;

    // Lookups that timed out but could not be cancelled.
    size_t pending_lookups() const;

private:
    struct Lookup;
    std::map<std::string, std::unique_ptr<Lookup>> pending_;
};

// localhost, 127.0.0.0/8 and ::1.
bool is_loopback_host(const std::string& host);

class ConnectivityProbe {
public:
    explicit ConnectivityProbe(NetworkBackend& backend);

    // DNS, then TCP only if DNS succeeded. Each step gets its own timeout.
    // Single shot: no retries here.
    ConnectivityResult probe(const std::string& host, int port, int timeout_ms);

    // Same, with separate budgets for the two steps.
    ConnectivityResult probe(const std::string& host, int port, int dns_timeout_ms, int port_timeout_ms);

private:
    NetworkBackend& backend_;
};
