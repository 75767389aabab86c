#include "connectivity_probe.hpp"
#include <core/log.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <memory>

// ── Loopback ────────────────────────────────────────────────

bool is_loopback_host(const std::string& host) {
    if (host == "localhost" || host == "::1" || host == "[::1]") return true;
    struct in_addr v4;
    if (inet_pton(AF_INET, host.c_str(), &v4) == 1) {
        return (ntohl(v4.s_addr) >> 24) == 127;
    }
    return false;
}

// ── SystemNetworkBackend ────────────────────────────────────

namespace {

std::string numeric_address(const struct sockaddr* sa) {
    char buf[INET6_ADDRSTRLEN] = {};
    if (sa->sa_family == AF_INET) {
        auto* in = reinterpret_cast<const struct sockaddr_in*>(sa);
        inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf));
    } else if (sa->sa_family == AF_INET6) {
        auto* in6 = reinterpret_cast<const struct sockaddr_in6*>(sa);
        inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
    }
    return buf;
}

} // namespace

// One getaddrinfo_a request. glibc reads and writes these fields until
// gai_error() stops reporting EAI_INPROGRESS, so they live on the heap.
struct SystemNetworkBackend::Lookup {
    std::string name;
    struct addrinfo hints;
    struct gaicb cb;

    explicit Lookup(const std::string& host) : name(host) {
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        std::memset(&cb, 0, sizeof(cb));
        cb.ar_name = name.c_str();
        cb.ar_request = &hints;
    }

    ~Lookup() {
        if (cb.ar_result) freeaddrinfo(cb.ar_result);
    }
};

SystemNetworkBackend::SystemNetworkBackend() = default;

SystemNetworkBackend::~SystemNetworkBackend() {
    for (auto& entry : pending_) {
        Lookup& lookup = *entry.second;
        if (gai_cancel(&lookup.cb) == EAI_CANCELED) continue;
        const struct gaicb* list[] = {&lookup.cb};
        while (gai_error(&lookup.cb) == EAI_INPROGRESS) gai_suspend(list, 1, nullptr);
    }
}

size_t SystemNetworkBackend::pending_lookups() const {
    return pending_.size();
}

NetworkBackend::Resolution SystemNetworkBackend::resolve(const std::string& host, int timeout_ms) {
    Resolution res;

    // A lookup that outlived an earlier timeout is waited on again rather
    // than racing a second one against the same name.
    auto it = pending_.find(host);
    if (it == pending_.end()) {
        auto lookup = std::make_unique<Lookup>(host);
        struct gaicb* list[] = {&lookup->cb};
        int rc = getaddrinfo_a(GAI_NOWAIT, list, 1, nullptr);
        if (rc != 0) {
            res.error = rc == EAI_SYSTEM ? RawError::from_errno(errno) : RawError::from_resolver(rc);
            return res;
        }
        it = pending_.emplace(host, std::move(lookup)).first;
    } else {
        sshgate_log(fmt::format("dns {}: waiting on earlier lookup", host));
    }
    Lookup& lookup = *it->second;

    struct timespec ts;
    ts.tv_sec = timeout_ms / 1000;
    ts.tv_nsec = static_cast<long>(timeout_ms % 1000) * 1000000L;
    const struct gaicb* wait_list[] = {&lookup.cb};
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (gai_error(&lookup.cb) == EAI_INPROGRESS) {
        int rc = gai_suspend(wait_list, 1, &ts);
        if (rc != EAI_INTR || std::chrono::steady_clock::now() >= deadline) break;
        // interrupted: resume with what is left of the budget
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        ts.tv_sec = left / 1000;
        ts.tv_nsec = static_cast<long>(left % 1000) * 1000000L;
    }

    int rc = gai_error(&lookup.cb);
    if (rc == EAI_INPROGRESS) {
        // Cancel if glibc has not started it yet; otherwise it stays pending.
        if (gai_cancel(&lookup.cb) == EAI_CANCELED) pending_.erase(it);
        res.error = RawError::from_resolver(
            EAI_AGAIN, fmt::format("DNS lookup for {} timed out after {}ms", host, timeout_ms));
        return res;
    }

    if (rc != 0) {
        res.error = RawError::from_resolver(rc);
    } else {
        for (auto* ai = lookup.cb.ar_result; ai; ai = ai->ai_next) {
            std::string addr = numeric_address(ai->ai_addr);
            if (!addr.empty()) res.addresses.push_back(addr);
        }
        if (res.addresses.empty()) res.error = RawError::from_resolver(EAI_NONAME);
    }
    pending_.erase(it);
    return res;
}

std::optional<RawError> SystemNetworkBackend::connect(const std::string& address, int port,
                                                      int timeout_ms) {
    struct sockaddr_storage ss;
    std::memset(&ss, 0, sizeof(ss));
    socklen_t len = 0;

    auto* v4 = reinterpret_cast<struct sockaddr_in*>(&ss);
    auto* v6 = reinterpret_cast<struct sockaddr_in6*>(&ss);
    if (inet_pton(AF_INET, address.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(static_cast<uint16_t>(port));
        len = sizeof(*v4);
    } else if (inet_pton(AF_INET6, address.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(static_cast<uint16_t>(port));
        len = sizeof(*v6);
    } else {
        return RawError::from_message("not a numeric address: " + address);
    }

    int err = 0;
    socket_t sock = platform::connect_with_timeout(reinterpret_cast<struct sockaddr*>(&ss), len,
                                                   timeout_ms, err);
    if (sock == SSHGATE_INVALID_SOCKET) {
        if (err == ETIMEDOUT) {
            return RawError::from_errno(
                ETIMEDOUT, fmt::format("Port {} connection timeout after {}ms", port, timeout_ms));
        }
        return RawError::from_errno(err);
    }
    platform::close_socket(sock);
    return std::nullopt;
}

// ── ConnectivityProbe ───────────────────────────────────────

ConnectivityProbe::ConnectivityProbe(NetworkBackend& backend) : backend_(backend) {}

ConnectivityResult ConnectivityProbe::probe(const std::string& host, int port, int timeout_ms) {
    return probe(host, port, timeout_ms, timeout_ms);
}

ConnectivityResult ConnectivityProbe::probe(const std::string& host, int port,
                                            int dns_timeout_ms, int port_timeout_ms) {
    using clock = std::chrono::steady_clock;
    auto start = clock::now();
    auto elapsed_ms = [&]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start).count();
    };

    ConnectivityResult result;

    // Step 1: DNS
    std::vector<std::string> addresses;
    if (is_loopback_host(host)) {
        std::string literal = host == "[::1]" ? "::1" : host;
        addresses.push_back(literal == "localhost" ? "127.0.0.1" : literal);
    } else {
        auto res = backend_.resolve(host, dns_timeout_ms);
        if (res.error) {
            result.detail = classify_error(*res.error);
            result.duration_ms = elapsed_ms();
            sshgate_log(fmt::format("probe {}: dns failed ({}: {})", host,
                                    result.detail->code, res.error->message));
            return result;
        }
        addresses = std::move(res.addresses);
    }
    result.dns_ok = true;

    // Step 2: TCP, first address that accepts wins
    auto tcp_start = clock::now();
    std::optional<RawError> last_error;
    for (const auto& addr : addresses) {
        auto spent = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - tcp_start).count();
        int budget = port_timeout_ms - static_cast<int>(spent);
        if (budget <= 0) {
            last_error = RawError::from_errno(
                ETIMEDOUT, fmt::format("Port {} connection timeout after {}ms", port, port_timeout_ms));
            break;
        }
        last_error = backend_.connect(addr, port, budget);
        if (!last_error) {
            result.port_ok = true;
            break;
        }
        sshgate_log(fmt::format("probe {}: connect {}:{} failed: {}", host, addr, port,
                                last_error->message));
    }

    if (!result.port_ok) {
        result.detail = classify_error(last_error ? *last_error
                                                  : RawError::from_message("no addresses to connect to"));
    }
    result.duration_ms = elapsed_ms();
    return result;
}
