#include <gtest/gtest.h>
#include <net/connectivity_probe.hpp>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include "fakes.hpp"

// ── Ordering and classification (fake backend) ──────────────

TEST(ConnectivityProbe, Success) {
    FakeNetworkBackend net;
    net.reachable("api.example.test");
    ConnectivityProbe probe(net);

    auto r = probe.probe("api.example.test", 22, 1000);
    EXPECT_TRUE(r.dns_ok);
    EXPECT_TRUE(r.port_ok);
    EXPECT_TRUE(r.success());
    EXPECT_FALSE(r.detail.has_value());
}

TEST(ConnectivityProbe, DnsFailureSkipsTcp) {
    FakeNetworkBackend net;
    net.resolutions["nope.example.test"].error = RawError::from_resolver(EAI_NONAME);
    ConnectivityProbe probe(net);

    auto r = probe.probe("nope.example.test", 22, 1000);
    EXPECT_FALSE(r.dns_ok);
    EXPECT_FALSE(r.port_ok);
    EXPECT_EQ(net.connect_calls, 0);
    ASSERT_TRUE(r.detail.has_value());
    EXPECT_EQ(r.detail->category, ErrorCategory::Dns);
    EXPECT_EQ(r.detail->code, "ENOTFOUND");
}

TEST(ConnectivityProbe, RefusedPort) {
    FakeNetworkBackend net;
    net.resolutions["api.example.test"].addresses = {"192.0.2.10"};
    net.connects["192.0.2.10"] = RawError::from_errno(ECONNREFUSED);
    ConnectivityProbe probe(net);

    auto r = probe.probe("api.example.test", 22, 1000);
    EXPECT_TRUE(r.dns_ok);
    EXPECT_FALSE(r.port_ok);
    ASSERT_TRUE(r.detail.has_value());
    EXPECT_EQ(r.detail->category, ErrorCategory::Port);
    EXPECT_FALSE(r.detail->is_retryable);
}

TEST(ConnectivityProbe, FallsThroughToNextAddress) {
    FakeNetworkBackend net;
    net.resolutions["dual.example.test"].addresses = {"2001:db8::1", "192.0.2.20"};
    net.connects["2001:db8::1"] = RawError::from_errno(ENETUNREACH);
    net.connects["192.0.2.20"] = std::nullopt;
    ConnectivityProbe probe(net);

    auto r = probe.probe("dual.example.test", 22, 1000);
    EXPECT_TRUE(r.success());
    EXPECT_EQ(net.connect_calls, 2);
}

TEST(ConnectivityProbe, LastAddressErrorIsReported) {
    FakeNetworkBackend net;
    net.resolutions["dual.example.test"].addresses = {"2001:db8::1", "192.0.2.20"};
    net.connects["2001:db8::1"] = RawError::from_errno(ENETUNREACH);
    net.connects["192.0.2.20"] = RawError::from_errno(ETIMEDOUT);
    ConnectivityProbe probe(net);

    auto r = probe.probe("dual.example.test", 22, 1000);
    ASSERT_TRUE(r.detail.has_value());
    EXPECT_EQ(r.detail->category, ErrorCategory::Timeout);
    EXPECT_TRUE(r.detail->is_retryable);
}

TEST(ConnectivityProbe, LoopbackSkipsResolver) {
    FakeNetworkBackend net;
    net.connects["127.0.0.1"] = std::nullopt;
    net.connects["::1"] = std::nullopt;
    ConnectivityProbe probe(net);

    EXPECT_TRUE(probe.probe("localhost", 22, 1000).success());
    EXPECT_TRUE(probe.probe("127.0.0.1", 22, 1000).success());
    EXPECT_TRUE(probe.probe("[::1]", 22, 1000).success());
    EXPECT_EQ(net.resolve_calls, 0);
}

TEST(ConnectivityProbe, LoopbackHosts) {
    EXPECT_TRUE(is_loopback_host("localhost"));
    EXPECT_TRUE(is_loopback_host("127.0.0.1"));
    EXPECT_TRUE(is_loopback_host("127.8.9.10"));
    EXPECT_TRUE(is_loopback_host("::1"));
    EXPECT_FALSE(is_loopback_host("128.0.0.1"));
    EXPECT_FALSE(is_loopback_host("localhost.example.test"));
}

// ── Real sockets on the loopback interface ──────────────────

class LoopbackListener {
public:
    LoopbackListener() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
        ::listen(fd_, 4);
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }

    ~LoopbackListener() { close(); }

    void close() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

    bool ok() const { return fd_ >= 0 && port_ > 0; }
    int port() const { return port_; }

private:
    int fd_ = -1;
    int port_ = 0;
};

TEST(SystemNetworkBackend, ConnectsToListeningPort) {
    LoopbackListener listener;
    ASSERT_TRUE(listener.ok());

    SystemNetworkBackend net;
    ConnectivityProbe probe(net);
    auto r = probe.probe("127.0.0.1", listener.port(), 2000);
    EXPECT_TRUE(r.success()) << (r.detail ? r.detail->message : "");
}

TEST(SystemNetworkBackend, ClosedPortIsRefused) {
    LoopbackListener listener;
    ASSERT_TRUE(listener.ok());
    int port = listener.port();
    listener.close();

    SystemNetworkBackend net;
    ConnectivityProbe probe(net);
    auto r = probe.probe("127.0.0.1", port, 2000);
    EXPECT_TRUE(r.dns_ok);
    EXPECT_FALSE(r.port_ok);
    ASSERT_TRUE(r.detail.has_value());
    EXPECT_EQ(r.detail->category, ErrorCategory::Port);
    EXPECT_EQ(r.detail->code, "ECONNREFUSED");
}

TEST(SystemNetworkBackend, RejectsNonNumericAddress) {
    SystemNetworkBackend net;
    auto err = net.connect("not-an-address", 22, 100);
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->message.find("not a numeric address"), std::string::npos);
}

TEST(SystemNetworkBackend, ResolvesLocalhost) {
    SystemNetworkBackend net;
    auto res = net.resolve("localhost", 2000);
    EXPECT_FALSE(res.error.has_value());
    EXPECT_FALSE(res.addresses.empty());
}

TEST(SystemNetworkBackend, TimedOutLookupIsNotStartedTwice) {
    SystemNetworkBackend net;
    auto first = net.resolve("localhost", 0);
    if (first.error) {
        EXPECT_NE(first.error->message.find("timed out after 0ms"), std::string::npos);
        EXPECT_LE(net.pending_lookups(), 1u);
    }

    // Picks up the earlier request if it is still running.
    auto second = net.resolve("localhost", 5000);
    EXPECT_FALSE(second.error.has_value());
    EXPECT_FALSE(second.addresses.empty());
    EXPECT_EQ(net.pending_lookups(), 0u);
}

TEST(SystemNetworkBackend, DestroyedWithLookupInFlight) {
    {
        SystemNetworkBackend net;
        net.resolve("localhost", 0);
    }
    SUCCEED();
}
