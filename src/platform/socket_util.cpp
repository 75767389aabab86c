#include "socket_util.hpp"

#include <sys/socket.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

void set_blocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags & ~O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

socket_t connect_with_timeout(const struct sockaddr* addr, socklen_t addr_len,
                              int timeout_ms, int& error_out) {
    error_out = 0;
    socket_t sock = socket(addr->sa_family, SOCK_STREAM, 0);
    if (sock < 0) {
        error_out = errno;
        return SSHGATE_INVALID_SOCKET;
    }
    set_nonblocking(sock);

    int ret = connect(sock, addr, addr_len);
    if (ret < 0 && errno != EINPROGRESS) {
        error_out = errno;
        close_socket(sock);
        return SSHGATE_INVALID_SOCKET;
    }

    // Wait for non-blocking connect to complete
    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            error_out = ETIMEDOUT;
            close_socket(sock);
            return SSHGATE_INVALID_SOCKET;
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        if (sock_err != 0) {
            error_out = sock_err;
            close_socket(sock);
            return SSHGATE_INVALID_SOCKET;
        }
    }
    return sock;
}

void close_socket(socket_t sock) {
    close(sock);
}

} // namespace platform
