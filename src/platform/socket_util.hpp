#pragma once

// Socket helpers shared by the TCP probe and the libssh2 method source.

#include <poll.h>
#include <sys/socket.h>

using socket_t = int;
#define SSHGATE_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Set a socket back to blocking mode.
void set_blocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Non-blocking connect bounded by timeout_ms. Returns the connected
// (non-blocking) socket, or SSHGATE_INVALID_SOCKET with the errno value in
// error_out (ETIMEDOUT when the deadline passes).
socket_t connect_with_timeout(const struct sockaddr* addr, socklen_t addr_len,
                              int timeout_ms, int& error_out);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
