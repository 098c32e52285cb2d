#pragma once

// Cross-platform socket utilities.

#include <string>
#include <core/types.hpp>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define SSHPOOL_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define SSHPOOL_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc. A negative timeout waits forever.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Shut down both directions. Pending and future I/O on the socket fails,
// but the descriptor stays allocated until close_socket().
void shutdown_socket(socket_t sock);

// Close a socket.
void close_socket(socket_t sock);

struct HostPort {
    std::string host;
    std::string port;
};

// Split "host:port", "[v6addr]:port" or a bare host. A missing port
// becomes default_port.
Result<HostPort> split_host_port(const std::string& address, int default_port);

} // namespace platform
