#include "socket_util.hpp"

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void shutdown_socket(socket_t sock) {
#ifdef _WIN32
    shutdown(sock, SD_BOTH);
#else
    shutdown(sock, SHUT_RDWR);
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

Result<HostPort> split_host_port(const std::string& address, int default_port) {
    if (address.empty()) {
        return Result<HostPort>::Err("empty address");
    }

    HostPort hp;
    std::string rest;

    if (address[0] == '[') {
        auto close = address.find(']');
        if (close == std::string::npos) {
            return Result<HostPort>::Err("missing ']' in address: " + address);
        }
        hp.host = address.substr(1, close - 1);
        rest = address.substr(close + 1);
        if (!rest.empty() && rest[0] != ':') {
            return Result<HostPort>::Err("unexpected text after ']' in address: " + address);
        }
    } else {
        auto colon = address.rfind(':');
        if (colon != std::string::npos && address.find(':') != colon) {
            // Several colons without brackets: a bare IPv6 literal
            hp.host = address;
        } else if (colon != std::string::npos) {
            hp.host = address.substr(0, colon);
            rest = address.substr(colon);
        } else {
            hp.host = address;
        }
    }

    if (hp.host.empty()) {
        return Result<HostPort>::Err("missing host in address: " + address);
    }

    if (rest.empty()) {
        hp.port = std::to_string(default_port);
        return Result<HostPort>::Ok(hp);
    }

    hp.port = rest.substr(1);
    if (hp.port.empty()) {
        return Result<HostPort>::Err("missing port in address: " + address);
    }
    for (char c : hp.port) {
        if (c < '0' || c > '9') {
            return Result<HostPort>::Err("invalid port in address: " + address);
        }
    }
    return Result<HostPort>::Ok(hp);
}

} // namespace platform
