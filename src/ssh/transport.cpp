#include "transport.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>
#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <sys/types.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <netdb.h>
#  include <unistd.h>
#endif
#include <cerrno>
#include <cstring>

TcpTransport::TcpTransport(socket_t sock, std::string remote)
    : sock_(sock), remote_(std::move(remote)) {
}

TcpTransport::~TcpTransport() {
    close();
    if (sock_ != SSHPOOL_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SSHPOOL_INVALID_SOCKET;
    }
}

void TcpTransport::close() {
    if (closed_.exchange(true)) return;
    if (sock_ != SSHPOOL_INVALID_SOCKET) {
        platform::shutdown_socket(sock_);
    }
}

// Non-blocking connect of one resolved address. Returns "" on success.
static std::string connect_one(socket_t sock, const struct addrinfo* ai, int timeout_ms) {
    int ret = connect(sock, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen));
    if (ret == 0) return "";
    if (errno != EINPROGRESS) {
        return std::strerror(errno);
    }

    int revents = platform::poll_socket(sock, POLLOUT, timeout_ms);
    if (revents == 0) {
        return "connection timed out";
    }

    int sock_err = 0;
    socklen_t err_len = sizeof(sock_err);
    getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
    if (sock_err != 0) {
        return std::strerror(sock_err);
    }
    return "";
}

Result<std::shared_ptr<Transport>> dial_tcp(const std::string& network,
                                            const std::string& address,
                                            const Deadline& deadline,
                                            int connect_timeout_secs) {
    using R = Result<std::shared_ptr<Transport>>;

    int family;
    if (network == "tcp") {
        family = AF_UNSPEC;
    } else if (network == "tcp4") {
        family = AF_INET;
    } else if (network == "tcp6") {
        family = AF_INET6;
    } else {
        return R::Err(fmt::format("dial {} {}: unsupported network", network, address));
    }

    auto hp = platform::split_host_port(address, SSH_DEFAULT_PORT);
    if (hp.is_err()) {
        return R::Err(fmt::format("dial {} {}: {}", network, address, hp.error));
    }

    platform::init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = family;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(hp.value.host.c_str(), hp.value.port.c_str(), &hints, &res);
    if (gai != 0) {
        return R::Err(fmt::format("dial {} {}: failed to resolve host: {}",
                                  network, address, gai_strerror(gai)));
    }
    std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> addrs(res, &freeaddrinfo);

    std::string last_error = "no addresses";
    for (const struct addrinfo* ai = addrs.get(); ai != nullptr; ai = ai->ai_next) {
        int timeout_ms = -1;
        if (deadline) {
            timeout_ms = remaining_ms(deadline);
        } else if (connect_timeout_secs > 0) {
            timeout_ms = connect_timeout_secs * 1000;
        }
        if (deadline && timeout_ms == 0) {
            last_error = "connection timed out";
            break;
        }

        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == SSHPOOL_INVALID_SOCKET) {
            last_error = fmt::format("failed to create socket: {}", std::strerror(errno));
            continue;
        }

        // Non-blocking for the connect poll and for libssh2
        platform::set_nonblocking(sock);

        std::string err = connect_one(sock, ai, timeout_ms);
        if (!err.empty()) {
            platform::close_socket(sock);
            last_error = err;
            continue;
        }

        int nodelay = 1;
        setsockopt(sock, IPPROTO_TCP, TCP_NODELAY,
                   reinterpret_cast<const char*>(&nodelay), sizeof(nodelay));

        return R::Ok(std::make_shared<TcpTransport>(sock, address));
    }

    return R::Err(fmt::format("dial {} {}: {}", network, address, last_error));
}
