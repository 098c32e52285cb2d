#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// Raw network connection an SSH client rides on.
class Transport {
public:
    virtual ~Transport() = default;

    // Idempotent. Any I/O still pending on the connection fails afterwards.
    virtual void close() = 0;
    virtual bool closed() const = 0;

    // Underlying socket, or SSHPOOL_INVALID_SOCKET for non-socket transports.
    virtual socket_t native_handle() const = 0;

    virtual std::string remote_address() const = 0;
};

// TCP socket transport. close() shuts the socket down; the descriptor itself
// is released in the destructor so it cannot be reused while libssh2 may
// still reference it.
class TcpTransport : public Transport {
public:
    TcpTransport(socket_t sock, std::string remote);
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    void close() override;
    bool closed() const override { return closed_; }
    socket_t native_handle() const override { return sock_; }
    std::string remote_address() const override { return remote_; }

private:
    socket_t sock_;
    std::string remote_;
    std::atomic<bool> closed_{false};
};

// Connect to address over network ("tcp", "tcp4" or "tcp6"). The connect is
// bounded by deadline, or by connect_timeout_secs when there is none.
Result<std::shared_ptr<Transport>> dial_tcp(const std::string& network,
                                            const std::string& address,
                                            const Deadline& deadline,
                                            int connect_timeout_secs);
