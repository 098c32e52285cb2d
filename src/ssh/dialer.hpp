#pragma once

#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "client.hpp"

// Produces a transport and an authenticated client for one
// (network, address, credentials) triple.
class Dialer {
public:
    virtual ~Dialer() = default;

    virtual Result<ClientConn> dial(const std::string& network,
                                    const std::string& address,
                                    const ClientConfig& config,
                                    const Deadline& deadline) = 0;
};

// Opens the raw network connection.
using NetDial = std::function<Result<std::shared_ptr<Transport>>(
    const std::string& network, const std::string& address, const Deadline& deadline)>;

// Builds an SSH client over an open transport.
using ClientFactory = std::function<Result<std::shared_ptr<Client>>(
    std::shared_ptr<Transport> transport, const ClientConfig& config, const Deadline& deadline)>;

// Network dial followed by the SSH handshake. Either step can be replaced;
// by default TCP and libssh2 are used.
class DefaultDialer : public Dialer {
public:
    explicit DefaultDialer(int connect_timeout_secs = CONNECT_TIMEOUT_SECS);
    DefaultDialer(NetDial net_dial, ClientFactory client_factory);

    Result<ClientConn> dial(const std::string& network,
                            const std::string& address,
                            const ClientConfig& config,
                            const Deadline& deadline) override;

private:
    NetDial net_dial_;
    ClientFactory client_factory_;
};
