#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include "transport.hpp"

// A single command-execution channel. Owned exclusively by the caller that
// opened it.
class Session {
public:
    virtual ~Session() = default;

    // Execute command and collect its output and exit status.
    // timeout_secs == 0 uses SSH_CMD_TIMEOUT_SECS.
    virtual SSHResult run(const std::string& command, int timeout_secs = 0) = 0;

    virtual void close() = 0;
};

// An authenticated SSH client on top of a Transport.
class Client {
public:
    virtual ~Client() = default;

    // Open a new session channel, giving up once deadline passes.
    virtual Result<std::unique_ptr<Session>> new_session(const Deadline& deadline) = 0;
};

// What a dial produces: the raw connection and the client built on it.
struct ClientConn {
    std::shared_ptr<Transport> transport;
    std::shared_ptr<Client> client;
};
