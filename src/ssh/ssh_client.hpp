#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "client.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Owns one LIBSSH2_SESSION and keeps its transport alive. Shared by the
// client and every channel opened on it, since a channel must not outlive
// its session. libssh2 sessions are not thread-safe: every libssh2 call goes
// through io_mutex.
struct SSHHandle {
    SSHHandle(LIBSSH2_SESSION* session, std::shared_ptr<Transport> transport);
    ~SSHHandle();

    SSHHandle(const SSHHandle&) = delete;
    SSHHandle& operator=(const SSHHandle&) = delete;

    // Block until the socket is ready in whichever direction libssh2 last
    // stalled on. Returns false once deadline has passed.
    bool wait(const Deadline& deadline);

    LIBSSH2_SESSION* session;
    std::shared_ptr<Transport> transport;
    std::mutex io_mutex;
    // Serializes channel opens; libssh2 keeps one open state per session
    std::timed_mutex open_mutex;
};

class SSHSession : public Session {
public:
    SSHSession(std::shared_ptr<SSHHandle> handle, LIBSSH2_CHANNEL* channel);
    ~SSHSession() override;

    SSHSession(const SSHSession&) = delete;
    SSHSession& operator=(const SSHSession&) = delete;

    SSHResult run(const std::string& command, int timeout_secs = 0) override;
    void close() override;

private:
    std::shared_ptr<SSHHandle> handle_;
    LIBSSH2_CHANNEL* channel_;
    bool used_ = false;
};

class SSHClient : public Client {
public:
    explicit SSHClient(std::shared_ptr<SSHHandle> handle);

    Result<std::unique_ptr<Session>> new_session(const Deadline& deadline) override;

private:
    std::shared_ptr<SSHHandle> handle_;
};

// Run the SSH handshake and authentication over an already connected
// transport. Host key checking and auth methods come from config.
Result<std::shared_ptr<Client>> ssh_handshake(std::shared_ptr<Transport> transport,
                                              const ClientConfig& config,
                                              const Deadline& deadline);
