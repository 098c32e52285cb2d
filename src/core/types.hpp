#pragma once

#include <string>
#include <optional>
#include <functional>
#include <chrono>
#include <utility>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// ── Deadlines ───────────────────────────────────────────────
// An empty Deadline means "no deadline".
using Clock = std::chrono::steady_clock;
using Deadline = std::optional<Clock::time_point>;

// Milliseconds left before the deadline (0 if passed, -1 if none).
inline int remaining_ms(const Deadline& deadline) {
    if (!deadline) return -1;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

inline bool deadline_passed(const Deadline& deadline) {
    return deadline && Clock::now() >= *deadline;
}

// Accepts or rejects the server host key. Receives the dialed address and the
// SHA-256 fingerprint as lowercase hex.
using HostKeyCheck = std::function<bool(const std::string& address,
                                        const std::string& fingerprint)>;

// Credentials for one SSH identity. Read-only to the pool.
struct ClientConfig {
    std::string user;
    std::string password;
    std::optional<std::string> identity_file;   // private key path
    std::optional<std::string> passphrase;      // for identity_file
    HostKeyCheck host_key_check;                // nullptr accepts any key
};
