#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <core/types.hpp>
#include <core/config.hpp>
#include <ssh/client.hpp>
#include <ssh/dialer.hpp>
#include "key.hpp"
#include "pooled_conn.hpp"

struct PoolOptions {
    // Shared by every caller of the pool; must be safe to call concurrently.
    // nullptr uses DefaultDialer.
    std::shared_ptr<Dialer> dialer;
    // nullptr uses addr_user_key.
    KeyFunc key;
    // Overall bound on one open() call. Zero means no bound.
    std::chrono::milliseconds timeout{0};
};

// Pool: shares SSH connections between concurrent callers.
//
// Connections are keyed by identity (see KeyFunc). The first caller for a
// key dials; concurrent callers for the same key wait for that dial and see
// its outcome. A connection that fails to open a session is evicted and
// closed, and the caller dials again. Connections are never expired in the
// background.
class Pool {
public:
    Pool();
    explicit Pool(PoolOptions options);

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    // Open a new session on address, reusing a pooled connection if one
    // exists. A dial error is returned as-is and is not cached. Session
    // open failures evict the connection and retry until the pool timeout,
    // if any, runs out; the last error is returned then.
    Result<std::unique_ptr<Session>> open(const std::string& network,
                                          const std::string& address,
                                          const ClientConfig& config);

    std::string key(const std::string& network,
                    const std::string& address,
                    const ClientConfig& config) const;

    // Current entry for key, or nullptr.
    std::shared_ptr<PooledConn> lookup(const std::string& key) const;

    size_t size() const;
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::shared_ptr<Dialer> dialer_;
    KeyFunc key_;
    std::chrono::milliseconds timeout_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<PooledConn>> tab_;

    // Existing entry for k once its dial has finished, or a new entry after
    // dialing it. Fails only if deadline passes while waiting on another
    // caller's dial.
    Result<std::shared_ptr<PooledConn>> get_conn(const std::string& k,
                                                 const std::string& network,
                                                 const std::string& address,
                                                 const ClientConfig& config,
                                                 const Deadline& deadline);

    // Remove c from the table, but only if it is still the entry for k.
    void remove_conn(const std::string& k, const std::shared_ptr<PooledConn>& c);
};

// Options for a pool as configured: timeout and a DefaultDialer using the
// configured connect timeout.
PoolOptions make_pool_options(const PoolSettings& settings);

// Process-wide pool with default options.
Pool& default_pool();

// Open a session using default_pool().
Result<std::unique_ptr<Session>> open_session(const std::string& network,
                                              const std::string& address,
                                              const ClientConfig& config);
