#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <core/types.hpp>
#include <ssh/client.hpp>

// One pooled transport + client pairing, or the error its dial produced.
//
// The outcome is written once by the dialing caller via complete(), which
// also fires the ready signal. Any number of threads may wait_until() on it and
// all observe the same outcome; waiting after completion returns at once.
// After completion the entry is read-only apart from the close-once flag.
class PooledConn {
public:
    PooledConn();

    PooledConn(const PooledConn&) = delete;
    PooledConn& operator=(const PooledConn&) = delete;

    // Record the dial outcome and wake every waiter. Call exactly once.
    void complete(Result<ClientConn> outcome);

    // Block until the dial completes or deadline passes; an empty deadline
    // waits indefinitely. Returns false on timeout.
    bool wait_until(const Deadline& deadline) const;
    bool ready() const;

    bool failed() const { return !dial_error_.empty(); }
    const std::string& dial_error() const { return dial_error_; }
    const std::shared_ptr<Client>& client() const { return conn_.client; }
    const std::shared_ptr<Transport>& transport() const { return conn_.transport; }

    // Close the transport. Only the first call has any effect; returns true
    // for that call.
    bool close();
    bool closed() const { return closed_; }

private:
    ClientConn conn_;
    std::string dial_error_;
    std::promise<void> done_;
    std::shared_future<void> ready_;
    std::atomic<bool> closed_{false};
};
