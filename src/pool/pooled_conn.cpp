#include "pooled_conn.hpp"

PooledConn::PooledConn()
    : ready_(done_.get_future().share()) {
}

void PooledConn::complete(Result<ClientConn> outcome) {
    if (outcome.is_ok() && outcome.value.client) {
        conn_ = std::move(outcome.value);
    } else if (outcome.is_ok()) {
        conn_.transport = std::move(outcome.value.transport);
        dial_error_ = "dial returned no client";
    } else {
        dial_error_ = outcome.error.empty() ? "dial failed" : outcome.error;
    }
    done_.set_value();
}

bool PooledConn::wait_until(const Deadline& deadline) const {
    if (!deadline) {
        ready_.wait();
        return true;
    }
    return ready_.wait_until(*deadline) == std::future_status::ready;
}

bool PooledConn::ready() const {
    return ready_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

bool PooledConn::close() {
    if (closed_.exchange(true)) return false;
    if (conn_.transport) conn_.transport->close();
    return true;
}
