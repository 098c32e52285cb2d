#include "pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <exception>

Pool::Pool() : Pool(PoolOptions{}) {}

Pool::Pool(PoolOptions options)
    : dialer_(std::move(options.dialer)),
      key_(std::move(options.key)),
      timeout_(options.timeout) {
    if (!dialer_) dialer_ = std::make_shared<DefaultDialer>();
    if (!key_) key_ = addr_user_key;
    if (timeout_.count() < 0) timeout_ = std::chrono::milliseconds(0);
}

std::string Pool::key(const std::string& network,
                      const std::string& address,
                      const ClientConfig& config) const {
    return key_(network, address, config);
}

std::shared_ptr<PooledConn> Pool::lookup(const std::string& k) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = tab_.find(k);
    return it == tab_.end() ? nullptr : it->second;
}

size_t Pool::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return tab_.size();
}

Result<std::unique_ptr<Session>> Pool::open(const std::string& network,
                                            const std::string& address,
                                            const ClientConfig& config) {
    using R = Result<std::unique_ptr<Session>>;

    Deadline deadline;
    if (timeout_.count() > 0) deadline = Clock::now() + timeout_;

    const std::string k = key(network, address, config);
    const std::string timed_out = fmt::format("sshpool: open {} {}: timed out after {}ms",
                                              network, address, timeout_.count());
    std::string last_error;
    bool first_attempt = true;

    while (true) {
        auto got = get_conn(k, network, address, config, deadline);
        if (got.is_err()) return R::Err(got.error);
        std::shared_ptr<PooledConn> c = got.value;

        if (c->failed()) {
            remove_conn(k, c);
            return R::Err(c->dial_error());
        }

        // The dial itself may have used up the budget; the connection is
        // healthy, so leave it pooled for the next caller
        if (deadline_passed(deadline)) {
            return R::Err(last_error.empty() ? timed_out : last_error);
        }

        // First attempt gets half the remaining time, keeping the rest for
        // a redial and second attempt
        Deadline attempt = deadline;
        if (deadline && first_attempt) {
            attempt = Clock::now() + (*deadline - Clock::now()) / 2;
        }
        first_attempt = false;

        auto session = c->client()->new_session(attempt);
        if (session.is_ok() && session.value) {
            if (!deadline_passed(attempt)) {
                return R::Ok(std::move(session.value));
            }
            // Too late: the caller has already given up on this attempt
            session.value->close();
            last_error = "sshpool: session open timed out";
        } else if (session.is_ok()) {
            last_error = "sshpool: client returned no session";
        } else {
            last_error = session.error;
        }

        pool_log(fmt::format("sshpool: failed to establish new session on {} {}: {}",
                             network, address, last_error));
        remove_conn(k, c);
        c->close();

        if (deadline_passed(deadline)) {
            return R::Err(last_error);
        }
    }
}

Result<std::shared_ptr<PooledConn>> Pool::get_conn(const std::string& k,
                                                   const std::string& network,
                                                   const std::string& address,
                                                   const ClientConfig& config,
                                                   const Deadline& deadline) {
    using R = Result<std::shared_ptr<PooledConn>>;

    std::unique_lock<std::mutex> lock(mu_);
    auto it = tab_.find(k);
    if (it != tab_.end()) {
        std::shared_ptr<PooledConn> c = it->second;
        lock.unlock();
        if (!c->wait_until(deadline)) {
            return R::Err(fmt::format("sshpool: open {} {}: timed out waiting for dial",
                                      network, address));
        }
        return R::Ok(c);
    }

    auto c = std::make_shared<PooledConn>();
    tab_.emplace(k, c);
    lock.unlock();

    pool_log(fmt::format("sshpool: dialing {} {} as {}", network, address, config.user));

    Result<ClientConn> outcome = Result<ClientConn>::Err("dial failed");
    try {
        outcome = dialer_->dial(network, address, config, deadline);
    } catch (const std::exception& e) {
        outcome = Result<ClientConn>::Err(e.what());
    } catch (...) {
        outcome = Result<ClientConn>::Err("dial failed: unknown exception");
    }

    if (outcome.is_err()) {
        pool_log(fmt::format("sshpool: dial {} {} failed: {}", network, address, outcome.error));
    }
    c->complete(std::move(outcome));
    return R::Ok(c);
}

void Pool::remove_conn(const std::string& k, const std::shared_ptr<PooledConn>& c) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = tab_.find(k);
    if (it != tab_.end() && it->second == c) {
        tab_.erase(it);
    }
}

PoolOptions make_pool_options(const PoolSettings& settings) {
    PoolOptions options;
    options.dialer = std::make_shared<DefaultDialer>(settings.connect_timeout_secs);
    options.timeout = std::chrono::milliseconds(settings.timeout_ms);
    return options;
}

Pool& default_pool() {
    static Pool pool;
    return pool;
}

Result<std::unique_ptr<Session>> open_session(const std::string& network,
                                              const std::string& address,
                                              const ClientConfig& config) {
    return default_pool().open(network, address, config);
}
