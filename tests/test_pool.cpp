#include <gtest/gtest.h>
#include <pool/pool.hpp>
#include "fake_ssh.hpp"
#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

static ClientConfig test_user() {
    ClientConfig config;
    config.user = "testuser";
    config.password = "foo";
    return config;
}

static PoolOptions options_for(std::shared_ptr<FakeDialer> dialer,
                               std::chrono::milliseconds timeout = 0ms) {
    PoolOptions options;
    options.dialer = dialer;
    options.timeout = timeout;
    return options;
}

static long long elapsed_ms(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

// ── Reuse and single-flight ─────────────────────────────────

TEST(Pool, OpenReusesConnection) {
    auto dialer = std::make_shared<FakeDialer>();
    Pool pool(options_for(dialer));

    auto s1 = pool.open("tcp", "addr", test_user());
    ASSERT_TRUE(s1.is_ok()) << s1.error;
    auto s2 = pool.open("tcp", "addr", test_user());
    ASSERT_TRUE(s2.is_ok()) << s2.error;

    EXPECT_EQ(dialer->calls.load(), 1);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(dialer->sessions->opened.load(), 2);
}

TEST(Pool, ReturnedSessionRunsCommands) {
    auto dialer = std::make_shared<FakeDialer>();
    Pool pool(options_for(dialer));

    auto session = pool.open("tcp", "addr", test_user());
    ASSERT_TRUE(session.is_ok()) << session.error;
    auto result = session.value->run("ls");
    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.stdout_data, "ls\n");
}

TEST(Pool, ConcurrentOpensDialOnce) {
    auto dialer = std::make_shared<FakeDialer>();
    dialer->dial_delay = 50ms;
    Pool pool(options_for(dialer));

    constexpr int kCallers = 16;
    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < kCallers; i++) {
        threads.emplace_back([&] {
            auto s = pool.open("tcp", "addr", test_user());
            if (s.is_ok() && s.value) ok++;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(ok.load(), kCallers);
    EXPECT_EQ(dialer->calls.load(), 1);
    EXPECT_EQ(dialer->max_in_flight.load(), 1);
    EXPECT_EQ(pool.size(), 1u);
}

TEST(Pool, DistinctAddressesDialSeparately) {
    auto dialer = std::make_shared<FakeDialer>();
    Pool pool(options_for(dialer));

    ASSERT_TRUE(pool.open("tcp", "addr0", test_user()).is_ok());
    ASSERT_TRUE(pool.open("tcp", "addr1", test_user()).is_ok());

    EXPECT_EQ(dialer->calls.load(), 2);
    EXPECT_EQ(pool.size(), 2u);
}

TEST(Pool, DistinctAddressesDialInParallel) {
    auto dialer = std::make_shared<FakeDialer>();
    // Each dial blocks until both have started; serialized dials would
    // never overlap.
    dialer->rendezvous = 2;
    Pool pool(options_for(dialer));

    std::thread a([&] { EXPECT_TRUE(pool.open("tcp", "addr0", test_user()).is_ok()); });
    std::thread b([&] { EXPECT_TRUE(pool.open("tcp", "addr1", test_user()).is_ok()); });
    a.join();
    b.join();

    EXPECT_EQ(dialer->calls.load(), 2);
    EXPECT_EQ(dialer->max_in_flight.load(), 2);
}

TEST(Pool, DistinctUsersDoNotShare) {
    auto dialer = std::make_shared<FakeDialer>();
    Pool pool(options_for(dialer));

    ClientConfig alice = test_user();
    alice.user = "alice";
    ClientConfig bob = test_user();
    bob.user = "bob";

    ASSERT_TRUE(pool.open("tcp", "addr", alice).is_ok());
    ASSERT_TRUE(pool.open("tcp", "addr", bob).is_ok());
    EXPECT_EQ(dialer->calls.load(), 2);
}

TEST(Pool, CustomKeyControlsSharing) {
    auto dialer = std::make_shared<FakeDialer>();
    PoolOptions options = options_for(dialer);
    options.key = [](const std::string& network, const std::string&, const ClientConfig& config) {
        return network + "|" + config.user;
    };
    Pool pool(options);

    ASSERT_TRUE(pool.open("tcp", "addr0", test_user()).is_ok());
    ASSERT_TRUE(pool.open("tcp", "addr1", test_user()).is_ok());

    EXPECT_EQ(dialer->calls.load(), 1);
    EXPECT_EQ(pool.key("tcp", "anything", test_user()), "tcp|testuser");
}

// ── Dial errors ─────────────────────────────────────────────

TEST(Pool, DialErrorIsReturnedAndNotCached) {
    auto dialer = std::make_shared<FakeDialer>();
    dialer->error = "test error";
    Pool pool(options_for(dialer));

    auto first = pool.open("tcp", "addr0", test_user());
    ASSERT_TRUE(first.is_err());
    EXPECT_EQ(first.error, "test error");
    EXPECT_EQ(pool.size(), 0u);

    auto second = pool.open("tcp", "addr0", test_user());
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(dialer->calls.load(), 2);
}

TEST(Pool, ConcurrentWaitersShareDialError) {
    auto dialer = std::make_shared<FakeDialer>();
    dialer->error = "test error";
    dialer->dial_delay = 100ms;
    Pool pool(options_for(dialer));

    constexpr int kCallers = 8;
    std::vector<std::string> errors(kCallers);
    std::vector<std::thread> threads;
    for (int i = 0; i < kCallers; i++) {
        threads.emplace_back([&, i] {
            auto s = pool.open("tcp", "addr", test_user());
            errors[i] = s.is_err() ? s.error : "";
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(dialer->calls.load(), 1);
    for (const auto& e : errors) {
        EXPECT_EQ(e, "test error");
    }
    EXPECT_EQ(pool.size(), 0u);
}

TEST(Pool, ThrowingDialerBecomesDialError) {
    auto dialer = std::make_shared<FakeDialer>();
    dialer->throw_error = true;
    Pool pool(options_for(dialer));

    auto s = pool.open("tcp", "addr", test_user());
    ASSERT_TRUE(s.is_err());
    EXPECT_EQ(s.error, "dialer exploded");
    EXPECT_EQ(pool.size(), 0u);
}

// Throws something that is not a std::exception.
class ThrowingIntDialer : public Dialer {
public:
    Result<ClientConn> dial(const std::string&, const std::string&,
                            const ClientConfig&, const Deadline&) override {
        calls++;
        throw 42;
    }

    std::atomic<int> calls{0};
};

TEST(Pool, ThrowingNonStdDialerBecomesDialError) {
    auto dialer = std::make_shared<ThrowingIntDialer>();
    PoolOptions options;
    options.dialer = dialer;
    Pool pool(options);

    Result<std::unique_ptr<Session>> s = Result<std::unique_ptr<Session>>::Err("");
    EXPECT_NO_THROW(s = pool.open("tcp", "addr", test_user()));
    ASSERT_TRUE(s.is_err());
    EXPECT_EQ(s.error, "dial failed: unknown exception");
    EXPECT_EQ(pool.size(), 0u);

    // Not cached: the next open dials again
    EXPECT_NO_THROW(s = pool.open("tcp", "addr", test_user()));
    EXPECT_EQ(dialer->calls.load(), 2);
    EXPECT_EQ(pool.size(), 0u);
}

TEST(Pool, SecondDialErrorAfterConnectionDies) {
    auto dialer = std::make_shared<FakeDialer>();
    dialer->error = "test error";
    dialer->fail_after = 1;
    Pool pool(options_for(dialer));

    ASSERT_TRUE(pool.open("tcp", "addr", test_user()).is_ok());
    dialer->transport(0)->close();

    auto s = pool.open("tcp", "addr", test_user());
    ASSERT_TRUE(s.is_err());
    EXPECT_EQ(s.error, "test error");
    EXPECT_EQ(dialer->calls.load(), 2);
}

// ── Session failures and eviction ───────────────────────────

TEST(Pool, RetriesOnFreshConnectionAfterSessionFailure) {
    auto dialer = std::make_shared<FakeDialer>();
    dialer->failing_dials = 1;
    Pool pool(options_for(dialer));

    auto s = pool.open("tcp", "addr", test_user());
    ASSERT_TRUE(s.is_ok()) << s.error;

    EXPECT_EQ(dialer->calls.load(), 2);
    EXPECT_EQ(dialer->transport(0)->close_calls.load(), 1);
    EXPECT_TRUE(dialer->transport(0)->closed());
    EXPECT_FALSE(dialer->transport(1)->closed());
    EXPECT_EQ(pool.size(), 1u);
}

TEST(Pool, EvictedEntryIsNotResurrected) {
    auto dialer = std::make_shared<FakeDialer>();
    Pool pool(options_for(dialer));
    const std::string key = pool.key("tcp", "addr", test_user());

    ASSERT_TRUE(pool.open("tcp", "addr", test_user()).is_ok());
    std::shared_ptr<PooledConn> held = pool.lookup(key);
    ASSERT_NE(held, nullptr);

    // The server drops the connection; the next open evicts and redials
    dialer->transport(0)->close();
    ASSERT_TRUE(pool.open("tcp", "addr", test_user()).is_ok());

    EXPECT_EQ(dialer->calls.load(), 2);
    EXPECT_NE(pool.lookup(key), held);
    EXPECT_NE(pool.lookup(key), nullptr);

    // The stale reference is still safe to inspect
    EXPECT_TRUE(held->ready());
    EXPECT_FALSE(held->failed());
    EXPECT_TRUE(held->closed());
    EXPECT_NE(held->client(), nullptr);
    EXPECT_FALSE(held->close());

    // And a later open still uses the replacement, not the stale entry
    ASSERT_TRUE(pool.open("tcp", "addr", test_user()).is_ok());
    EXPECT_EQ(dialer->calls.load(), 2);
}

// ── Timeouts ────────────────────────────────────────────────

TEST(Pool, SessionTimeout) {
    auto dialer = std::make_shared<FakeDialer>();
    dialer->client_behavior.session_delay = 5s;
    Pool pool(options_for(dialer, 100ms));

    auto start = Clock::now();
    auto s = pool.open("tcp", "addr", test_user());
    ASSERT_TRUE(s.is_err());
    EXPECT_NE(s.error.find("timed out"), std::string::npos) << s.error;
    EXPECT_LT(elapsed_ms(start), 1000);
}

TEST(Pool, SessionTimeoutSuccess) {
    auto dialer = std::make_shared<FakeDialer>();
    Pool pool(options_for(dialer, 100ms));

    auto s = pool.open("tcp", "addr", test_user());
    ASSERT_TRUE(s.is_ok()) << s.error;
    EXPECT_EQ(dialer->calls.load(), 1);
}

TEST(Pool, DialReceivesOverallDeadline) {
    auto bounded = std::make_shared<FakeDialer>();
    Pool with_timeout(options_for(bounded, 1000ms));
    ASSERT_TRUE(with_timeout.open("tcp", "addr", test_user()).is_ok());
    EXPECT_TRUE(bounded->saw_deadline.load());

    auto unbounded = std::make_shared<FakeDialer>();
    Pool without_timeout(options_for(unbounded));
    ASSERT_TRUE(without_timeout.open("tcp", "addr", test_user()).is_ok());
    EXPECT_FALSE(unbounded->saw_deadline.load());
    ASSERT_EQ(unbounded->client(0)->deadlines().size(), 1u);
    EXPECT_FALSE(unbounded->client(0)->deadlines()[0].has_value());
}

TEST(Pool, FirstAttemptGetsHalfTheBudget) {
    auto dialer = std::make_shared<FakeDialer>();
    dialer->failing_dials = 1;
    Pool pool(options_for(dialer, 1000ms));

    auto start = Clock::now();
    ASSERT_TRUE(pool.open("tcp", "addr", test_user()).is_ok());

    auto first = dialer->client(0)->deadlines();
    auto second = dialer->client(1)->deadlines();
    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    ASSERT_TRUE(first[0].has_value());
    ASSERT_TRUE(second[0].has_value());

    auto first_budget = std::chrono::duration_cast<std::chrono::milliseconds>(*first[0] - start);
    auto second_budget = std::chrono::duration_cast<std::chrono::milliseconds>(*second[0] - start);
    EXPECT_GE(first_budget.count(), 400);
    EXPECT_LE(first_budget.count(), 550);
    EXPECT_GE(second_budget.count(), 900);
    EXPECT_LE(second_budget.count(), 1050);
}

TEST(Pool, LateSessionIsDiscarded) {
    auto dialer = std::make_shared<FakeDialer>();
    dialer->client_behavior.session_delay = 80ms;
    dialer->client_behavior.honor_deadline = false;
    Pool pool(options_for(dialer, 100ms));

    auto start = Clock::now();
    auto s = pool.open("tcp", "addr", test_user());
    ASSERT_TRUE(s.is_err());
    EXPECT_NE(s.error.find("timed out"), std::string::npos) << s.error;
    EXPECT_LT(elapsed_ms(start), 1000);

    // Every session that arrived too late was closed, none leaked
    EXPECT_GE(dialer->sessions->opened.load(), 1);
    EXPECT_EQ(dialer->sessions->opened.load(), dialer->sessions->closed.load());
    EXPECT_EQ(pool.size(), 0u);
}

TEST(Pool, WaiterGivesUpOnSlowDial) {
    auto dialer = std::make_shared<FakeDialer>();
    dialer->dial_delay = 500ms;
    Pool pool(options_for(dialer, 100ms));

    std::string dialer_error;
    std::thread first([&] {
        auto s = pool.open("tcp", "addr", test_user());
        dialer_error = s.is_err() ? s.error : "";
    });
    std::this_thread::sleep_for(20ms);

    auto start = Clock::now();
    auto waiter = pool.open("tcp", "addr", test_user());
    ASSERT_TRUE(waiter.is_err());
    EXPECT_NE(waiter.error.find("waiting for dial"), std::string::npos) << waiter.error;
    EXPECT_LT(elapsed_ms(start), 400);

    first.join();
    EXPECT_NE(dialer_error.find("timed out"), std::string::npos) << dialer_error;
    EXPECT_EQ(dialer->calls.load(), 1);

    // The slow dial succeeded; its connection stays pooled
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_FALSE(dialer->transport(0)->closed());
}

// ── Configuration and default pool ──────────────────────────

TEST(Pool, NegativeTimeoutMeansUnbounded) {
    auto dialer = std::make_shared<FakeDialer>();
    Pool pool(options_for(dialer, std::chrono::milliseconds(-5)));
    EXPECT_EQ(pool.timeout().count(), 0);
}

TEST(Pool, MakePoolOptionsFromSettings) {
    PoolSettings settings;
    settings.timeout_ms = 250;
    settings.connect_timeout_secs = 5;

    PoolOptions options = make_pool_options(settings);
    EXPECT_EQ(options.timeout.count(), 250);
    EXPECT_NE(options.dialer, nullptr);
    EXPECT_FALSE(static_cast<bool>(options.key));
}

TEST(Pool, DefaultPoolIsShared) {
    Pool& a = default_pool();
    Pool& b = default_pool();
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(a.timeout().count(), 0);
}
