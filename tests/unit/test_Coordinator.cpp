#include <gtest/gtest.h>
#include "lock/Coordinator.hpp"
#include "lock/MemoryStore.hpp"
#include "lock/errors.hpp"
#include "ManualClock.hpp"
#include "StoreDoubles.hpp"

#include <atomic>
#include <barrier>
#include <thread>
#include <vector>

using namespace lw::lock;
using namespace lw::test;
using namespace std::chrono_literals;
using lw::lock::model::ResourceKind;

class CoordinatorTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryStore> store = std::make_shared<MemoryStore>();
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<Coordinator> coordinator = std::make_shared<Coordinator>(store, clock);

    static AcquireRequest req(const std::string& id, const std::string& user, const std::string& session,
                              std::optional<std::chrono::seconds> ttl = std::nullopt,
                              const ResourceKind kind = ResourceKind::CustomerOrder) {
        return {.resource_kind = kind, .resource_id = id, .holder_user_id = user,
                .holder_session_id = session, .ttl = ttl};
    }
};

TEST_F(CoordinatorTest, EditSessionLifecycle) {
    const auto t0 = clock->start();

    const auto first = coordinator->acquire(req("ORD-1", "alice", "s1", 300s));
    ASSERT_TRUE(std::holds_alternative<LockGrant>(first));
    const auto& grant = std::get<LockGrant>(first);
    EXPECT_FALSE(grant.renewed);
    EXPECT_EQ(grant.lock.holder_user_id, "alice");
    EXPECT_EQ(grant.lock.acquired_at, t0);
    EXPECT_EQ(grant.lock.expires_at, t0 + 300s);

    clock->advance(1min);
    const auto blocked = coordinator->acquire(req("ORD-1", "bob", "s2"));
    ASSERT_TRUE(std::holds_alternative<Conflict>(blocked));
    EXPECT_EQ(std::get<Conflict>(blocked).holder_user_id, "alice");
    EXPECT_EQ(std::get<Conflict>(blocked).expires_at, t0 + 300s);

    clock->set(t0 + 4min);
    const auto renewed = coordinator->renew("ORD-1", "s1", 300s);
    ASSERT_TRUE(std::holds_alternative<LockGrant>(renewed));
    EXPECT_EQ(std::get<LockGrant>(renewed).lock.expires_at, t0 + 9min);

    clock->set(t0 + 5min);
    EXPECT_TRUE(std::holds_alternative<Released>(coordinator->release("ORD-1", "s1")));
    EXPECT_TRUE(std::holds_alternative<Unlocked>(coordinator->inspect("ORD-1")));

    clock->advance(1s);
    const auto second = coordinator->acquire(req("ORD-1", "bob", "s2"));
    ASSERT_TRUE(std::holds_alternative<LockGrant>(second));
    EXPECT_EQ(std::get<LockGrant>(second).lock.holder_user_id, "bob");
}

TEST_F(CoordinatorTest, DefaultTtlApplied) {
    const auto out = coordinator->acquire(req("ORD-1", "alice", "s1"));
    EXPECT_EQ(std::get<LockGrant>(out).lock.expires_at, clock->start() + coordinator->options().default_ttl);
}

TEST_F(CoordinatorTest, LockStillLiveAtExactExpiry) {
    coordinator->acquire(req("ORD-1", "alice", "s1", 300s));

    clock->advance(300s);
    EXPECT_TRUE(std::holds_alternative<Conflict>(coordinator->acquire(req("ORD-1", "bob", "s2"))));
    EXPECT_TRUE(std::holds_alternative<LockedBy>(coordinator->inspect("ORD-1")));

    clock->advance(1us);
    const auto out = coordinator->acquire(req("ORD-1", "bob", "s2"));
    ASSERT_TRUE(std::holds_alternative<LockGrant>(out));
    EXPECT_FALSE(std::get<LockGrant>(out).renewed);
    EXPECT_EQ(std::get<LockGrant>(out).lock.holder_session_id, "s2");
}

TEST_F(CoordinatorTest, ReacquireBySameSessionRenews) {
    const auto t0 = clock->start();
    const auto first = std::get<LockGrant>(coordinator->acquire(req("ORD-1", "alice", "s1", 300s)));

    clock->advance(10s);
    const auto again = coordinator->acquire(req("ORD-1", "alice", "s1", 300s));
    ASSERT_TRUE(std::holds_alternative<LockGrant>(again));
    const auto& grant = std::get<LockGrant>(again);
    EXPECT_TRUE(grant.renewed);
    EXPECT_EQ(grant.lock.id, first.lock.id);
    EXPECT_EQ(grant.lock.acquired_at, t0);
    EXPECT_EQ(grant.lock.expires_at, t0 + 310s);
    EXPECT_EQ(store->size(), 1u);
}

TEST_F(CoordinatorTest, SameUserOtherSessionConflicts) {
    coordinator->acquire(req("ORD-1", "alice", "laptop"));
    const auto out = coordinator->acquire(req("ORD-1", "alice", "tablet"));
    ASSERT_TRUE(std::holds_alternative<Conflict>(out));
    EXPECT_EQ(std::get<Conflict>(out).holder_user_id, "alice");
}

TEST_F(CoordinatorTest, ReacquireWithOtherKindIsRejected) {
    coordinator->acquire(req("ORD-1", "alice", "s1", std::nullopt, ResourceKind::CustomerOrder));
    EXPECT_THROW(coordinator->acquire(req("ORD-1", "alice", "s1", std::nullopt, ResourceKind::InternalOrder)),
                 std::invalid_argument);
}

TEST_F(CoordinatorTest, CustomerAndInternalShareNamespace) {
    coordinator->acquire(req("ORD-1", "alice", "s1", std::nullopt, ResourceKind::CustomerOrder));
    const auto out = coordinator->acquire(req("ORD-1", "bob", "s2", std::nullopt, ResourceKind::InternalOrder));
    ASSERT_TRUE(std::holds_alternative<Conflict>(out));
    EXPECT_EQ(std::get<Conflict>(out).resource_kind, ResourceKind::CustomerOrder);
}

TEST_F(CoordinatorTest, RenewExtendsFromNow) {
    coordinator->acquire(req("ORD-1", "alice", "s1", 300s));
    clock->advance(100s);

    const auto out = coordinator->renew("ORD-1", "s1", 600s);
    ASSERT_TRUE(std::holds_alternative<LockGrant>(out));
    EXPECT_EQ(std::get<LockGrant>(out).lock.expires_at, clock->now() + 600s);
    EXPECT_EQ(std::get<LockGrant>(out).lock.last_activity_at, clock->now());
}

TEST_F(CoordinatorTest, RenewRequiresHoldingSession) {
    coordinator->acquire(req("ORD-1", "alice", "s1"));

    const auto out = coordinator->renew("ORD-1", "s2");
    ASSERT_TRUE(std::holds_alternative<NotHeld>(out));
    EXPECT_EQ(std::get<NotHeld>(out).resource_id, "ORD-1");
    EXPECT_TRUE(std::holds_alternative<NotHeld>(coordinator->renew("ORD-2", "s1")));
}

TEST_F(CoordinatorTest, RenewAfterExpiryFails) {
    coordinator->acquire(req("ORD-1", "alice", "s1", 60s));
    clock->advance(61s);
    EXPECT_TRUE(std::holds_alternative<NotHeld>(coordinator->renew("ORD-1", "s1")));
}

TEST_F(CoordinatorTest, ReleaseByOtherSessionLeavesLock) {
    const auto grant = std::get<LockGrant>(coordinator->acquire(req("ORD-1", "alice", "s1")));

    const auto out = coordinator->release("ORD-1", "s2");
    ASSERT_TRUE(std::holds_alternative<NotHeld>(out));
    EXPECT_TRUE(std::get<NotHeld>(out).held_by_other);

    const auto status = coordinator->inspect("ORD-1");
    ASSERT_TRUE(std::holds_alternative<LockedBy>(status));
    EXPECT_EQ(std::get<LockedBy>(status).holder_user_id, "alice");
    EXPECT_EQ(std::get<LockedBy>(status).expires_at, grant.lock.expires_at);
}

TEST_F(CoordinatorTest, ReleaseWithoutLock) {
    const auto out = coordinator->release("ORD-404", "s1");
    ASSERT_TRUE(std::holds_alternative<NotHeld>(out));
    EXPECT_FALSE(std::get<NotHeld>(out).held_by_other);
}

TEST_F(CoordinatorTest, ReleaseOfOtherSessionsExpiredLockIsNotHeld) {
    coordinator->acquire(req("ORD-1", "alice", "s1", 60s));
    clock->advance(61s);

    const auto out = coordinator->release("ORD-1", "s2");
    ASSERT_TRUE(std::holds_alternative<NotHeld>(out));
    EXPECT_FALSE(std::get<NotHeld>(out).held_by_other);
}

TEST_F(CoordinatorTest, InspectIgnoresExpiredRow) {
    coordinator->acquire(req("ORD-1", "alice", "s1", 60s));
    clock->advance(2min);

    EXPECT_TRUE(std::holds_alternative<Unlocked>(coordinator->inspect("ORD-1")));
    EXPECT_EQ(store->size(), 1u);
}

TEST_F(CoordinatorTest, SweepHonoursGrace) {
    coordinator->acquire(req("ORD-1", "alice", "s1", 300s));
    coordinator->acquire(req("ORD-2", "bob", "s2", 3600s));

    clock->advance(500s);
    EXPECT_EQ(coordinator->sweep(), 0u);

    clock->set(clock->start() + 300s + coordinator->options().sweep_grace + 1s);
    EXPECT_EQ(coordinator->sweep(), 1u);
    EXPECT_EQ(store->size(), 1u);
    EXPECT_TRUE(std::holds_alternative<LockedBy>(coordinator->inspect("ORD-2")));
}

TEST_F(CoordinatorTest, ConcurrentAcquireHasOneWinner) {
    constexpr int N = 16;
    std::atomic<int> grants{0}, conflicts{0};
    std::barrier sync(N);
    std::vector<std::thread> threads;

    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&, i] {
            sync.arrive_and_wait();
            const auto out = coordinator->acquire(req("ORD-1", "user" + std::to_string(i), "s" + std::to_string(i)));
            if (std::holds_alternative<LockGrant>(out)) ++grants;
            else ++conflicts;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(grants.load(), 1);
    EXPECT_EQ(conflicts.load(), N - 1);
}

TEST_F(CoordinatorTest, ExpiredLockRaceHasOneWinner) {
    coordinator->acquire(req("ORD-1", "alice", "s1", 60s));
    clock->advance(61s);

    constexpr int N = 8;
    std::atomic<int> grants{0};
    std::vector<std::string> winners(N);
    std::barrier sync(N);
    std::vector<std::thread> threads;

    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&, i] {
            sync.arrive_and_wait();
            const auto out = coordinator->acquire(req("ORD-1", "user" + std::to_string(i), "s" + std::to_string(i)));
            if (const auto* g = std::get_if<LockGrant>(&out)) {
                ++grants;
                winners[i] = g->lock.holder_user_id;
            }
        });
    }
    for (auto& t : threads) t.join();

    ASSERT_EQ(grants.load(), 1);
    std::string winner;
    for (const auto& w : winners) if (!w.empty()) winner = w;

    const auto status = coordinator->inspect("ORD-1");
    ASSERT_TRUE(std::holds_alternative<LockedBy>(status));
    EXPECT_EQ(std::get<LockedBy>(status).holder_user_id, winner);
}

TEST_F(CoordinatorTest, InvalidInputNeverReachesStore) {
    const auto counting = std::make_shared<CountingStore>();
    Coordinator c(counting, clock);

    EXPECT_THROW(c.acquire(req("", "alice", "s1")), std::invalid_argument);
    EXPECT_THROW(c.acquire(req("ORD 1", "alice", "s1")), std::invalid_argument);
    EXPECT_THROW(c.acquire(req(std::string(256, 'a'), "alice", "s1")), std::invalid_argument);
    EXPECT_THROW(c.acquire(req("ORD-1", "", "s1")), std::invalid_argument);
    EXPECT_THROW(c.acquire(req("ORD-1", "alice", "")), std::invalid_argument);
    EXPECT_THROW(c.acquire(req("ORD-1", "alice", "s\n1")), std::invalid_argument);
    EXPECT_THROW(c.acquire(req("ORD-1", "alice", "s1", 0s)), std::invalid_argument);
    EXPECT_THROW(c.acquire(req("ORD-1", "alice", "s1", -5s)), std::invalid_argument);
    EXPECT_THROW(c.acquire(req("ORD-1", "alice", "s1", c.options().max_ttl + 1s)), std::invalid_argument);
    EXPECT_THROW(c.renew("ORD-1", "s1", 0s), std::invalid_argument);
    EXPECT_THROW(c.renew("ORD-1", ""), std::invalid_argument);
    EXPECT_THROW(c.release("", "s1"), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(c.inspect("ORD/1")), std::invalid_argument);

    EXPECT_EQ(counting->calls.load(), 0);
}

TEST_F(CoordinatorTest, MaxTtlIsAccepted) {
    const auto out = coordinator->acquire(req("ORD-1", "alice", "s1", coordinator->options().max_ttl));
    EXPECT_TRUE(std::holds_alternative<LockGrant>(out));
}

TEST_F(CoordinatorTest, StoreFailurePropagates) {
    Coordinator c(std::make_shared<UnreachableStore>(), clock);

    EXPECT_THROW(c.acquire(req("ORD-1", "alice", "s1")), Unavailable);
    EXPECT_THROW(c.renew("ORD-1", "s1"), Unavailable);
    EXPECT_THROW(c.release("ORD-1", "s1"), Unavailable);
    EXPECT_THROW(static_cast<void>(c.inspect("ORD-1")), Unavailable);
    EXPECT_THROW(c.sweep(), Unavailable);
}

TEST_F(CoordinatorTest, UnknownOrderIsRejected) {
    const auto orders = std::make_shared<FakeOrderDirectory>();
    orders->add(ResourceKind::InternalOrder, "INT-7");
    coordinator->setOrderDirectory(orders);

    EXPECT_THROW(coordinator->acquire(req("ORD-1", "alice", "s1")), ResourceNotFound);
    EXPECT_THROW(coordinator->acquire(req("INT-7", "alice", "s1")), ResourceNotFound);
    EXPECT_TRUE(std::holds_alternative<LockGrant>(
        coordinator->acquire(req("INT-7", "alice", "s1", std::nullopt, ResourceKind::InternalOrder))));
    EXPECT_EQ(store->size(), 1u);
}

TEST_F(CoordinatorTest, ListenersSeeFreshGrantsAndReleases) {
    const auto listener = std::make_shared<RecordingListener>();
    coordinator->addListener(listener);

    coordinator->acquire(req("ORD-1", "alice", "s1"));
    coordinator->acquire(req("ORD-1", "alice", "s1"));
    coordinator->renew("ORD-1", "s1");
    coordinator->acquire(req("ORD-1", "bob", "s2"));
    coordinator->release("ORD-1", "s2");
    coordinator->release("ORD-1", "s1");

    EXPECT_EQ(listener->locked, std::vector<std::string>{"ORD-1"});
    EXPECT_EQ(listener->unlocked, std::vector<std::string>{"ORD-1"});
}

TEST_F(CoordinatorTest, FailingListenerDoesNotAffectOutcome) {
    coordinator->addListener(std::make_shared<ThrowingListener>());
    const auto listener = std::make_shared<RecordingListener>();
    coordinator->addListener(listener);

    EXPECT_TRUE(std::holds_alternative<LockGrant>(coordinator->acquire(req("ORD-1", "alice", "s1"))));
    EXPECT_TRUE(std::holds_alternative<Released>(coordinator->release("ORD-1", "s1")));
    EXPECT_EQ(listener->locked.size(), 1u);
    EXPECT_EQ(listener->unlocked.size(), 1u);
}

TEST_F(CoordinatorTest, RejectsUnusableOptions) {
    EXPECT_THROW(Coordinator(store, clock, {.default_ttl = 0s}), std::invalid_argument);
    EXPECT_THROW(Coordinator(store, clock, {.default_ttl = 600s, .max_ttl = 300s}), std::invalid_argument);
    EXPECT_THROW(Coordinator(nullptr, clock), std::invalid_argument);
    EXPECT_THROW(Coordinator(store, nullptr), std::invalid_argument);
}
