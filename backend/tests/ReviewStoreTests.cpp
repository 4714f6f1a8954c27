#include <catch2/catch.hpp>
#include <algorithm>
#include <atomic>
#include <thread>
#include "FakeBackend.hpp"
#include "../src/core/ReviewStore.hpp"

namespace {

constexpr std::time_t T0 = 1700000000;
constexpr std::time_t DAY = 24 * 60 * 60;

struct StoreFixture {
    std::time_t now = T0;
    Scheduler scheduler;
    FakeBackend backend;
    ReviewStore store{ scheduler, backend, [this] { return now; } };

    StoreFixture() { store.load("learner-1"); }
};

ReviewRecord remoteRecord(const std::string& item, std::time_t reviewedAt, int interval) {
    ReviewRecord r;
    r.item_id = item;
    r.owner_id = "learner-1";
    r.repetition_count = 4;
    r.ease_factor = 2.2;
    r.interval_days = interval;
    r.due_at = reviewedAt + interval * DAY;
    r.last_grade = Grade::GOOD;
    r.last_reviewed_at = reviewedAt;
    return r;
}

}

TEST_CASE_METHOD(StoreFixture, "grading is visible locally before the save lands", "[store]") {
    backend.closeGate();

    auto r = store.recordGrading("card-1", Grade::GOOD);
    CHECK(r.repetition_count == 1);
    CHECK(r.due_at == T0 + DAY);

    auto found = store.find("card-1");
    REQUIRE(found);
    CHECK(found->interval_days == 1);
    CHECK(found->owner_id == "learner-1");
    CHECK_FALSE(backend.has("card-1"));

    backend.openGate();
    store.waitForPendingWrites();
    CHECK(backend.has("card-1"));
    CHECK(store.lastPersistError().empty());
}

TEST_CASE_METHOD(StoreFixture, "second grading builds on the latest local state", "[store]") {
    store.recordGrading("card-1", Grade::GOOD);
    now += DAY;
    auto second = store.recordGrading("card-1", Grade::GOOD);

    CHECK(second.repetition_count == 2);
    CHECK(second.interval_days == 3);
    CHECK(store.size() == 1);
}

TEST_CASE_METHOD(StoreFixture, "a newer grading supersedes a queued save", "[store]") {
    backend.closeGate();

    store.recordGrading("blocker", Grade::GOOD);
    backend.waitForSavesStarted(1);          // worker is now stuck inside the first save

    store.recordGrading("card-1", Grade::GOOD);
    now += DAY;
    auto latest = store.recordGrading("card-1", Grade::EASY);

    backend.openGate();
    store.waitForPendingWrites();

    // only one write reached the backend for card-1, carrying the latest state
    CHECK(std::count(backend.save_log.begin(), backend.save_log.end(), "card-1") == 1);
    REQUIRE(backend.has("card-1"));
    CHECK(backend.stored["card-1"].repetition_count == latest.repetition_count);
    CHECK(backend.stored["card-1"].last_grade == Grade::EASY);
}

TEST_CASE_METHOD(StoreFixture, "a slow save finishing late does not overwrite newer local state", "[store]") {
    backend.closeGate();

    store.recordGrading("card-1", Grade::GOOD);
    backend.waitForSavesStarted(1);

    now += DAY;
    auto newer = store.recordGrading("card-1", Grade::HARD);

    backend.openGate();
    store.waitForPendingWrites();

    auto local = store.find("card-1");
    REQUIRE(local);
    CHECK(local->repetition_count == newer.repetition_count);
    CHECK(local->last_grade == Grade::HARD);
    CHECK(backend.stored["card-1"].last_grade == Grade::HARD);
}

TEST_CASE_METHOD(StoreFixture, "reset removes locally and remotely", "[store]") {
    store.recordGrading("card-1", Grade::EASY);
    store.waitForPendingWrites();
    REQUIRE(backend.has("card-1"));

    CHECK(store.resetItem("card-1"));
    CHECK_FALSE(store.find("card-1"));
    CHECK_FALSE(backend.has("card-1"));
}

TEST_CASE_METHOD(StoreFixture, "resetting an untracked item does not block its first save", "[store]") {
    CHECK(store.resetItem("never-graded"));
    CHECK(backend.delete_log == std::vector<std::string>{ "never-graded" });

    now += 60;
    store.recordGrading("never-graded", Grade::GOOD);
    store.waitForPendingWrites();

    CHECK(backend.has("never-graded"));
    CHECK(std::count(backend.save_log.begin(), backend.save_log.end(), "never-graded") == 1);
    CHECK(backend.delete_log.size() == 1);
}

TEST_CASE_METHOD(StoreFixture, "a reset between two gradings drops only the stale save", "[store]") {
    backend.closeGate();
    store.recordGrading("blocker", Grade::GOOD);
    backend.waitForSavesStarted(1);

    store.recordGrading("card-1", Grade::GOOD);
    store.resetItem("card-1");
    store.recordGrading("card-1", Grade::EASY);

    backend.openGate();
    store.waitForPendingWrites();

    // the stale first save is dropped, only the EASY grading reaches the backend
    CHECK(std::count(backend.save_log.begin(), backend.save_log.end(), "card-1") == 1);
    REQUIRE(backend.has("card-1"));
    CHECK(store.find("card-1")->last_grade == Grade::EASY);
    CHECK(std::count(backend.delete_log.begin(), backend.delete_log.end(), "card-1") == 1);
}

TEST_CASE_METHOD(StoreFixture, "reset keeps local removal when remote delete fails", "[store]") {
    store.recordGrading("card-1", Grade::GOOD);
    store.waitForPendingWrites();

    backend.fail_delete = true;
    CHECK_FALSE(store.resetItem("card-1"));
    CHECK_FALSE(store.find("card-1"));
    CHECK_FALSE(store.lastPersistError().empty());
}

TEST_CASE_METHOD(StoreFixture, "reset wins over an in-flight save", "[store]") {
    backend.closeGate();

    store.recordGrading("card-1", Grade::GOOD);
    backend.waitForSavesStarted(1);

    CHECK(store.resetItem("card-1"));
    backend.openGate();
    store.waitForPendingWrites();

    CHECK_FALSE(store.find("card-1"));
    CHECK_FALSE(backend.has("card-1"));
    CHECK(std::count(backend.delete_log.begin(), backend.delete_log.end(), "card-1") == 2);
}

TEST_CASE_METHOD(StoreFixture, "reset drops a save that has not started yet", "[store]") {
    backend.closeGate();

    store.recordGrading("blocker", Grade::GOOD);
    backend.waitForSavesStarted(1);
    store.recordGrading("card-1", Grade::GOOD);
    store.resetItem("card-1");

    backend.openGate();
    store.waitForPendingWrites();

    CHECK(std::count(backend.save_log.begin(), backend.save_log.end(), "card-1") == 0);
    CHECK_FALSE(backend.has("card-1"));
}

TEST_CASE_METHOD(StoreFixture, "grading after reset starts from scratch", "[store]") {
    store.recordGrading("card-1", Grade::GOOD);
    now += DAY;
    store.recordGrading("card-1", Grade::EASY);
    now += 3 * DAY;
    store.resetItem("card-1");

    now += 60;
    auto again = store.recordGrading("card-1", Grade::GOOD);
    CHECK(again.repetition_count == 1);
    CHECK(again.ease_factor == Approx(2.5));
    CHECK(again.interval_days == 1);
    CHECK(again.due_at == now + DAY);
}

TEST_CASE_METHOD(StoreFixture, "save failures are advisory", "[store]") {
    std::atomic<int> failures{ 0 };
    store.subscribe([&](const StoreEvent& ev) {
        if (ev.kind == StoreEventKind::PERSIST_FAILED) ++failures;
    });

    backend.fail_save = true;
    auto r = store.recordGrading("card-1", Grade::GOOD);
    store.waitForPendingWrites();

    CHECK(failures.load() == 1);
    CHECK_FALSE(store.lastPersistError().empty());
    auto local = store.find("card-1");
    REQUIRE(local);
    CHECK(local->due_at == r.due_at);

    // scheduling continues from local state
    now += DAY;
    CHECK(store.recordGrading("card-1", Grade::GOOD).repetition_count == 2);
    store.waitForPendingWrites();
}

TEST_CASE("load replaces the collection from the backend", "[store]") {
    std::time_t now = T0;
    Scheduler scheduler;
    FakeBackend backend;
    backend.stored["a"] = remoteRecord("a", T0 - DAY, 1);
    backend.stored["b"] = remoteRecord("b", T0 - DAY, 30);
    ReviewRecord stranger = remoteRecord("c", T0 - DAY, 5);
    stranger.owner_id = "someone-else";
    backend.stored["c"] = stranger;

    ReviewStore store(scheduler, backend, [&] { return now; });
    store.recordGrading("local-only", Grade::GOOD);
    store.waitForPendingWrites();
    backend.stored.erase("local-only");

    store.load("learner-1");
    CHECK_FALSE(store.loadFailed());
    CHECK_FALSE(store.isLoading());
    CHECK(store.size() == 2);
    CHECK(store.find("a"));
    CHECK(store.find("b"));
    CHECK_FALSE(store.find("c"));
    CHECK_FALSE(store.find("local-only"));
    CHECK(backend.subscribed_owner == "learner-1");
}

TEST_CASE("failed load leaves the store empty and flags it", "[store]") {
    Scheduler scheduler;
    FakeBackend backend;
    backend.stored["a"] = remoteRecord("a", T0 - DAY, 1);
    backend.fail_fetch = true;

    ReviewStore store(scheduler, backend, [] { return T0; });
    bool loadedEvent = false;
    store.subscribe([&](const StoreEvent& ev) {
        if (ev.kind == StoreEventKind::LOADED) loadedEvent = true;
    });

    REQUIRE_NOTHROW(store.load("learner-1"));
    CHECK(store.loadFailed());
    CHECK(store.size() == 0);
    CHECK_FALSE(loadedEvent);
}

TEST_CASE_METHOD(StoreFixture, "reconcile applies strictly newer remote records", "[store]") {
    store.recordGrading("card-1", Grade::GOOD);      // reviewed at T0
    store.waitForPendingWrites();

    SECTION("newer wins") {
        backend.push(remoteRecord("card-1", T0 + 60, 12));
        auto r = store.find("card-1");
        REQUIRE(r);
        CHECK(r->interval_days == 12);
    }
    SECTION("equal timestamp loses") {
        backend.push(remoteRecord("card-1", T0, 12));
        CHECK(store.find("card-1")->interval_days == 1);
    }
    SECTION("older loses") {
        backend.push(remoteRecord("card-1", T0 - 60, 12));
        CHECK(store.find("card-1")->interval_days == 1);
    }
    SECTION("missing timestamp never wins") {
        ReviewRecord r = remoteRecord("card-1", T0 + 60, 12);
        r.last_reviewed_at.reset();
        backend.push(r);
        CHECK(store.find("card-1")->interval_days == 1);

        ReviewRecord unknown = remoteRecord("card-2", T0, 12);
        unknown.last_reviewed_at.reset();
        backend.push(unknown);
        CHECK_FALSE(store.find("card-2"));
    }
    SECTION("unknown items are added") {
        backend.push(remoteRecord("card-9", T0 - DAY, 4));
        CHECK(store.find("card-9"));
        CHECK(store.size() == 2);
    }
    SECTION("records of another learner are ignored") {
        ReviewRecord r = remoteRecord("card-9", T0 + 60, 4);
        r.owner_id = "someone-else";
        backend.push(r);
        CHECK_FALSE(store.find("card-9"));
    }
}

TEST_CASE_METHOD(StoreFixture, "an older echo never discards a pending local write", "[store]") {
    backend.closeGate();
    store.recordGrading("blocker", Grade::GOOD);
    backend.waitForSavesStarted(1);

    now += DAY;
    auto local = store.recordGrading("card-1", Grade::EASY);   // queued behind the blocker
    backend.push(remoteRecord("card-1", T0, 40));              // echo from before the grading

    CHECK(store.find("card-1")->interval_days == local.interval_days);

    backend.openGate();
    store.waitForPendingWrites();
    CHECK(backend.stored["card-1"].last_grade == Grade::EASY);
}

TEST_CASE_METHOD(StoreFixture, "a newer remote record cancels a queued stale save", "[store]") {
    backend.closeGate();
    store.recordGrading("blocker", Grade::GOOD);
    backend.waitForSavesStarted(1);

    store.recordGrading("card-1", Grade::GOOD);                // reviewed at T0
    backend.push(remoteRecord("card-1", T0 + 300, 40));

    backend.openGate();
    store.waitForPendingWrites();

    CHECK(store.find("card-1")->interval_days == 40);
    CHECK(std::count(backend.save_log.begin(), backend.save_log.end(), "card-1") == 0);
}

TEST_CASE_METHOD(StoreFixture, "remote echo from before a reset does not resurrect the item", "[store]") {
    store.recordGrading("card-1", Grade::GOOD);
    store.waitForPendingWrites();

    now += 60;
    store.resetItem("card-1");
    backend.push(remoteRecord("card-1", T0, 1));
    CHECK_FALSE(store.find("card-1"));

    // a genuinely later review from elsewhere is accepted
    backend.push(remoteRecord("card-1", now + 30, 6));
    CHECK(store.find("card-1"));
}

TEST_CASE_METHOD(StoreFixture, "listeners see every change in order", "[store]") {
    std::vector<StoreEventKind> seen;
    int id = store.subscribe([&](const StoreEvent& ev) { seen.push_back(ev.kind); });

    store.recordGrading("card-1", Grade::GOOD);
    store.resetItem("card-1");
    backend.push(remoteRecord("card-2", T0 + 10, 3));
    store.waitForPendingWrites();

    REQUIRE(seen.size() == 3);
    CHECK(seen[0] == StoreEventKind::GRADED);
    CHECK(seen[1] == StoreEventKind::RESET);
    CHECK(seen[2] == StoreEventKind::RECONCILED);

    store.unsubscribe(id);
    store.recordGrading("card-3", Grade::GOOD);
    store.waitForPendingWrites();
    CHECK(seen.size() == 3);
}

TEST_CASE("destroying the store flushes queued saves and cancels the stream", "[store]") {
    Scheduler scheduler;
    FakeBackend backend;
    {
        ReviewStore store(scheduler, backend, [] { return T0; });
        store.load("learner-1");
        REQUIRE(backend.subscriberCount() == 1);
        store.recordGrading("card-1", Grade::GOOD);
        store.recordGrading("card-2", Grade::EASY);
    }
    CHECK(backend.subscriberCount() == 0);
    CHECK(backend.has("card-1"));
    CHECK(backend.has("card-2"));
}
