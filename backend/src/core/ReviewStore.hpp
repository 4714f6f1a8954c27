#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <ctime>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "ReviewRecord.hpp"
#include "ReviewBackend.hpp"
#include "Scheduler.hpp"

enum class StoreEventKind {
    GRADED,
    RESET,
    LOADED,
    RECONCILED,
    PERSIST_FAILED
};

struct StoreEvent {
    StoreEventKind kind;
    std::string item_id;                 // empty for LOADED
    std::optional<ReviewRecord> record;  // new state for GRADED / RECONCILED
    std::string detail;
};

/*
  Authoritative in-memory review collection of one learner.

   - Gradings are applied synchronously and are visible as soon as recordGrading returns.
   - Saves run on a single background worker; a newer grading of the same item
     supersedes any save still queued for it, and a save that lands after a reset
     is followed by another delete.
   - Remote data enters only through load() and reconcile() (last write wins on
     last_reviewed_at, strictly newer only).
   - Listeners are notified after each change, outside the store lock.
*/
class ReviewStore {
public:
    using Clock = std::function<std::time_t()>;
    using Listener = std::function<void(const StoreEvent&)>;

    ReviewStore(const Scheduler& scheduler, ReviewBackend& backend, Clock clock = nullptr);
    ~ReviewStore();

    ReviewStore(const ReviewStore&) = delete;
    ReviewStore& operator=(const ReviewStore&) = delete;

    ReviewRecord recordGrading(const std::string& itemId, Grade grade);
    bool resetItem(const std::string& itemId);
    void load(const std::string& ownerId);
    void reconcile(const ReviewRecord& remote);

    std::optional<ReviewRecord> find(const std::string& itemId) const;
    std::vector<ReviewRecord> snapshot() const;
    std::size_t size() const;

    std::string ownerId() const;
    bool isLoading() const { return loading.load(); }
    bool loadFailed() const { return load_failed.load(); }
    std::string lastPersistError() const;

    int subscribe(Listener listener);
    void unsubscribe(int id);

    // Blocks until every queued save has been handed to the backend.
    void waitForPendingWrites();

    std::time_t now() const { return clock(); }
    const Scheduler& scheduler() const { return engine; }

private:
    struct SaveJob {
        std::string item_id;
        std::uint64_t generation = 0;
    };

    const Scheduler& engine;
    ReviewBackend& backend;
    Clock clock;

    mutable std::mutex mtx;
    std::string owner;
    std::unordered_map<std::string, ReviewRecord> records;
    std::unordered_map<std::string, std::uint64_t> generations;  // bumped by every local or remote change
    std::unordered_map<std::string, std::time_t> reset_at;       // tombstones
    std::map<int, Listener> listeners;
    int next_listener_id = 1;
    std::string last_persist_error;

    std::atomic<bool> loading{ false };
    std::atomic<bool> load_failed{ false };

    UpdateSubscription remote_updates;

    // persistence worker
    std::deque<SaveJob> save_queue;
    std::condition_variable cv_work;
    std::condition_variable cv_idle;
    bool save_in_flight = false;
    bool stopping = false;
    std::thread worker;

    void workerLoop();
    void persist(const SaveJob& job);
    bool isCurrent(const SaveJob& job) const;
    bool deleteRemote(const std::string& itemId);
    void notify(const std::vector<StoreEvent>& events);
};
