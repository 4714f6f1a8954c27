#include "ReviewStore.hpp"
#include <algorithm>
#include <exception>
#include <utility>

ReviewStore::ReviewStore(const Scheduler& scheduler, ReviewBackend& reviewBackend, Clock clk)
    : engine(scheduler),
    backend(reviewBackend),
    clock(clk ? std::move(clk) : Clock([] { return std::time(nullptr); }))
{
    worker = std::thread([this] { workerLoop(); });
    spdlog::info("ReviewStore initialized");
}

ReviewStore::~ReviewStore() {
    // stop remote pushes before tearing down state they would touch
    remote_updates.cancel();

    {
        std::lock_guard<std::mutex> lock(mtx);
        stopping = true;
    }
    cv_work.notify_all();
    if (worker.joinable()) worker.join();

    spdlog::debug("ReviewStore for '{}' shut down", owner);
}

/* -------------------------
   Local operations
   ------------------------- */

ReviewRecord ReviewStore::recordGrading(const std::string& itemId, Grade grade) {
    const std::time_t t = clock();
    ReviewRecord next;
    std::vector<StoreEvent> events;

    {
        std::lock_guard<std::mutex> lock(mtx);

        auto it = records.find(itemId);
        PriorState prior = NewItem{ itemId, owner };
        if (it != records.end()) prior = it->second;

        next = engine.computeNext(prior, grade, t);

        records[itemId] = next;
        reset_at.erase(itemId);

        std::uint64_t gen = ++generations[itemId];
        save_queue.push_back(SaveJob{ itemId, gen });

        events.push_back(StoreEvent{ StoreEventKind::GRADED, itemId, next, gradeName(grade) });
    }
    cv_work.notify_one();

    spdlog::info("Graded item '{}' as {} -> interval={}d due={}",
        itemId, gradeName(grade), next.interval_days, next.due_at);

    notify(events);
    return next;
}

bool ReviewStore::resetItem(const std::string& itemId) {
    bool existed = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        existed = records.erase(itemId) > 0;
        // drops any save still queued for this item; an item never graded has none
        auto gen = generations.find(itemId);
        if (gen != generations.end()) ++gen->second;
        reset_at[itemId] = clock();
    }

    spdlog::info("Reset item '{}' (was tracked: {})", itemId, existed);
    notify({ StoreEvent{ StoreEventKind::RESET, itemId, std::nullopt, "" } });

    return deleteRemote(itemId);
}

/* -------------------------
   Remote data
   ------------------------- */

void ReviewStore::load(const std::string& ownerId) {
    spdlog::info("Loading reviews for owner '{}'", ownerId);
    loading = true;

    std::vector<ReviewRecord> fetched;
    bool ok = false;
    std::string failure = "fetch failed";
    try {
        ok = backend.fetchReviews(ownerId, fetched);
    }
    catch (const std::exception& e) {
        failure = e.what();
        ok = false;
    }

    std::vector<StoreEvent> events;
    {
        std::lock_guard<std::mutex> lock(mtx);
        owner = ownerId;
        records.clear();
        reset_at.clear();
        for (auto& g : generations) ++g.second;

        if (ok) {
            for (auto& r : fetched) {
                if (r.owner_id != ownerId) {
                    spdlog::warn("Skipping fetched record '{}' owned by '{}'", r.item_id, r.owner_id);
                    continue;
                }
                if (r.repetition_count < 1) {
                    spdlog::warn("Skipping fetched record '{}' with no completed grading", r.item_id);
                    continue;
                }
                std::string id = r.item_id;
                records[id] = std::move(r);
            }
            events.push_back(StoreEvent{ StoreEventKind::LOADED, "", std::nullopt, "" });
        }
        else {
            last_persist_error = failure;
            events.push_back(StoreEvent{ StoreEventKind::PERSIST_FAILED, "", std::nullopt, failure });
        }
    }

    load_failed = !ok;
    loading = false;

    if (ok)
        spdlog::info("Loaded {} review records for '{}'", size(), ownerId);
    else
        spdlog::error("Failed to load reviews for '{}': {}", ownerId, failure);

    try {
        remote_updates = backend.streamUpdates(ownerId, [this](const ReviewRecord& r) { reconcile(r); });
    }
    catch (const std::exception& e) {
        spdlog::error("Could not subscribe to remote updates for '{}': {}", ownerId, e.what());
    }

    notify(events);
}

void ReviewStore::reconcile(const ReviewRecord& remote) {
    if (!remote.last_reviewed_at) {
        spdlog::warn("Remote record '{}' has no review timestamp; ignored", remote.item_id);
        return;
    }

    std::vector<StoreEvent> events;
    {
        std::lock_guard<std::mutex> lock(mtx);

        if (remote.owner_id != owner) {
            spdlog::warn("Remote record '{}' belongs to '{}', not '{}'; ignored",
                remote.item_id, remote.owner_id, owner);
            return;
        }
        if (remote.repetition_count < 1) {
            spdlog::warn("Remote record '{}' has no completed grading; ignored", remote.item_id);
            return;
        }

        auto tomb = reset_at.find(remote.item_id);
        if (tomb != reset_at.end() && *remote.last_reviewed_at <= tomb->second) {
            spdlog::debug("Remote record '{}' predates local reset; ignored", remote.item_id);
            return;
        }

        auto it = records.find(remote.item_id);
        if (it != records.end() && !it->second.olderThan(remote)) {
            spdlog::debug("Remote record '{}' is not newer than local state; ignored", remote.item_id);
            return;
        }

        records[remote.item_id] = remote;
        reset_at.erase(remote.item_id);
        ++generations[remote.item_id];   // a queued save of the older local state must not overwrite it

        events.push_back(StoreEvent{ StoreEventKind::RECONCILED, remote.item_id, remote, "" });
    }

    spdlog::info("Reconciled remote record '{}' (reviewed at {})", remote.item_id, *remote.last_reviewed_at);
    notify(events);
}

/* -------------------------
   Queries
   ------------------------- */

std::optional<ReviewRecord> ReviewStore::find(const std::string& itemId) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = records.find(itemId);
    if (it == records.end()) return std::nullopt;
    return it->second;
}

std::vector<ReviewRecord> ReviewStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<ReviewRecord> out;
    out.reserve(records.size());
    for (const auto& p : records) out.push_back(p.second);
    return out;
}

std::size_t ReviewStore::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return records.size();
}

std::string ReviewStore::ownerId() const {
    std::lock_guard<std::mutex> lock(mtx);
    return owner;
}

std::string ReviewStore::lastPersistError() const {
    std::lock_guard<std::mutex> lock(mtx);
    return last_persist_error;
}

/* -------------------------
   Change listeners
   ------------------------- */

int ReviewStore::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mtx);
    int id = next_listener_id++;
    listeners.emplace(id, std::move(listener));
    return id;
}

void ReviewStore::unsubscribe(int id) {
    std::lock_guard<std::mutex> lock(mtx);
    listeners.erase(id);
}

void ReviewStore::notify(const std::vector<StoreEvent>& events) {
    if (events.empty()) return;

    std::vector<Listener> current;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (const auto& p : listeners) current.push_back(p.second);
    }

    for (const auto& ev : events)
        for (const auto& fn : current)
            fn(ev);
}

/* -------------------------
   Persistence worker
   ------------------------- */

void ReviewStore::waitForPendingWrites() {
    std::unique_lock<std::mutex> lock(mtx);
    cv_idle.wait(lock, [this] { return save_queue.empty() && !save_in_flight; });
}

void ReviewStore::workerLoop() {
    for (;;) {
        SaveJob job;
        {
            std::unique_lock<std::mutex> lock(mtx);
            cv_work.wait(lock, [this] { return stopping || !save_queue.empty(); });
            if (stopping && save_queue.empty()) return;

            job = std::move(save_queue.front());
            save_queue.pop_front();
            save_in_flight = true;
        }

        persist(job);

        {
            std::lock_guard<std::mutex> lock(mtx);
            save_in_flight = false;
            if (save_queue.empty()) cv_idle.notify_all();
        }
    }
}

void ReviewStore::persist(const SaveJob& job) {
    ReviewRecord toSave;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!isCurrent(job)) {
            spdlog::debug("Save of '{}' (gen {}) superseded before start", job.item_id, job.generation);
            return;
        }
        toSave = records.at(job.item_id);
    }

    std::optional<ReviewRecord> saved;
    std::string failure = "save rejected";
    try {
        saved = backend.saveReview(toSave);
    }
    catch (const std::exception& e) {
        failure = e.what();
    }

    std::vector<StoreEvent> events;
    bool redelete = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (isCurrent(job)) {
            if (!saved) {
                last_persist_error = failure;
                events.push_back(StoreEvent{ StoreEventKind::PERSIST_FAILED, job.item_id, toSave, failure });
            }
        }
        else if (!records.count(job.item_id) && reset_at.count(job.item_id)) {
            // reset won the race; the save we just made must not survive it
            redelete = saved.has_value();
        }
    }

    if (!saved)
        spdlog::error("Saving review '{}' failed: {}", job.item_id, failure);
    else
        spdlog::debug("Saved review '{}' (gen {})", job.item_id, job.generation);

    if (redelete) {
        spdlog::info("Save of '{}' completed after reset; deleting again", job.item_id);
        deleteRemote(job.item_id);
    }

    notify(events);
}

// Caller holds mtx.
bool ReviewStore::isCurrent(const SaveJob& job) const {
    auto gen = generations.find(job.item_id);
    return gen != generations.end() && gen->second == job.generation && records.count(job.item_id) > 0;
}

bool ReviewStore::deleteRemote(const std::string& itemId) {
    bool ok = false;
    std::string failure = "delete rejected";
    try {
        ok = backend.deleteReview(itemId);
    }
    catch (const std::exception& e) {
        failure = e.what();
        ok = false;
    }

    if (ok) return true;

    spdlog::error("Deleting review '{}' failed: {}", itemId, failure);
    {
        std::lock_guard<std::mutex> lock(mtx);
        last_persist_error = failure;
    }
    notify({ StoreEvent{ StoreEventKind::PERSIST_FAILED, itemId, std::nullopt, failure } });
    return false;
}
