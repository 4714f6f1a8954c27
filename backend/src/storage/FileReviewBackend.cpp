#include "FileReviewBackend.hpp"
#include "Storage.hpp"
#include <algorithm>
#include <stdexcept>
#include <sodium.h>
#include <spdlog/spdlog.h>

FileReviewBackend::FileReviewBackend(const std::string& file, const std::string& passphrase)
    : filename(file)
{
    if (sodium_init() < 0) {
        spdlog::error("Failed to initialize libsodium");
        throw std::runtime_error("libsodium initialization failed");
    }

    if (!Storage::readSalt(filename, salt)) {
        spdlog::info("No readable review file at '{}'; starting a new one", filename);
        salt = Storage::randomSalt();
    }
    key = Storage::deriveKey(passphrase, salt);

    spdlog::info("FileReviewBackend initialized with review file '{}'", filename);
}

FileReviewBackend::~FileReviewBackend() {
    if (!key.empty()) {
        spdlog::debug("Clearing storage key from memory");
        sodium_memzero(key.data(), key.size());
    }
}

std::string FileReviewBackend::fileNameFor(const std::string& ownerId) {
    if (ownerId.empty())
        throw std::invalid_argument("learner id is empty");
    if (ownerId.find_first_of("/\\") != std::string::npos || ownerId.find("..") != std::string::npos)
        throw std::invalid_argument("learner id must not contain '/', '\\' or '..'");
    return "reviews_" + ownerId + ".dat";
}

bool FileReviewBackend::readAll(std::vector<ReviewRecord>& records) {
    return Storage::loadReviews(records, filename, key);
}

bool FileReviewBackend::writeAll(const std::vector<ReviewRecord>& records) {
    return Storage::saveReviews(records, filename, key, salt);
}

void FileReviewBackend::remember(const ReviewRecord& r) {
    if (r.last_reviewed_at) seen[r.item_id] = *r.last_reviewed_at;
}

bool FileReviewBackend::fetchReviews(const std::string& ownerId, std::vector<ReviewRecord>& out) {
    std::lock_guard<std::mutex> lock(mtx);
    out.clear();

    std::vector<ReviewRecord> all;
    if (!readAll(all)) return false;

    for (auto& r : all) {
        if (r.owner_id != ownerId) continue;
        remember(r);
        out.push_back(std::move(r));
    }
    spdlog::debug("fetchReviews('{}'): {} records", ownerId, out.size());
    return true;
}

std::optional<ReviewRecord> FileReviewBackend::saveReview(const ReviewRecord& record) {
    std::lock_guard<std::mutex> lock(mtx);

    std::vector<ReviewRecord> all;
    if (!readAll(all)) return std::nullopt;

    auto it = std::find_if(all.begin(), all.end(),
        [&](const ReviewRecord& r) { return r.item_id == record.item_id; });
    if (it != all.end())
        *it = record;
    else
        all.push_back(record);

    if (!writeAll(all)) return std::nullopt;

    remember(record);
    return record;
}

bool FileReviewBackend::deleteReview(const std::string& itemId) {
    std::lock_guard<std::mutex> lock(mtx);

    std::vector<ReviewRecord> all;
    if (!readAll(all)) return false;

    auto before = all.size();
    all.erase(std::remove_if(all.begin(), all.end(),
        [&](const ReviewRecord& r) { return r.item_id == itemId; }), all.end());
    seen.erase(itemId);

    if (all.size() == before) {
        spdlog::debug("deleteReview('{}'): nothing stored", itemId);
        return true;
    }
    return writeAll(all);
}

UpdateSubscription FileReviewBackend::streamUpdates(const std::string& ownerId, RemoteUpdateFn onUpdate) {
    int id = 0;
    {
        std::lock_guard<std::mutex> lock(sub_mtx);
        id = next_subscriber_id++;
        subscribers.emplace(id, Subscriber{ ownerId, std::move(onUpdate) });
    }
    spdlog::debug("Subscriber {} registered for '{}'", id, ownerId);

    return UpdateSubscription([this, id] {
        std::lock_guard<std::mutex> lock(sub_mtx);
        subscribers.erase(id);
    });
}

int FileReviewBackend::pollChanges() {
    std::vector<ReviewRecord> changed;
    {
        std::lock_guard<std::mutex> lock(mtx);

        std::vector<ReviewRecord> all;
        if (!readAll(all)) {
            spdlog::error("pollChanges: could not read '{}'", filename);
            return -1;
        }

        for (auto& r : all) {
            if (!r.last_reviewed_at) {
                spdlog::warn("pollChanges: record '{}' has no review timestamp; not pushed", r.item_id);
                continue;
            }
            auto it = seen.find(r.item_id);
            if (it != seen.end() && it->second == *r.last_reviewed_at) continue;

            remember(r);
            changed.push_back(std::move(r));
        }
    }

    std::vector<Subscriber> targets;
    {
        std::lock_guard<std::mutex> lock(sub_mtx);
        for (const auto& p : subscribers) targets.push_back(p.second);
    }

    int pushed = 0;
    for (const auto& r : changed) {
        for (const auto& s : targets) {
            if (s.owner_id != r.owner_id) continue;
            s.fn(r);
            ++pushed;
        }
    }

    spdlog::info("pollChanges: {} changed records, {} deliveries", changed.size(), pushed);
    return pushed;
}
