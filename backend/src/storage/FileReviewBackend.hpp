#pragma once
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "../core/ReviewBackend.hpp"

// ReviewBackend over one encrypted file per learner (see Storage).
// Another process writing the same file plays the part of "another device":
// pollChanges() re-reads it and pushes every record that differs from what this
// backend last wrote or saw to the streamUpdates() subscribers.
class FileReviewBackend : public ReviewBackend {
public:
    // Derives the file key from `passphrase` and the file's salt (a fresh salt for a new file).
    // Throws std::runtime_error if libsodium cannot be initialized.
    FileReviewBackend(const std::string& filename, const std::string& passphrase);
    ~FileReviewBackend() override;

    bool fetchReviews(const std::string& ownerId, std::vector<ReviewRecord>& out) override;
    std::optional<ReviewRecord> saveReview(const ReviewRecord& record) override;
    bool deleteReview(const std::string& itemId) override;
    UpdateSubscription streamUpdates(const std::string& ownerId, RemoteUpdateFn onUpdate) override;

    // Returns the number of records pushed, or -1 if the file could not be read.
    int pollChanges();

    const std::string& path() const { return filename; }

    // "reviews_<owner>.dat" in the working directory.
    // Throws std::invalid_argument for ids that could name a file elsewhere.
    static std::string fileNameFor(const std::string& ownerId);

private:
    struct Subscriber {
        std::string owner_id;
        RemoteUpdateFn fn;
    };

    std::string filename;
    std::vector<unsigned char> key;
    std::vector<unsigned char> salt;

    std::mutex mtx;  // serializes read-modify-write cycles on the file
    std::unordered_map<std::string, std::time_t> seen;  // item -> last_reviewed_at last written or observed

    std::mutex sub_mtx;
    std::map<int, Subscriber> subscribers;
    int next_subscriber_id = 1;

    bool readAll(std::vector<ReviewRecord>& records);
    bool writeAll(const std::vector<ReviewRecord>& records);
    void remember(const ReviewRecord& r);
};
