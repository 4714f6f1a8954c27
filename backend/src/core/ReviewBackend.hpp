#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "ReviewRecord.hpp"

// Handle for a push stream registered with a backend.
// Cancels the registration when destroyed or reassigned.
class UpdateSubscription {
public:
    UpdateSubscription() = default;
    explicit UpdateSubscription(std::function<void()> onCancel);
    ~UpdateSubscription();

    UpdateSubscription(UpdateSubscription&& other) noexcept;
    UpdateSubscription& operator=(UpdateSubscription&& other) noexcept;
    UpdateSubscription(const UpdateSubscription&) = delete;
    UpdateSubscription& operator=(const UpdateSubscription&) = delete;

    void cancel();
    bool active() const { return static_cast<bool>(cancelFn); }

private:
    std::function<void()> cancelFn;
};

using RemoteUpdateFn = std::function<void(const ReviewRecord&)>;

// Durable mirror of one learner's review records.
// Implementations may block, retry and time out; callers never hold locks across these calls.
class ReviewBackend {
public:
    virtual ~ReviewBackend() = default;

    // Fills `out` with every stored record of the owner. false on failure.
    virtual bool fetchReviews(const std::string& ownerId, std::vector<ReviewRecord>& out) = 0;

    // Stores `record`, replacing any earlier copy. Returns the stored record, or nothing on failure.
    virtual std::optional<ReviewRecord> saveReview(const ReviewRecord& record) = 0;

    virtual bool deleteReview(const std::string& itemId) = 0;

    // Records changed elsewhere (another device) are pushed to `onUpdate`, possibly from another thread.
    virtual UpdateSubscription streamUpdates(const std::string& ownerId, RemoteUpdateFn onUpdate) = 0;
};
