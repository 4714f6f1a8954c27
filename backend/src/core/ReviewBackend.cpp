#include "ReviewBackend.hpp"
#include <utility>

UpdateSubscription::UpdateSubscription(std::function<void()> onCancel)
    : cancelFn(std::move(onCancel))
{
}

UpdateSubscription::~UpdateSubscription() {
    cancel();
}

UpdateSubscription::UpdateSubscription(UpdateSubscription&& other) noexcept
    : cancelFn(std::move(other.cancelFn))
{
    other.cancelFn = nullptr;
}

UpdateSubscription& UpdateSubscription::operator=(UpdateSubscription&& other) noexcept {
    if (this != &other) {
        cancel();
        cancelFn = std::move(other.cancelFn);
        other.cancelFn = nullptr;
    }
    return *this;
}

void UpdateSubscription::cancel() {
    if (cancelFn) {
        auto fn = std::move(cancelFn);
        cancelFn = nullptr;
        fn();
    }
}
