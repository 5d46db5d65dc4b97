#include "cancellation.hpp"
#include <algorithm>
#include <thread>

CancellationToken::CancellationToken(std::chrono::milliseconds budget) {
    expireAfter(budget);
}

void CancellationToken::expireAfter(std::chrono::milliseconds budget) {
    if (budget.count() > 0) {
        deadline_ = Clock::now() + budget;
    } else {
        deadline_.reset();
    }
}

void CancellationToken::cancel() noexcept {
    cancelled_.store(true);
}

bool CancellationToken::isCancelled() const noexcept {
    return cancelled_.load() || deadlineExpired();
}

bool CancellationToken::deadlineExpired() const noexcept {
    return deadline_ && Clock::now() >= *deadline_;
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) const {
    constexpr auto kSlice = std::chrono::milliseconds(50);
    auto wakeAt = Clock::now() + duration;
    while (!isCancelled()) {
        auto now = Clock::now();
        if (now >= wakeAt) {
            return true;
        }
        std::this_thread::sleep_for(std::min<Clock::duration>(wakeAt - now, kSlice));
    }
    return false;
}
