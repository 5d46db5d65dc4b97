#include "migration_lock.hpp"
#include "cancellation.hpp"
#include <chrono>
#include <format>

MigrationLockRegistry::Guard::Guard(MigrationLockRegistry* registry, std::string key)
    : registry_(registry), key_(std::move(key)) {}

MigrationLockRegistry::Guard::Guard(Guard&& other) noexcept
    : registry_(other.registry_), key_(std::move(other.key_)) {
    other.registry_ = nullptr;
}

MigrationLockRegistry::Guard& MigrationLockRegistry::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = other.registry_;
        key_ = std::move(other.key_);
        other.registry_ = nullptr;
    }
    return *this;
}

MigrationLockRegistry::Guard::~Guard() {
    release();
}

void MigrationLockRegistry::Guard::release() noexcept {
    if (registry_) {
        registry_->release(key_);
        registry_ = nullptr;
    }
}

std::expected<MigrationLockRegistry::Guard, MigrationError> MigrationLockRegistry::acquire(const std::string& key,
                                                                                        const CancellationToken& token) {
    std::unique_lock lock(mutex_);
    while (held_.contains(key)) {
        if (token.isCancelled()) {
            return std::unexpected(MigrationError{ErrorKind::Cancelled,
                std::format("Cancelled while waiting for another migration of {}", key)});
        }
        released_.wait_for(lock, std::chrono::milliseconds(100));
    }
    if (token.isCancelled()) {
        return std::unexpected(MigrationError{ErrorKind::Cancelled, "Migration cancelled before it started"});
    }
    held_.insert(key);
    return Guard(this, key);
}

bool MigrationLockRegistry::isHeld(const std::string& key) const {
    std::lock_guard lock(mutex_);
    return held_.contains(key);
}

void MigrationLockRegistry::release(const std::string& key) noexcept {
    {
        std::lock_guard lock(mutex_);
        held_.erase(key);
    }
    released_.notify_all();
}
