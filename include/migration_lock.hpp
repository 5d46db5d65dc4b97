/**
 * @file migration_lock.hpp
 * @brief Serializes migrations that target the same destination account.
 *
 * Two migrations holding the same key (destination host, username, domain) never run
 * their conflict check and pipeline at the same time. Migrations with different keys
 * are unaffected.
 */

#ifndef MIGRATION_LOCK_HPP
#define MIGRATION_LOCK_HPP

#include <string>
#include <set>
#include <mutex>
#include <condition_variable>
#include <expected>
#include "migration_types.hpp"

class CancellationToken;

class MigrationLockRegistry {
public:
    /**
     * @brief Releases its key when destroyed.
     */
    class Guard {
    public:
        Guard(MigrationLockRegistry* registry, std::string key);
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

        const std::string& key() const { return key_; }

    private:
        void release() noexcept;

        MigrationLockRegistry* registry_;
        std::string key_;
    };

    /**
     * @brief Blocks until the key is free, then takes it.
     *
     * @param key Key returned by migrationKey().
     * @param token Gives up with a Cancelled error when cancelled.
     * @return std::expected<Guard, MigrationError> Guard holding the key, or the cancellation.
     */
    std::expected<Guard, MigrationError> acquire(const std::string& key, const CancellationToken& token);

    /**
     * @brief Reports whether a key is currently held.
     */
    bool isHeld(const std::string& key) const;

private:
    void release(const std::string& key) noexcept;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::set<std::string> held_;
};

#endif // MIGRATION_LOCK_HPP
