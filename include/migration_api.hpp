/**
 * @file migration_api.hpp
 * @brief High-level API for running cpmigrate migrations.
 *
 * Wires the libssh and libcurl implementations into a Migrator, so that external
 * front-ends only supply a configuration file and a populated request.
 */

#ifndef MIGRATION_API_HPP
#define MIGRATION_API_HPP

#include <string>
#include "migration_types.hpp"

class CancellationToken;

/**
 * @brief API for migrating accounts.
 *
 * Serves as the primary entry point for external applications.
 */
class MigrationAPI {
public:
    /**
     * @brief Runs a full migration.
     *
     * Configuration errors are reported as a failed result rather than thrown.
     *
     * @param configFile Path to the JSON configuration file; empty for defaults.
     * @param request Populated request.
     * @param token Lets the caller abort the migration.
     * @return MigrationResult Structured outcome.
     */
    static MigrationResult startMigration(const std::string& configFile, const MigrationRequest& request,
                                          CancellationToken& token);

    /**
     * @brief Runs only the destination conflict check.
     *
     * @param configFile Path to the JSON configuration file; empty for defaults.
     * @param request Request whose destination, username and domain are checked.
     * @param token Lets the caller abort the probe.
     * @return MigrationResult Result whose conflict field holds the outcome; success means the
     * transfer would be allowed.
     */
    static MigrationResult checkConflicts(const std::string& configFile, const MigrationRequest& request,
                                          CancellationToken& token);
};

#endif // MIGRATION_API_HPP
