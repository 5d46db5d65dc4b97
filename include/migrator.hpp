/**
 * @file migrator.hpp
 * @brief Entry point for migrating one account.
 *
 * Runs the destination conflict check first and starts the transfer only when the
 * outcome allows it. A conflict stops the request before anything is changed on the
 * destination.
 */

#ifndef MIGRATOR_HPP
#define MIGRATOR_HPP

#include <string>
#include <expected>
#include "conflict_resolver.hpp"
#include "migration_config.hpp"
#include "migration_lock.hpp"
#include "migration_types.hpp"
#include "progress.hpp"
#include "registry_prober.hpp"
#include "remote_session.hpp"
#include "transfer_pipeline.hpp"

class CancellationToken;

class Migrator {
public:
    /**
     * @brief Constructs a migrator.
     *
     * @param config Configuration and logging.
     * @param connector Opens the destination session used for the conflict probe.
     * @param transfer Pipeline run once conflicts are cleared.
     * @param locks Registry serializing migrations of the same destination account.
     * @param sink Optional progress sink; may be null.
     */
    Migrator(const MigrationConfig& config, RemoteConnector& connector, AccountTransferStrategy& transfer,
             MigrationLockRegistry& locks, ProgressSink* sink = nullptr);

    /**
     * @brief Migrates an account using the configured overall deadline.
     */
    MigrationResult migrate(const MigrationRequest& request);

    /**
     * @brief Migrates an account.
     *
     * @param request Request to carry out.
     * @param token Aborts the migration when cancelled.
     * @return MigrationResult Structured outcome; success is false for every conflict or failure.
     */
    MigrationResult migrate(const MigrationRequest& request, const CancellationToken& token);

    /**
     * @brief Runs only the destination conflict check.
     *
     * @return ConflictOutcome Outcome of the probe, ConnectionError if it could not run.
     */
    ConflictOutcome checkConflicts(const MigrationRequest& request, const CancellationToken& token);

private:
    std::expected<ProbeResult, std::string> probeDestination(const MigrationRequest& request,
                                                             const CancellationToken& token);
    void publish(PipelineStage stage, const std::string& message);

    const MigrationConfig& config;
    RemoteConnector& connector;
    AccountTransferStrategy& transfer;
    MigrationLockRegistry& locks;
    ProgressSink* sink;
    RegistryProber prober;
};

#endif // MIGRATOR_HPP
