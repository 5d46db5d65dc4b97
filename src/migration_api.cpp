#include "migration_api.hpp"
#include "backup_job_client.hpp"
#include "cancellation.hpp"
#include "http_client.hpp"
#include "migration_config.hpp"
#include "migration_lock.hpp"
#include "migrator.hpp"
#include "progress.hpp"
#include "ssh_session.hpp"
#include "transfer_pipeline.hpp"
#include <format>
#include <memory>

namespace {

// Shared by every migration started in this process.
MigrationLockRegistry& processLocks() {
    static MigrationLockRegistry locks;
    return locks;
}

std::expected<std::unique_ptr<MigrationConfig>, std::string> loadConfig(const std::string& configFile) {
    try {
        if (configFile.empty()) {
            return std::make_unique<MigrationConfig>();
        }
        return std::make_unique<MigrationConfig>(configFile);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to load configuration: {}", e.what()));
    }
}

MigrationResult configFailure(const std::string& detail) {
    MigrationResult result;
    result.error = ErrorKind::ValidationError;
    result.stage = PipelineStage::Validating;
    result.detail = detail;
    return result;
}

/**
 * @brief Owns the production collaborators of one migration.
 */
struct MigrationStack {
    MigrationStack(const MigrationConfig& config, const CancellationToken& token)
        : connector(config.sshPort, config.strictHostKeyChecking, config.sshCommandTimeout),
          http(config.verifyTls, config.apiRequestTimeout, config.downloadChunkSize),
          jobs(config, http, token),
          sink(config),
          pipeline(config, jobs, http, connector, &sink),
          migrator(config, connector, pipeline, processLocks(), &sink) {}

    SshConnector connector;
    CurlHttpClient http;
    CpanelBackupJobClient jobs;
    LogProgressSink sink;
    TransferPipeline pipeline;
    Migrator migrator;
};

} // namespace

MigrationResult MigrationAPI::startMigration(const std::string& configFile, const MigrationRequest& request,
                                             CancellationToken& token) {
    auto config = loadConfig(configFile);
    if (!config) {
        return configFailure(config.error());
    }
    if ((*config)->migrationTimeout.count() > 0) {
        token.expireAfter((*config)->migrationTimeout);
    }
    MigrationStack stack(**config, token);
    return stack.migrator.migrate(request, token);
}

MigrationResult MigrationAPI::checkConflicts(const std::string& configFile, const MigrationRequest& request,
                                             CancellationToken& token) {
    auto config = loadConfig(configFile);
    if (!config) {
        return configFailure(config.error());
    }
    auto valid = validateRequest(request);
    if (!valid) {
        return configFailure(valid.error().detail);
    }

    MigrationStack stack(**config, token);
    MigrationResult result;
    result.stage = PipelineStage::CheckingConflicts;
    result.conflict = stack.migrator.checkConflicts(request, token);
    result.success = allowsTransfer(result.conflict, request.overwrite);
    result.detail = std::format("Conflict check result: {}", toString(result.conflict));
    if (!result.success) {
        switch (result.conflict) {
            case ConflictOutcome::ConnectionError: result.error = ErrorKind::ConnectionError; break;
            case ConflictOutcome::UsernameConflict: result.error = ErrorKind::UsernameConflict; break;
            case ConflictOutcome::DomainConflict: result.error = ErrorKind::DomainConflict; break;
            case ConflictOutcome::OverwriteAllowed: result.error = ErrorKind::OverwriteNotConfirmed; break;
            case ConflictOutcome::NoConflict: break;
        }
    }
    return result;
}
