/**
 * @file transfer_pipeline.hpp
 * @brief Backup, transfer and restore of one account.
 *
 * The pipeline runs strictly in order:
 * Idle -> Triggering -> Polling -> Downloading -> Uploading -> Restoring -> Completed|Failed.
 * There are no back-edges and no automatic retries apart from soft-failed backup polls.
 * Nothing done on the destination is rolled back; a failure reports the furthest stage
 * reached together with the transcript captured so far.
 */

#ifndef TRANSFER_PIPELINE_HPP
#define TRANSFER_PIPELINE_HPP

#include <string>
#include <expected>
#include "backup_job_client.hpp"
#include "http_client.hpp"
#include "migration_config.hpp"
#include "migration_types.hpp"
#include "progress.hpp"
#include "remote_session.hpp"

class CancellationToken;

/**
 * @brief Interface for moving an account once conflicts have been cleared.
 */
class AccountTransferStrategy {
public:
    virtual ~AccountTransferStrategy() = default;

    /**
     * @brief Moves the account described by the request.
     *
     * @param request Validated request whose conflict check allowed the transfer.
     * @param token Aborts the transfer when cancelled.
     * @return MigrationResult Terminal state, error kind, and transcript.
     */
    virtual MigrationResult execute(const MigrationRequest& request, const CancellationToken& token) = 0;
};

/**
 * @brief The backup -> download -> upload -> restore pipeline.
 */
class TransferPipeline : public AccountTransferStrategy {
public:
    /**
     * @brief Constructs a pipeline over its collaborators.
     *
     * @param config Paths, polling and restore bounds, restore tool.
     * @param jobs Source backup job control.
     * @param http Client used to download the artifact.
     * @param connector Opens the destination session for upload and restore.
     * @param sink Optional progress sink; may be null.
     */
    TransferPipeline(const MigrationConfig& config, BackupJobApi& jobs, HttpClient& http,
                     RemoteConnector& connector, ProgressSink* sink = nullptr);

    MigrationResult execute(const MigrationRequest& request, const CancellationToken& token) override;

    /**
     * @brief Current state of the most recent run.
     */
    PipelineStage stage() const { return stage_; }

    /**
     * @brief Extracts the artifact filename from a download reference.
     *
     * Returns the last path segment with any query or fragment removed. The name is
     * never altered otherwise.
     *
     * @param downloadReference URL or path returned by the backup job.
     * @return std::expected<std::string, std::string> Filename, or an error if it is empty, "." or "..".
     */
    static std::expected<std::string, std::string> artifactFilename(const std::string& downloadReference);

private:
    std::expected<std::string, MigrationError> awaitBackup(const JobTicket& ticket, const CancellationToken& token);
    std::expected<void, MigrationError> download(const std::string& reference, const MigrationRequest& request,
                                                 TransferArtifact& artifact, const CancellationToken& token);
    std::expected<void, MigrationError> upload(RemoteSession& session, TransferArtifact& artifact,
                                               const CancellationToken& token);
    std::expected<int, MigrationError> restore(RemoteSession& session, const TransferArtifact& artifact,
                                               std::string& transcript, const CancellationToken& token);

    void transition(PipelineStage next, const std::string& message);
    void publish(const std::string& message);
    MigrationResult fail(MigrationResult result, const MigrationError& error);

    const MigrationConfig& config;
    BackupJobApi& jobs;
    HttpClient& http;
    RemoteConnector& connector;
    ProgressSink* sink;
    PipelineStage stage_ = PipelineStage::Idle;
};

#endif // TRANSFER_PIPELINE_HPP
