/**
 * @file backup_job_client.hpp
 * @brief Source-side backup job control.
 *
 * Triggers a full account backup through the source host's job-control API and polls
 * it until a download reference appears.
 */

#ifndef BACKUP_JOB_CLIENT_HPP
#define BACKUP_JOB_CLIENT_HPP

#include <string>
#include <chrono>
#include <expected>
#include <json/json.h>
#include "migration_config.hpp"
#include "migration_types.hpp"
#include "http_client.hpp"

class CancellationToken;

/**
 * @brief Identifies a triggered backup job.
 */
struct JobTicket {
    std::string sourceHost;
    Credentials credentials;
    std::string jobId; ///< Job identifier returned by the trigger, empty if none was given.
};

/**
 * @brief Interface for backup job control.
 */
class BackupJobApi {
public:
    virtual ~BackupJobApi() = default;

    /**
     * @brief Starts a backup. Called once per migration; failures are not retried.
     *
     * @param sourceHost Host that holds the account.
     * @param credentials Account credentials for the API.
     * @return std::expected<JobTicket, std::string> Ticket or the reason the trigger was rejected.
     */
    virtual std::expected<JobTicket, std::string> trigger(const std::string& sourceHost,
                                                          const Credentials& credentials) = 0;

    /**
     * @brief Checks the job once.
     *
     * Errors reaching or parsing the status endpoint are reported as Pending.
     *
     * @param ticket Job to check.
     * @param timeout Longest the status request may take.
     */
    virtual BackupJobHandle pollOnce(const JobTicket& ticket, std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief cPanel UAPI implementation of BackupJobApi.
 *
 * Expects UAPI envelopes of the form {"status": 1, "data": {...}, "errors": [...]}; a ready
 * job carries data.download_url.
 */
class CpanelBackupJobClient : public BackupJobApi {
public:
    CpanelBackupJobClient(const MigrationConfig& config, HttpClient& http, const CancellationToken& token);

    std::expected<JobTicket, std::string> trigger(const std::string& sourceHost,
                                                  const Credentials& credentials) override;

    BackupJobHandle pollOnce(const JobTicket& ticket, std::chrono::milliseconds timeout) override;

    /**
     * @brief Returns https://host:port for a bare host, or the host unchanged if it has a scheme.
     */
    std::string baseUrl(const std::string& sourceHost) const;

    /**
     * @brief Resolves a download reference against the API base when it is relative.
     */
    std::string resolveReference(const std::string& sourceHost, const std::string& reference) const;

    /**
     * @brief Interprets a status response body.
     *
     * @param body Raw response body.
     * @return std::expected<BackupJobHandle, std::string> Handle or a parse error.
     */
    static std::expected<BackupJobHandle, std::string> parseStatus(const std::string& body);

private:
    const MigrationConfig& config;
    HttpClient& http;
    const CancellationToken& token;
};

#endif // BACKUP_JOB_CLIENT_HPP
