/**
 * @file migration_types.hpp
 * @brief Core value types shared by every cpmigrate component.
 *
 * Describes the migration request, the conflict and error taxonomies, the pipeline
 * stages, and the structured result handed back to callers. All types are plain
 * values; none of them owns a network resource.
 */

#ifndef MIGRATION_TYPES_HPP
#define MIGRATION_TYPES_HPP

#include <string>
#include <optional>
#include <expected>
#include <cstdint>

/**
 * @brief Login credentials for a remote host.
 *
 * An empty password selects key-based authentication where the transport supports it.
 */
struct Credentials {
    std::string user;     ///< Login name (cPanel user on the source, root on the destination).
    std::string password; ///< Plain password, never persisted or logged.
};

/**
 * @brief A fully populated request to move one account.
 */
struct MigrationRequest {
    std::string sourceHost;              ///< Host running the account today.
    Credentials sourceCredentials;       ///< Credentials for the source job-control API.
    std::string destinationHost;         ///< Host receiving the account.
    Credentials destinationCredentials;  ///< Credentials for the destination shell.
    std::string username;                ///< Account username.
    std::string domain;                  ///< Primary domain of the account.
    bool overwrite = false;              ///< Consent to replace an identical existing account.
};

/**
 * @brief Classification of a destination collision.
 */
enum class ConflictOutcome {
    NoConflict,
    OverwriteAllowed,
    UsernameConflict,
    DomainConflict,
    ConnectionError
};

/**
 * @brief Stages a migration passes through, in order.
 */
enum class PipelineStage {
    Idle,
    Validating,
    CheckingConflicts,
    Triggering,
    Polling,
    Downloading,
    Uploading,
    Restoring,
    Completed,
    Failed
};

/**
 * @brief Machine-checkable failure kinds.
 */
enum class ErrorKind {
    None,
    ValidationError,
    ConnectionError,
    UsernameConflict,
    DomainConflict,
    OverwriteNotConfirmed,
    TriggerFailed,
    BackupFailed,
    BackupTimeout,
    DownloadError,
    UploadError,
    RestoreError,
    Cancelled
};

/**
 * @brief Error value carried through the pipeline.
 */
struct MigrationError {
    ErrorKind kind = ErrorKind::None; ///< What went wrong.
    std::string detail;               ///< Human-readable explanation.
};

enum class BackupJobStatus {
    Pending,
    Ready,
    Failed
};

/**
 * @brief Snapshot of a source-side backup job, as seen by one poll.
 */
struct BackupJobHandle {
    BackupJobStatus status = BackupJobStatus::Pending;
    std::optional<std::string> downloadReference; ///< Set once the job is Ready.
    int elapsedSeconds = 0;                       ///< Logical time spent polling so far.
};

/**
 * @brief A backup archive staged on local disk on its way to the destination.
 */
struct TransferArtifact {
    std::string localPath;
    std::string remotePath;
    std::uintmax_t sizeBytes = 0; ///< Best effort; zero when unknown.
};

/**
 * @brief The single structured output of a migration.
 */
struct MigrationResult {
    bool success = false;
    ConflictOutcome conflict = ConflictOutcome::NoConflict; ///< Outcome of the destination probe.
    ErrorKind error = ErrorKind::None;                      ///< Failure kind, None on success.
    PipelineStage stage = PipelineStage::Idle;              ///< Furthest stage reached.
    std::string detail;                                     ///< Human-readable summary.
    std::string transcript;                                 ///< Captured remote output.
    std::optional<int> exitStatus;                          ///< Restore exit status, when it ran.
};

/**
 * @brief Checks that every field needed for network I/O is present.
 *
 * @param request Request to check.
 * @return std::expected<void, MigrationError> Success or a ValidationError naming the first empty field.
 */
std::expected<void, MigrationError> validateRequest(const MigrationRequest& request);

/**
 * @brief Builds the key used to serialize migrations of the same destination account.
 */
std::string migrationKey(const MigrationRequest& request);

std::string toString(ConflictOutcome outcome);
std::string toString(PipelineStage stage);
std::string toString(ErrorKind kind);
std::string toString(BackupJobStatus status);

#endif // MIGRATION_TYPES_HPP
