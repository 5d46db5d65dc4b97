#include "migration_types.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace {

bool isBlank(const std::string& value) {
    return std::ranges::all_of(value, [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string lowercase(std::string value) {
    std::ranges::transform(value, value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::expected<void, MigrationError> validateRequest(const MigrationRequest& request) {
    const std::pair<const char*, const std::string*> required[] = {
        {"source host", &request.sourceHost},
        {"source user", &request.sourceCredentials.user},
        {"destination host", &request.destinationHost},
        {"destination user", &request.destinationCredentials.user},
        {"username", &request.username},
        {"domain", &request.domain},
    };
    for (const auto& [name, value] : required) {
        if (isBlank(*value)) {
            return std::unexpected(MigrationError{ErrorKind::ValidationError,
                                                  std::format("Missing required field: {}", name)});
        }
    }
    return {};
}

std::string migrationKey(const MigrationRequest& request) {
    return std::format("{}|{}|{}", lowercase(request.destinationHost), request.username, lowercase(request.domain));
}

std::string toString(ConflictOutcome outcome) {
    switch (outcome) {
        case ConflictOutcome::NoConflict: return "no_conflict";
        case ConflictOutcome::OverwriteAllowed: return "overwrite_allowed";
        case ConflictOutcome::UsernameConflict: return "username_conflict";
        case ConflictOutcome::DomainConflict: return "domain_conflict";
        case ConflictOutcome::ConnectionError: return "connection_error";
    }
    return "unknown";
}

std::string toString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Idle: return "idle";
        case PipelineStage::Validating: return "validating";
        case PipelineStage::CheckingConflicts: return "checking_conflicts";
        case PipelineStage::Triggering: return "triggering";
        case PipelineStage::Polling: return "polling";
        case PipelineStage::Downloading: return "downloading";
        case PipelineStage::Uploading: return "uploading";
        case PipelineStage::Restoring: return "restoring";
        case PipelineStage::Completed: return "completed";
        case PipelineStage::Failed: return "failed";
    }
    return "unknown";
}

std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::ValidationError: return "validation_error";
        case ErrorKind::ConnectionError: return "connection_error";
        case ErrorKind::UsernameConflict: return "username_conflict";
        case ErrorKind::DomainConflict: return "domain_conflict";
        case ErrorKind::OverwriteNotConfirmed: return "overwrite_not_confirmed";
        case ErrorKind::TriggerFailed: return "trigger_failed";
        case ErrorKind::BackupFailed: return "backup_failed";
        case ErrorKind::BackupTimeout: return "backup_timeout";
        case ErrorKind::DownloadError: return "download_error";
        case ErrorKind::UploadError: return "upload_error";
        case ErrorKind::RestoreError: return "restore_error";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string toString(BackupJobStatus status) {
    switch (status) {
        case BackupJobStatus::Pending: return "pending";
        case BackupJobStatus::Ready: return "ready";
        case BackupJobStatus::Failed: return "failed";
    }
    return "unknown";
}
