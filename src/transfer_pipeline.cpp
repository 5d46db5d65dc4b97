#include "transfer_pipeline.hpp"
#include "cancellation.hpp"
#include <chrono>
#include <filesystem>
#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace {

/**
 * @brief Removes the local copy of the artifact when the run ends, whatever the outcome.
 */
class ArtifactCleanup {
public:
    ArtifactCleanup(const MigrationConfig& config, const TransferArtifact& artifact)
        : config(config), artifact(artifact) {}

    ArtifactCleanup(const ArtifactCleanup&) = delete;
    ArtifactCleanup& operator=(const ArtifactCleanup&) = delete;

    ~ArtifactCleanup() {
        if (artifact.localPath.empty()) {
            return;
        }
        std::error_code ec;
        if (fs::remove(artifact.localPath, ec)) {
            config.logMessage(std::format("Removed local artifact: {}", artifact.localPath));
        } else if (ec) {
            config.logError(std::format("Failed to remove local artifact: {} (error: {})", artifact.localPath, ec.message()));
        }
    }

private:
    const MigrationConfig& config;
    const TransferArtifact& artifact;
};

// Converts an exception escaping a stage into that stage's error.
template <typename F>
auto guarded(ErrorKind kind, const char* activity, F&& body) -> decltype(body()) {
    try {
        return body();
    } catch (const std::exception& e) {
        return std::unexpected(MigrationError{kind, std::format("Unexpected error while {}: {}", activity, e.what())});
    } catch (...) {
        return std::unexpected(MigrationError{kind, std::format("Unexpected unknown error while {}", activity)});
    }
}

// A transport call that fails once the token has fired was aborted by the cancellation.
MigrationError transportError(ErrorKind kind, std::string detail, const CancellationToken& token) {
    return {token.isCancelled() ? ErrorKind::Cancelled : kind, std::move(detail)};
}

MigrationError cancelled(const std::string& activity) {
    return {ErrorKind::Cancelled, std::format("Migration cancelled while {}", activity)};
}

} // namespace

TransferPipeline::TransferPipeline(const MigrationConfig& config, BackupJobApi& jobs, HttpClient& http,
                                   RemoteConnector& connector, ProgressSink* sink)
    : config(config), jobs(jobs), http(http), connector(connector), sink(sink) {}

std::expected<std::string, std::string> TransferPipeline::artifactFilename(const std::string& downloadReference) {
    std::string path = downloadReference;
    auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        auto pathStart = path.find('/', scheme + 3);
        path = pathStart == std::string::npos ? std::string() : path.substr(pathStart);
    }
    auto queryStart = path.find_first_of("?#");
    if (queryStart != std::string::npos) {
        path.resize(queryStart);
    }
    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    if (name.empty() || name == "." || name == "..") {
        return std::unexpected(std::format("Download reference has no usable filename: {}", downloadReference));
    }
    return name;
}

void TransferPipeline::publish(const std::string& message) {
    if (sink) {
        sink->publish(ProgressEvent{stage_, message});
    }
}

void TransferPipeline::transition(PipelineStage next, const std::string& message) {
    stage_ = next;
    publish(message);
}

MigrationResult TransferPipeline::fail(MigrationResult result, const MigrationError& error) {
    result.success = false;
    result.stage = stage_;
    result.error = error.kind;
    result.detail = error.detail;
    if (!result.transcript.empty() && result.transcript.back() != '\n') {
        result.transcript += '\n';
    }
    result.transcript += error.detail;

    config.logError(std::format("Migration failed at {} ({}): {}", toString(result.stage), toString(result.error), error.detail));
    stage_ = PipelineStage::Failed;
    publish(error.detail);
    return result;
}

MigrationResult TransferPipeline::execute(const MigrationRequest& request, const CancellationToken& token) {
    MigrationResult result;
    stage_ = PipelineStage::Idle;

    transition(PipelineStage::Triggering, std::format("Requesting backup of {} on {}", request.username, request.sourceHost));
    if (token.isCancelled()) {
        return fail(std::move(result), cancelled("triggering the backup"));
    }
    auto ticket = guarded(ErrorKind::TriggerFailed, "triggering the backup", [&]() -> std::expected<JobTicket, MigrationError> {
        auto triggered = jobs.trigger(request.sourceHost, request.sourceCredentials);
        if (!triggered) {
            return std::unexpected(transportError(ErrorKind::TriggerFailed,
                                                  std::format("Backup trigger failed: {}", triggered.error()), token));
        }
        return *triggered;
    });
    if (!ticket) {
        return fail(std::move(result), ticket.error());
    }

    transition(PipelineStage::Polling, "Waiting for the backup to complete");
    auto reference = guarded(ErrorKind::BackupFailed, "waiting for the backup", [&] { return awaitBackup(*ticket, token); });
    if (!reference) {
        return fail(std::move(result), reference.error());
    }

    TransferArtifact artifact;
    ArtifactCleanup cleanup(config, artifact);

    transition(PipelineStage::Downloading, std::format("Downloading {}", *reference));
    auto downloaded = guarded(ErrorKind::DownloadError, "downloading the backup",
                              [&] { return download(*reference, request, artifact, token); });
    if (!downloaded) {
        return fail(std::move(result), downloaded.error());
    }

    transition(PipelineStage::Uploading, std::format("Connecting to {}", request.destinationHost));
    if (token.isCancelled()) {
        return fail(std::move(result), cancelled("connecting to the destination"));
    }
    auto session = guarded(ErrorKind::ConnectionError, "connecting to the destination",
                           [&]() -> std::expected<std::unique_ptr<RemoteSession>, MigrationError> {
        auto opened = connector.connect(request.destinationHost, request.destinationCredentials, config.sshConnectTimeout);
        if (!opened) {
            return std::unexpected(transportError(ErrorKind::ConnectionError,
                std::format("Unable to connect to the destination server: {}", opened.error()), token));
        }
        return std::move(*opened);
    });
    if (!session) {
        return fail(std::move(result), session.error());
    }

    auto uploaded = guarded(ErrorKind::UploadError, "uploading the backup",
                            [&] { return upload(**session, artifact, token); });
    if (!uploaded) {
        return fail(std::move(result), uploaded.error());
    }

    transition(PipelineStage::Restoring, std::format("Restoring {} on {}", artifact.remotePath, request.destinationHost));
    auto exitStatus = guarded(ErrorKind::RestoreError, "restoring the account",
                              [&] { return restore(**session, artifact, result.transcript, token); });
    if (!exitStatus) {
        return fail(std::move(result), exitStatus.error());
    }
    result.exitStatus = *exitStatus;
    if (*exitStatus != 0) {
        return fail(std::move(result),
                    MigrationError{ErrorKind::RestoreError, std::format("Restore exited with status {}", *exitStatus)});
    }

    result.success = true;
    result.error = ErrorKind::None;
    result.stage = PipelineStage::Completed;
    result.detail = "Transfer completed successfully!";
    transition(PipelineStage::Completed, result.detail);
    config.logMessage(std::format("Migrated {} ({}) from {} to {}", request.username, request.domain,
                                  request.sourceHost, request.destinationHost));
    return result;
}

std::expected<std::string, MigrationError> TransferPipeline::awaitBackup(const JobTicket& ticket,
                                                                         const CancellationToken& token) {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    using std::chrono::steady_clock;

    // Elapsed time is the intervals waited plus the measured duration of every status call,
    // so a slow status endpoint eats into the ceiling instead of extending it.
    milliseconds elapsed{0};
    int attempt = 0;
    while (elapsed < config.pollCeiling) {
        if (token.isCancelled()) {
            return std::unexpected(cancelled("waiting for the backup"));
        }
        ++attempt;

        BackupJobHandle handle;
        auto pollStarted = steady_clock::now();
        try {
            handle = jobs.pollOnce(ticket, config.pollCeiling - elapsed);
        } catch (const std::exception& e) {
            config.logWarning(std::format("Backup status poll {} failed: {}", attempt, e.what()));
        } catch (...) {
            config.logWarning(std::format("Backup status poll {} failed with an unknown error", attempt));
        }
        auto pollTook = duration_cast<milliseconds>(steady_clock::now() - pollStarted);
        handle.elapsedSeconds = static_cast<int>(duration_cast<std::chrono::seconds>(elapsed).count());
        publish(std::format("Poll {} after {}s: {}", attempt, handle.elapsedSeconds, toString(handle.status)));

        if (handle.status == BackupJobStatus::Failed) {
            return std::unexpected(MigrationError{ErrorKind::BackupFailed, "The source reported that the backup failed"});
        }
        if (handle.status == BackupJobStatus::Ready) {
            if (handle.downloadReference && !handle.downloadReference->empty()) {
                return *handle.downloadReference;
            }
            config.logWarning("Backup reported ready without a download reference");
        }

        elapsed += pollTook;
        if (elapsed >= config.pollCeiling) {
            break;
        }
        elapsed += config.pollInterval;
        if (elapsed >= config.pollCeiling) {
            break;
        }
        if (!token.sleepFor(config.pollInterval)) {
            return std::unexpected(cancelled("waiting for the backup"));
        }
    }
    return std::unexpected(MigrationError{ErrorKind::BackupTimeout,
        std::format("Backup was not ready after {} polls ({}s)", attempt,
                    duration_cast<std::chrono::seconds>(config.pollCeiling).count())});
}

std::expected<void, MigrationError> TransferPipeline::download(const std::string& reference,
                                                               const MigrationRequest& request,
                                                               TransferArtifact& artifact,
                                                               const CancellationToken& token) {
    auto name = artifactFilename(reference);
    if (!name) {
        return std::unexpected(MigrationError{ErrorKind::DownloadError, name.error()});
    }

    std::error_code ec;
    fs::create_directories(config.localRoot, ec);
    if (ec) {
        return std::unexpected(MigrationError{ErrorKind::DownloadError,
            std::format("Failed to create staging directory {}: {}", config.localRoot, ec.message())});
    }
    fs::permissions(config.localRoot, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        config.logWarning(std::format("Could not restrict permissions on {}: {}", config.localRoot, ec.message()));
    }

    artifact.localPath = (fs::path(config.localRoot) / *name).string();
    artifact.remotePath = config.remoteRoot + *name;

    auto bytes = http.download(reference, request.sourceCredentials, artifact.localPath, token);
    if (!bytes) {
        return std::unexpected(transportError(ErrorKind::DownloadError,
                                              std::format("Backup download failed: {}", bytes.error()), token));
    }
    artifact.sizeBytes = *bytes;
    publish(std::format("Downloaded {} bytes to {}", artifact.sizeBytes, artifact.localPath));
    return {};
}

std::expected<void, MigrationError> TransferPipeline::upload(RemoteSession& session, TransferArtifact& artifact,
                                                             const CancellationToken& token) {
    auto pushed = session.pushFile(artifact.localPath, artifact.remotePath, token);
    if (!pushed) {
        return std::unexpected(transportError(ErrorKind::UploadError,
                                              std::format("Upload failed: {}", pushed.error()), token));
    }
    if (artifact.sizeBytes == 0) {
        artifact.sizeBytes = *pushed;
    }
    publish(std::format("Uploaded {} bytes to {}", *pushed, artifact.remotePath));
    return {};
}

std::expected<int, MigrationError> TransferPipeline::restore(RemoteSession& session, const TransferArtifact& artifact,
                                                             std::string& transcript, const CancellationToken& token) {
    std::string command = std::format("{} {}", config.restoreTool, shellQuote(artifact.remotePath));
    config.logMessage(std::format("Executing command: {}", command));

    auto stream = session.runStreaming(command);
    if (!stream) {
        return std::unexpected(transportError(ErrorKind::RestoreError,
                                              std::format("Failed to start restore: {}", stream.error()), token));
    }

    auto started = std::chrono::steady_clock::now();
    while (true) {
        if (token.isCancelled()) {
            return std::unexpected(cancelled("restoring the account"));
        }
        if (std::chrono::steady_clock::now() - started > config.restoreCeiling) {
            return std::unexpected(MigrationError{ErrorKind::RestoreError,
                std::format("Restore did not finish within {}s",
                            std::chrono::duration_cast<std::chrono::seconds>(config.restoreCeiling).count())});
        }

        auto chunk = (*stream)->read(config.restoreReadInterval);
        if (!chunk) {
            return std::unexpected(transportError(ErrorKind::RestoreError, chunk.error(), token));
        }
        if (!chunk->data.empty()) {
            transcript += chunk->data;
            publish(chunk->data);
        }
        if (chunk->finished) {
            break;
        }
    }

    auto status = (*stream)->exitStatus();
    if (!status) {
        return std::unexpected(MigrationError{ErrorKind::RestoreError, status.error()});
    }
    publish(std::format("Restore exited with status {}", *status));
    return *status;
}
