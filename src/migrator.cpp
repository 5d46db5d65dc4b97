#include "migrator.hpp"
#include "cancellation.hpp"
#include <format>

namespace {

MigrationResult blocked(ConflictOutcome outcome, ErrorKind kind, std::string detail, std::string transcript = {}) {
    MigrationResult result;
    result.success = false;
    result.conflict = outcome;
    result.error = kind;
    result.stage = PipelineStage::CheckingConflicts;
    result.detail = std::move(detail);
    result.transcript = std::move(transcript);
    return result;
}

} // namespace

Migrator::Migrator(const MigrationConfig& config, RemoteConnector& connector, AccountTransferStrategy& transfer,
                   MigrationLockRegistry& locks, ProgressSink* sink)
    : config(config), connector(connector), transfer(transfer), locks(locks), sink(sink), prober(config) {}

void Migrator::publish(PipelineStage stage, const std::string& message) {
    if (sink) {
        sink->publish(ProgressEvent{stage, message});
    }
}

std::expected<ProbeResult, std::string> Migrator::probeDestination(const MigrationRequest& request,
                                                                   const CancellationToken& token) {
    if (token.isCancelled()) {
        return std::unexpected("Cancelled before connecting to the destination");
    }
    try {
        config.logMessage(std::format("Connecting to destination server: {}", request.destinationHost));
        auto session = connector.connect(request.destinationHost, request.destinationCredentials, config.sshConnectTimeout);
        if (!session) {
            return std::unexpected(session.error());
        }
        return prober.probe(**session, request.username, request.domain, token);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Error checking destination: {}", e.what()));
    }
}

ConflictOutcome Migrator::checkConflicts(const MigrationRequest& request, const CancellationToken& token) {
    auto probe = probeDestination(request, token);
    if (!probe) {
        config.logError(std::format("Error connecting or executing commands on destination: {}", probe.error()));
    }
    return resolveConflict(probe, request.username, config.matchMode);
}

MigrationResult Migrator::migrate(const MigrationRequest& request) {
    CancellationToken token(config.migrationTimeout);
    return migrate(request, token);
}

MigrationResult Migrator::migrate(const MigrationRequest& request, const CancellationToken& token) {
    publish(PipelineStage::Validating, "Validating request");
    auto valid = validateRequest(request);
    if (!valid) {
        MigrationResult result;
        result.error = ErrorKind::ValidationError;
        result.stage = PipelineStage::Validating;
        result.detail = valid.error().detail;
        config.logError(std::format("Rejected migration request: {}", result.detail));
        return result;
    }

    config.logMessage(std::format("Received transfer request for username: {}, domain: {}", request.username, request.domain));

    auto guard = locks.acquire(migrationKey(request), token);
    if (!guard) {
        MigrationResult result;
        result.error = guard.error().kind;
        result.stage = PipelineStage::Validating;
        result.detail = guard.error().detail;
        return result;
    }

    publish(PipelineStage::CheckingConflicts, std::format("Checking {} for existing accounts", request.destinationHost));
    auto probe = probeDestination(request, token);
    if (!probe) {
        config.logError(std::format("Error connecting or executing commands on destination: {}", probe.error()));
    }
    ConflictOutcome outcome = resolveConflict(probe, request.username, config.matchMode);
    config.logMessage(std::format("Conflict check for {} on {}: {}", request.username, request.destinationHost, toString(outcome)));

    switch (outcome) {
        case ConflictOutcome::ConnectionError:
            if (token.isCancelled()) {
                return blocked(outcome, ErrorKind::Cancelled, "Migration cancelled while checking the destination");
            }
            return blocked(outcome, ErrorKind::ConnectionError,
                           "Unable to connect to the destination server. Verify credentials and network connectivity.",
                           probe.error());
        case ConflictOutcome::UsernameConflict:
            return blocked(outcome, ErrorKind::UsernameConflict,
                           "The domain exists with a different username on the destination. Please update the username on the destination first.",
                           probe->domainRecordText);
        case ConflictOutcome::DomainConflict:
            return blocked(outcome, ErrorKind::DomainConflict,
                           "The domain already belongs to another account on the destination. Remove it there before migrating.",
                           probe->domainRecordText);
        case ConflictOutcome::OverwriteAllowed:
            if (!request.overwrite) {
                return blocked(outcome, ErrorKind::OverwriteNotConfirmed,
                               "An account with this domain and username already exists. Check the overwrite option to proceed.",
                               probe->domainRecordText);
            }
            config.logWarning(std::format("Overwriting existing account {} on {}", request.username, request.destinationHost));
            break;
        case ConflictOutcome::NoConflict:
            break;
    }

    MigrationResult result = transfer.execute(request, token);
    result.conflict = outcome;
    if (!result.success && result.detail.empty()) {
        result.detail = "Transfer failed. Please review logs and try again.";
    }
    return result;
}
