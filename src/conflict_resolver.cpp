#include "conflict_resolver.hpp"
#include <sstream>

bool recordOwnedBy(const std::string& domainRecordText, const std::string& username, ConflictMatchMode mode) {
    if (mode == ConflictMatchMode::Substring) {
        return domainRecordText.find(username) != std::string::npos;
    }

    std::istringstream lines(domainRecordText);
    std::string line;
    while (std::getline(lines, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string ownerPath = line.substr(0, colon);
        auto slash = ownerPath.find_last_of('/');
        std::string owner = slash == std::string::npos ? ownerPath : ownerPath.substr(slash + 1);
        if (owner == username) {
            return true;
        }
    }
    return false;
}

ConflictOutcome resolveConflict(const std::expected<ProbeResult, std::string>& probe,
                                const std::string& username,
                                ConflictMatchMode mode) {
    if (!probe) {
        return ConflictOutcome::ConnectionError;
    }
    bool domainFound = !probe->domainRecordText.empty();
    if (probe->usernameFound && domainFound) {
        return recordOwnedBy(probe->domainRecordText, username, mode) ? ConflictOutcome::OverwriteAllowed
                                                                      : ConflictOutcome::UsernameConflict;
    }
    if (domainFound) {
        return ConflictOutcome::DomainConflict;
    }
    return ConflictOutcome::NoConflict;
}

bool allowsTransfer(ConflictOutcome outcome, bool overwrite) {
    return outcome == ConflictOutcome::NoConflict || (outcome == ConflictOutcome::OverwriteAllowed && overwrite);
}
