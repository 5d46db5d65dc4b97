#include "registry_prober.hpp"
#include "cancellation.hpp"
#include <format>
#include <string_view>

namespace {

std::string trim(const std::string& text) {
    constexpr std::string_view whitespace = " \t\r\n";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return {};
    }
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::string regexEscape(const std::string& value) {
    constexpr std::string_view special = ".^$*+?()[]{}|\\";
    std::string escaped;
    for (char c : value) {
        if (special.find(c) != std::string_view::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

} // namespace

RegistryProber::RegistryProber(const MigrationConfig& config) : config(config) {}

std::string RegistryProber::ownerCommand(const std::string& username) const {
    return std::format("{} {}", config.ownerCommand, shellQuote(username));
}

std::string RegistryProber::domainCommand(const std::string& domain) const {
    if (config.matchMode == ConflictMatchMode::Exact) {
        return std::format("grep -R -E -- {} {}", shellQuote(std::format("^DNS[0-9]*={}$", regexEscape(domain))),
                           shellQuote(config.usersPath));
    }
    return std::format("grep -R -F -- {} {}", shellQuote(domain), shellQuote(config.usersPath));
}

std::expected<ProbeResult, std::string> RegistryProber::probe(RemoteSession& session,
                                                              const std::string& username,
                                                              const std::string& domain,
                                                              const CancellationToken& token) const {
    if (token.isCancelled()) {
        return std::unexpected("Registry lookup cancelled");
    }
    auto cmdUsername = ownerCommand(username);
    config.logMessage(std::format("Executing command: {}", cmdUsername));
    auto owner = session.run(cmdUsername, token);
    if (!owner) {
        return std::unexpected(std::format("Ownership lookup failed: {}", owner.error()));
    }

    if (token.isCancelled()) {
        return std::unexpected("Registry lookup cancelled");
    }
    auto cmdDomain = domainCommand(domain);
    config.logMessage(std::format("Executing command: {}", cmdDomain));
    auto records = session.run(cmdDomain, token);
    if (!records) {
        return std::unexpected(std::format("Domain lookup failed: {}", records.error()));
    }
    // grep exits 1 when nothing matched; anything above that is a real failure.
    if (records->exitCode > 1) {
        return std::unexpected(std::format("Domain lookup exited with status {}: {}",
                                           records->exitCode, trim(records->stderrText)));
    }

    ProbeResult result;
    result.usernameFound = !trim(owner->stdoutText).empty();
    result.domainRecordText = trim(records->stdoutText);
    return result;
}
