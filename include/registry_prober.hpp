/**
 * @file registry_prober.hpp
 * @brief Read-only lookups against the destination's account registry.
 */

#ifndef REGISTRY_PROBER_HPP
#define REGISTRY_PROBER_HPP

#include <string>
#include <expected>
#include "migration_config.hpp"
#include "remote_session.hpp"

class CancellationToken;

/**
 * @brief What the destination already knows about a username and domain.
 */
struct ProbeResult {
    bool usernameFound = false;   ///< The ownership lookup returned a non-empty answer.
    std::string domainRecordText; ///< Registry lines mentioning the domain, empty if none.
};

/**
 * @brief Answers "does this username exist?" and "does this domain exist?" on a destination host.
 *
 * Runs exactly two commands per probe and never writes to the remote host.
 */
class RegistryProber {
public:
    explicit RegistryProber(const MigrationConfig& config);

    /**
     * @brief Probes an open destination session.
     *
     * @param session Session to the destination host.
     * @param username Account username to look up.
     * @param domain Domain to search the registry for.
     * @param token Stops the lookups when cancelled.
     * @return std::expected<ProbeResult, std::string> Lookup results, or an error if either lookup failed.
     */
    std::expected<ProbeResult, std::string> probe(RemoteSession& session,
                                                  const std::string& username,
                                                  const std::string& domain,
                                                  const CancellationToken& token) const;

    /**
     * @brief Builds the ownership lookup command.
     */
    std::string ownerCommand(const std::string& username) const;

    /**
     * @brief Builds the registry search command for the configured match mode.
     */
    std::string domainCommand(const std::string& domain) const;

private:
    const MigrationConfig& config;
};

#endif // REGISTRY_PROBER_HPP
