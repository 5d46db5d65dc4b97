/**
 * @file conflict_resolver.hpp
 * @brief Maps destination probe results to a conflict outcome.
 */

#ifndef CONFLICT_RESOLVER_HPP
#define CONFLICT_RESOLVER_HPP

#include <string>
#include <expected>
#include "migration_config.hpp"
#include "migration_types.hpp"
#include "registry_prober.hpp"

/**
 * @brief Classifies a probe result.
 *
 * A failed probe is a ConnectionError. When both the username and a domain record are
 * found, the record decides between OverwriteAllowed (it belongs to this username) and
 * UsernameConflict. A domain record alone is a DomainConflict; nothing found is NoConflict.
 *
 * @param probe Probe result or the error that prevented it.
 * @param username Requested account username.
 * @param mode Substring keeps the registry text test; Exact compares the record owner.
 * @return ConflictOutcome The classification.
 */
ConflictOutcome resolveConflict(const std::expected<ProbeResult, std::string>& probe,
                                const std::string& username,
                                ConflictMatchMode mode = ConflictMatchMode::Substring);

/**
 * @brief Reports whether a domain record belongs to the username.
 *
 * Exact mode reads each record line as "<owner path>:<text>" and compares the last
 * component of the owner path with the username.
 */
bool recordOwnedBy(const std::string& domainRecordText, const std::string& username, ConflictMatchMode mode);

/**
 * @brief Reports whether the outcome allows the pipeline to run.
 *
 * @param outcome Conflict outcome.
 * @param overwrite Caller consented to replacing an identical account.
 */
bool allowsTransfer(ConflictOutcome outcome, bool overwrite);

#endif // CONFLICT_RESOLVER_HPP
