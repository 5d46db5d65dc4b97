/**
 * @file migration_config.hpp
 * @brief Configuration management for cpmigrate.
 *
 * Defines the configuration class holding staging paths, SSH and job-control API
 * settings, polling and restore bounds, and registry lookup commands. Also owns the
 * logging helpers every component writes through.
 *
 * @note Configuration is loaded from a JSON file. Every key is optional; a
 * default-constructed instance carries the defaults.
 */

#ifndef MIGRATION_CONFIG_HPP
#define MIGRATION_CONFIG_HPP

#include <string>
#include <chrono>
#include <cstddef>
#include <json/json.h>

/**
 * @brief How a domain record is matched against the requested username.
 */
enum class ConflictMatchMode {
    Substring, ///< Username appears anywhere in the record text.
    Exact      ///< Record owner equals the username.
};

/**
 * @brief Configuration class for the migration tool.
 *
 * Loads settings from a JSON configuration file, applying defaults for anything omitted.
 */
class MigrationConfig {
public:
    /**
     * @brief Constructs a configuration holding only defaults.
     */
    MigrationConfig() = default;

    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is missing, unparsable, or holds invalid values.
     */
    explicit MigrationConfig(const std::string& configFile);

    /**
     * @brief Applies the settings present in a parsed JSON document.
     *
     * @param configJson Parsed configuration document.
     * @throws std::runtime_error If a value is out of range.
     */
    void load(const Json::Value& configJson);

    /**
     * @brief Logs an informational message to the console and the log file.
     *
     * @param message Message to log.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs a warning to stderr and the log file.
     *
     * @param message Warning to log.
     */
    void logWarning(const std::string& message) const;

    /**
     * @brief Logs an error to stderr and the error log file.
     *
     * @param message Error message to log.
     */
    void logError(const std::string& message) const;

    std::string localRoot = "/var/tmp/cpmigrate/";          ///< Local staging directory for artifacts.
    std::string remoteRoot = "/home/";                      ///< Destination directory for uploads.
    std::string logFile;                                    ///< Activity log, empty for console only.
    std::string errorLogFile;                               ///< Error log, empty for console only.

    int sshPort = 22;                                       ///< Destination SSH port.
    std::chrono::seconds sshConnectTimeout{10};             ///< SSH connect timeout.
    std::chrono::seconds sshCommandTimeout{120};            ///< Limit for one-shot remote commands.
    bool strictHostKeyChecking = false;                     ///< Verify host keys against known_hosts.

    int apiPort = 2083;                                     ///< Source job-control HTTPS port.
    std::string triggerPath = "/execute/Backup/fullbackup_to_homedir"; ///< Backup trigger endpoint.
    std::string statusPath = "/execute/Backup/fullbackup_status";      ///< Backup status endpoint.
    bool verifyTls = false;                                 ///< Verify the source's TLS certificate.
    std::chrono::seconds apiRequestTimeout{60};             ///< Timeout for trigger and status calls.
    std::size_t downloadChunkSize = 8192;                   ///< Download buffer size in bytes.

    std::chrono::milliseconds pollInterval{std::chrono::seconds(10)};  ///< Delay between backup polls.
    std::chrono::milliseconds pollCeiling{std::chrono::seconds(600)};  ///< Overall polling budget.

    std::string restoreTool = "/scripts/restorepkg";        ///< Restore command on the destination.
    std::chrono::milliseconds restoreReadInterval{500};     ///< Bounded wait per streaming read.
    std::chrono::milliseconds restoreCeiling{std::chrono::hours(4)}; ///< Overall restore budget.

    std::string ownerCommand = "/scripts/whoowns";          ///< Ownership lookup tool.
    std::string usersPath = "/var/cpanel/users";            ///< Registry searched for domains.
    ConflictMatchMode matchMode = ConflictMatchMode::Substring; ///< Domain record matching rule.

    std::chrono::seconds migrationTimeout{0};               ///< Overall deadline, zero for none.

private:
    void writeLog(const std::string& file, const std::string& level, const std::string& message, bool toStderr) const;
};

#endif // MIGRATION_CONFIG_HPP
