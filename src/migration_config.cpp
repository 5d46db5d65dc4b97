#include "migration_config.hpp"
#include <fstream>
#include <format>
#include <print>
#include <ctime>
#include <stdexcept>

namespace {

std::chrono::milliseconds readMillis(const Json::Value& section, const std::string& secondsKey,
                                     const std::string& millisKey, std::chrono::milliseconds fallback) {
    if (section.isMember(millisKey)) {
        return std::chrono::milliseconds(section[millisKey].asInt64());
    }
    if (section.isMember(secondsKey)) {
        return std::chrono::seconds(section[secondsKey].asInt64());
    }
    return fallback;
}

std::string withTrailingSlash(std::string path) {
    if (!path.empty() && path.back() != '/') {
        path.push_back('/');
    }
    return path;
}

} // namespace

MigrationConfig::MigrationConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson)) {
        throw std::runtime_error(std::format("Failed to parse config file: {}", configFile));
    }
    load(configJson);
}

void MigrationConfig::load(const Json::Value& configJson) {
    localRoot = withTrailingSlash(configJson.get("local_root", localRoot).asString());
    remoteRoot = withTrailingSlash(configJson.get("remote_root", remoteRoot).asString());
    logFile = configJson.get("log_file", logFile).asString();
    errorLogFile = configJson.get("error_log_file", errorLogFile).asString();

    const Json::Value& ssh = configJson["ssh"];
    sshPort = ssh.get("port", sshPort).asInt();
    sshConnectTimeout = std::chrono::seconds(ssh.get("connect_timeout_seconds",
                                                     static_cast<Json::Int64>(sshConnectTimeout.count())).asInt64());
    sshCommandTimeout = std::chrono::seconds(ssh.get("command_timeout_seconds",
                                                     static_cast<Json::Int64>(sshCommandTimeout.count())).asInt64());
    strictHostKeyChecking = ssh.get("strict_host_key_checking", strictHostKeyChecking).asBool();

    const Json::Value& api = configJson["api"];
    apiPort = api.get("port", apiPort).asInt();
    triggerPath = api.get("trigger_path", triggerPath).asString();
    statusPath = api.get("status_path", statusPath).asString();
    verifyTls = api.get("verify_tls", verifyTls).asBool();
    apiRequestTimeout = std::chrono::seconds(api.get("request_timeout_seconds",
                                                     static_cast<Json::Int64>(apiRequestTimeout.count())).asInt64());

    const Json::Value& download = configJson["download"];
    downloadChunkSize = download.get("chunk_size", static_cast<Json::UInt64>(downloadChunkSize)).asUInt64();

    const Json::Value& poll = configJson["poll"];
    pollInterval = readMillis(poll, "interval_seconds", "interval_ms", pollInterval);
    pollCeiling = readMillis(poll, "ceiling_seconds", "ceiling_ms", pollCeiling);

    const Json::Value& restore = configJson["restore"];
    restoreTool = restore.get("tool", restoreTool).asString();
    restoreReadInterval = readMillis(restore, "read_interval_seconds", "read_interval_ms", restoreReadInterval);
    restoreCeiling = readMillis(restore, "ceiling_seconds", "ceiling_ms", restoreCeiling);

    const Json::Value& registry = configJson["registry"];
    ownerCommand = registry.get("owner_command", ownerCommand).asString();
    usersPath = registry.get("users_path", usersPath).asString();

    std::string mode = configJson.get("conflict_match_mode", "substring").asString();
    if (mode == "substring") {
        matchMode = ConflictMatchMode::Substring;
    } else if (mode == "exact") {
        matchMode = ConflictMatchMode::Exact;
    } else {
        throw std::runtime_error(std::format("Invalid conflict_match_mode: {}", mode));
    }

    migrationTimeout = std::chrono::seconds(configJson.get("migration_timeout_seconds",
                                                           static_cast<Json::Int64>(migrationTimeout.count())).asInt64());

    if (pollInterval.count() <= 0 || pollCeiling.count() <= 0) {
        throw std::runtime_error("Poll interval and ceiling must be positive");
    }
    if (restoreReadInterval.count() <= 0 || restoreCeiling.count() <= 0) {
        throw std::runtime_error("Restore read interval and ceiling must be positive");
    }
    if (sshConnectTimeout.count() <= 0 || sshCommandTimeout.count() <= 0 || apiRequestTimeout.count() <= 0) {
        throw std::runtime_error("SSH and API timeouts must be positive");
    }
    if (downloadChunkSize == 0) {
        throw std::runtime_error("Download chunk size must be positive");
    }
    if (sshPort <= 0 || apiPort <= 0) {
        throw std::runtime_error(std::format("Invalid port (ssh: {}, api: {})", sshPort, apiPort));
    }
    if (migrationTimeout.count() < 0) {
        throw std::runtime_error("migration_timeout_seconds must not be negative");
    }
}

void MigrationConfig::logMessage(const std::string& message) const {
    writeLog(logFile, "", message, false);
}

void MigrationConfig::logWarning(const std::string& message) const {
    writeLog(logFile, "WARNING: ", message, true);
}

void MigrationConfig::logError(const std::string& message) const {
    writeLog(errorLogFile.empty() ? logFile : errorLogFile, "ERROR: ", message, true);
}

void MigrationConfig::writeLog(const std::string& file, const std::string& level,
                               const std::string& message, bool toStderr) const {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tmNow{};
    localtime_r(&timeT, &tmNow);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);
    std::string logEntry = std::format("[{}] {}{}", timeBuf, level, message);

    if (toStderr) {
        std::println(stderr, "{}", logEntry);
    } else {
        std::println("{}", logEntry);
    }

    if (file.empty()) {
        return;
    }
    std::ofstream log(file, std::ios::app);
    if (log.is_open()) {
        log << logEntry << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to log file: {}", file);
    }
}
