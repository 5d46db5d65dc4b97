#include "backup_job_client.hpp"
#include "cancellation.hpp"
#include <algorithm>
#include <format>

namespace {

std::expected<Json::Value, std::string> parseJson(const std::string& body) {
    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(body, root)) {
        return std::unexpected(std::format("Invalid JSON: {}", reader.getFormattedErrorMessages()));
    }
    if (!root.isObject()) {
        return std::unexpected("Unexpected response shape");
    }
    return root;
}

std::string joinErrors(const Json::Value& root) {
    const Json::Value& errors = root["errors"];
    if (errors.isString()) {
        return errors.asString();
    }
    std::string joined;
    if (errors.isArray()) {
        for (const auto& error : errors) {
            if (!joined.empty()) {
                joined += "; ";
            }
            joined += error.asString();
        }
    }
    return joined.empty() ? "no error detail" : joined;
}

// UAPI reports success as "status": 1; a missing status field is treated as success.
bool uapiSucceeded(const Json::Value& root) {
    return !root.isMember("status") || root["status"].asInt() != 0;
}

const Json::Value& jobData(const Json::Value& root) {
    const Json::Value& data = root["data"];
    if (data.isArray() && !data.empty()) {
        return data[0];
    }
    return data;
}

std::string appendQuery(const std::string& path, const std::string& key, const std::string& value) {
    return std::format("{}{}{}={}", path, path.find('?') == std::string::npos ? '?' : '&', key, value);
}

} // namespace

CpanelBackupJobClient::CpanelBackupJobClient(const MigrationConfig& config, HttpClient& http,
                                             const CancellationToken& token)
    : config(config), http(http), token(token) {}

std::string CpanelBackupJobClient::baseUrl(const std::string& sourceHost) const {
    if (sourceHost.find("://") != std::string::npos) {
        return sourceHost;
    }
    return std::format("https://{}:{}", sourceHost, config.apiPort);
}

std::string CpanelBackupJobClient::resolveReference(const std::string& sourceHost, const std::string& reference) const {
    if (reference.find("://") != std::string::npos) {
        return reference;
    }
    if (!reference.empty() && reference.front() == '/') {
        return baseUrl(sourceHost) + reference;
    }
    return std::format("{}/{}", baseUrl(sourceHost), reference);
}

std::expected<JobTicket, std::string> CpanelBackupJobClient::trigger(const std::string& sourceHost,
                                                                     const Credentials& credentials) {
    std::string url = baseUrl(sourceHost) + config.triggerPath;
    config.logMessage(std::format("Triggering backup on {}", baseUrl(sourceHost)));

    auto response = http.get(url, credentials, token, config.apiRequestTimeout);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status < 200 || response->status >= 300) {
        return std::unexpected(std::format("Backup trigger returned HTTP {}", response->status));
    }

    auto root = parseJson(response->body);
    if (!root) {
        return std::unexpected(std::format("Backup trigger response unreadable: {}", root.error()));
    }
    if (!uapiSucceeded(*root)) {
        return std::unexpected(std::format("Backup trigger rejected: {}", joinErrors(*root)));
    }

    JobTicket ticket{sourceHost, credentials, {}};
    const Json::Value& data = jobData(*root);
    if (data.isObject()) {
        for (const char* key : {"pid", "job_id"}) {
            if (data.isMember(key) && !data[key].isNull()) {
                ticket.jobId = data[key].asString();
                break;
            }
        }
    }
    return ticket;
}

std::expected<BackupJobHandle, std::string> CpanelBackupJobClient::parseStatus(const std::string& body) {
    auto root = parseJson(body);
    if (!root) {
        return std::unexpected(root.error());
    }
    if (!uapiSucceeded(*root)) {
        return std::unexpected(std::format("Status request rejected: {}", joinErrors(*root)));
    }

    BackupJobHandle handle;
    const Json::Value& data = jobData(*root);
    if (!data.isObject()) {
        return handle;
    }

    std::string url = data.get("download_url", "").asString();
    if (!url.empty()) {
        handle.status = BackupJobStatus::Ready;
        handle.downloadReference = url;
        return handle;
    }

    for (const char* key : {"state", "status"}) {
        if (data[key].isString()) {
            auto state = data[key].asString();
            if (state == "failed" || state == "error") {
                handle.status = BackupJobStatus::Failed;
                return handle;
            }
        }
    }
    return handle;
}

BackupJobHandle CpanelBackupJobClient::pollOnce(const JobTicket& ticket, std::chrono::milliseconds timeout) {
    std::string path = ticket.jobId.empty() ? config.statusPath : appendQuery(config.statusPath, "job_id", ticket.jobId);
    std::string url = baseUrl(ticket.sourceHost) + path;

    auto response = http.get(url, ticket.credentials, token,
                             std::min<std::chrono::milliseconds>(timeout, config.apiRequestTimeout));
    if (!response) {
        config.logWarning(std::format("Backup status poll failed: {}", response.error()));
        return {};
    }
    if (response->status < 200 || response->status >= 300) {
        config.logWarning(std::format("Backup status poll returned HTTP {}", response->status));
        return {};
    }

    auto handle = parseStatus(response->body);
    if (!handle) {
        config.logWarning(std::format("Backup status unreadable: {}", handle.error()));
        return {};
    }
    if (handle->downloadReference) {
        handle->downloadReference = resolveReference(ticket.sourceHost, *handle->downloadReference);
    }
    return *handle;
}
