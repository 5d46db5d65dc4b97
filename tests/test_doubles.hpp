#ifndef TEST_DOUBLES_HPP
#define TEST_DOUBLES_HPP

#include <gmock/gmock.h>
#include "backup_job_client.hpp"
#include "cancellation.hpp"
#include "http_client.hpp"
#include "progress.hpp"
#include "remote_session.hpp"
#include "transfer_pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Everything a fake destination host saw and will answer.
 */
struct FakeRemoteState {
    std::map<std::string, CommandResult> responses;   // keyed by exact command
    std::map<std::string, std::string> runErrors;     // commands whose transport fails
    std::set<std::string> hangingCommands;            // commands that never finish on their own
    std::vector<std::string> commands;                // every run() and runStreaming() command, in order

    std::vector<std::pair<std::string, std::string>> pushes;
    bool localExistedAtPush = false;
    std::string pushError;

    std::deque<StreamRead> restoreOutput;
    int restoreExit = 0;
    std::function<void()> onExitStatus;
    std::string streamStartError;
    std::string streamReadError;

    int connects = 0;
    int closes = 0;
    std::string connectError;
    std::string lastHost;
    Credentials lastCredentials;
};

class FakeStreamingCommand : public StreamingCommand {
public:
    explicit FakeStreamingCommand(std::shared_ptr<FakeRemoteState> state) : state_(std::move(state)) {}

    std::expected<StreamRead, std::string> read(std::chrono::milliseconds) override {
        if (!state_->streamReadError.empty() && state_->restoreOutput.empty()) {
            return std::unexpected(state_->streamReadError);
        }
        if (state_->restoreOutput.empty()) {
            finished_ = true;
            return StreamRead{"", true};
        }
        StreamRead next = state_->restoreOutput.front();
        state_->restoreOutput.pop_front();
        finished_ = next.finished;
        return next;
    }

    std::expected<int, std::string> exitStatus() override {
        if (!finished_) {
            return std::unexpected("still running");
        }
        if (state_->onExitStatus) {
            state_->onExitStatus();
        }
        return state_->restoreExit;
    }

private:
    std::shared_ptr<FakeRemoteState> state_;
    bool finished_ = false;
};

class FakeSession : public RemoteSession {
public:
    explicit FakeSession(std::shared_ptr<FakeRemoteState> state) : state_(std::move(state)) {}
    ~FakeSession() override { ++state_->closes; }

    std::expected<CommandResult, std::string> run(const std::string& command,
                                                  const CancellationToken& token) override {
        state_->commands.push_back(command);
        if (state_->hangingCommands.contains(command)) {
            while (token.sleepFor(std::chrono::milliseconds(5))) {
            }
        }
        if (token.isCancelled()) {
            return std::unexpected("Command cancelled");
        }
        if (auto it = state_->runErrors.find(command); it != state_->runErrors.end()) {
            return std::unexpected(it->second);
        }
        if (auto it = state_->responses.find(command); it != state_->responses.end()) {
            return it->second;
        }
        return CommandResult{"", "", 1};
    }

    std::expected<std::uintmax_t, std::string> pushFile(const std::string& localPath,
                                                        const std::string& remotePath,
                                                        const CancellationToken&) override {
        state_->pushes.emplace_back(localPath, remotePath);
        state_->localExistedAtPush = std::filesystem::exists(localPath);
        if (!state_->pushError.empty()) {
            return std::unexpected(state_->pushError);
        }
        return std::filesystem::file_size(localPath);
    }

    std::expected<std::unique_ptr<StreamingCommand>, std::string> runStreaming(const std::string& command) override {
        state_->commands.push_back(command);
        if (!state_->streamStartError.empty()) {
            return std::unexpected(state_->streamStartError);
        }
        return std::make_unique<FakeStreamingCommand>(state_);
    }

private:
    std::shared_ptr<FakeRemoteState> state_;
};

class FakeConnector : public RemoteConnector {
public:
    FakeConnector() : state(std::make_shared<FakeRemoteState>()) {}

    std::expected<std::unique_ptr<RemoteSession>, std::string> connect(const std::string& host,
                                                                       const Credentials& credentials,
                                                                       std::chrono::seconds) override {
        ++state->connects;
        state->lastHost = host;
        state->lastCredentials = credentials;
        if (!state->connectError.empty()) {
            return std::unexpected(state->connectError);
        }
        return std::make_unique<FakeSession>(state);
    }

    std::shared_ptr<FakeRemoteState> state;
};

/**
 * @brief Scripted backup job API.
 */
class FakeBackupJobApi : public BackupJobApi {
public:
    std::expected<JobTicket, std::string> trigger(const std::string& sourceHost,
                                                  const Credentials& credentials) override {
        ++triggers;
        if (throwOnTrigger) {
            throw std::runtime_error("job API unavailable");
        }
        if (throwNonStandardOnTrigger) {
            throw 42;
        }
        if (!triggerError.empty()) {
            return std::unexpected(triggerError);
        }
        return JobTicket{sourceHost, credentials, "42"};
    }

    BackupJobHandle pollOnce(const JobTicket&, std::chrono::milliseconds timeout) override {
        ++polls;
        pollTimeouts.push_back(timeout);
        if (pollDelay.count() > 0) {
            std::this_thread::sleep_for(std::min(pollDelay, timeout));
        }
        if (throwOnPoll) {
            throw std::runtime_error("status endpoint exploded");
        }
        if (handles.empty()) {
            return {};
        }
        BackupJobHandle next = handles.front();
        if (handles.size() > 1) {
            handles.pop_front();
        }
        return next;
    }

    static BackupJobHandle ready(const std::string& url) {
        BackupJobHandle handle;
        handle.status = BackupJobStatus::Ready;
        handle.downloadReference = url;
        return handle;
    }

    std::string triggerError;
    std::deque<BackupJobHandle> handles;
    bool throwOnPoll = false;
    bool throwOnTrigger = false;
    bool throwNonStandardOnTrigger = false;
    std::chrono::milliseconds pollDelay{0}; // each poll blocks this long, up to its timeout
    std::vector<std::chrono::milliseconds> pollTimeouts;
    int triggers = 0;
    int polls = 0;
};

/**
 * @brief HTTP client that writes canned bytes instead of downloading.
 */
class FakeHttpClient : public HttpClient {
public:
    std::expected<HttpResponse, std::string> get(const std::string& url, const Credentials&,
                                                 const CancellationToken&, std::chrono::milliseconds) override {
        gets.push_back(url);
        return HttpResponse{200, "{}"};
    }

    std::expected<std::uintmax_t, std::string> download(const std::string& url, const Credentials&,
                                                        const std::string& localPath,
                                                        const CancellationToken&) override {
        downloads.emplace_back(url, localPath);
        std::ofstream out(localPath, std::ios::binary | std::ios::trunc);
        out << payload;
        out.close();
        if (!downloadError.empty()) {
            return std::unexpected(downloadError);
        }
        return payload.size();
    }

    std::string payload = "cpmove archive bytes";
    std::string downloadError;
    std::vector<std::string> gets;
    std::vector<std::pair<std::string, std::string>> downloads;
};

class MockHttpClient : public HttpClient {
public:
    MOCK_METHOD((std::expected<HttpResponse, std::string>), get,
                (const std::string& url, const Credentials& credentials, const CancellationToken& token,
                 std::chrono::milliseconds timeout), (override));
    MOCK_METHOD((std::expected<std::uintmax_t, std::string>), download,
                (const std::string& url, const Credentials& credentials, const std::string& localPath,
                 const CancellationToken& token), (override));
};

class MockTransfer : public AccountTransferStrategy {
public:
    MOCK_METHOD(MigrationResult, execute, (const MigrationRequest& request, const CancellationToken& token), (override));
};

class RecordingSink : public ProgressSink {
public:
    void publish(const ProgressEvent& event) override { events.push_back(event); }

    bool sawStage(PipelineStage stage) const {
        for (const auto& event : events) {
            if (event.stage == stage) {
                return true;
            }
        }
        return false;
    }

    std::vector<ProgressEvent> events;
};

inline MigrationRequest sampleRequest() {
    MigrationRequest request;
    request.sourceHost = "source.example.net";
    request.sourceCredentials = {"user1", "source-secret"};
    request.destinationHost = "dest.example.net";
    request.destinationCredentials = {"root", "dest-secret"};
    request.username = "user1";
    request.domain = "example.com";
    return request;
}

#endif // TEST_DOUBLES_HPP
