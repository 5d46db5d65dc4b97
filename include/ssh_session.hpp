/**
 * @file ssh_session.hpp
 * @brief libssh implementation of the remote session interfaces.
 *
 * Provides command execution over exec channels, SFTP uploads, and PTY-backed
 * streaming commands. Every libssh handle is held by a std::unique_ptr with a
 * matching deleter, so each exit path releases it.
 *
 * @note Requires libssh 0.8 or newer.
 */

#ifndef SSH_SESSION_HPP
#define SSH_SESSION_HPP

#include <string>
#include <memory>
#include <chrono>
#include <expected>
#include <libssh/libssh.h>
#include "remote_session.hpp"

struct SshSessionDeleter {
    void operator()(ssh_session session) const noexcept;
};

struct SshChannelDeleter {
    void operator()(ssh_channel channel) const noexcept;
};

using SshSessionPtr = std::unique_ptr<ssh_session_struct, SshSessionDeleter>;
using SshChannelPtr = std::unique_ptr<ssh_channel_struct, SshChannelDeleter>;

/**
 * @brief A remote command whose output is read from an open PTY channel.
 */
class SshStreamingCommand : public StreamingCommand {
public:
    explicit SshStreamingCommand(SshChannelPtr channel);

    std::expected<StreamRead, std::string> read(std::chrono::milliseconds timeout) override;
    std::expected<int, std::string> exitStatus() override;

private:
    SshChannelPtr channel_;
    bool finished_ = false;
};

/**
 * @brief An authenticated SSH session.
 */
class SshSession : public RemoteSession {
public:
    /**
     * @param session Connected, authenticated libssh session.
     * @param host Host name used in error messages.
     * @param commandTimeout Longest a run() command may take.
     */
    SshSession(SshSessionPtr session, std::string host, std::chrono::seconds commandTimeout);

    std::expected<CommandResult, std::string> run(const std::string& command,
                                                  const CancellationToken& token) override;

    /**
     * @brief Uploads a file via SFTP, creating or truncating the remote file with mode 0600.
     */
    std::expected<std::uintmax_t, std::string> pushFile(const std::string& localPath,
                                                        const std::string& remotePath,
                                                        const CancellationToken& token) override;

    std::expected<std::unique_ptr<StreamingCommand>, std::string> runStreaming(const std::string& command) override;

private:
    std::expected<SshChannelPtr, std::string> openExecChannel(const std::string& command, bool withPty);

    SshSessionPtr session_;
    std::string host_;
    std::chrono::seconds commandTimeout_;
};

/**
 * @brief Opens SSH sessions using password or public-key authentication.
 */
class SshConnector : public RemoteConnector {
public:
    /**
     * @brief Constructs a connector.
     *
     * @param port SSH port (e.g., 22).
     * @param strictHostKeyChecking If true, reject hosts whose key is not in known_hosts.
     * @param commandTimeout Time limit for one-shot commands on opened sessions.
     */
    SshConnector(int port, bool strictHostKeyChecking, std::chrono::seconds commandTimeout);

    /**
     * @brief Connects and authenticates.
     *
     * Uses password authentication when a password is given, otherwise public-key auto
     * authentication (agent or default identity files).
     */
    std::expected<std::unique_ptr<RemoteSession>, std::string> connect(const std::string& host,
                                                                       const Credentials& credentials,
                                                                       std::chrono::seconds timeout) override;

private:
    int port_;
    bool strictHostKeyChecking_;
    std::chrono::seconds commandTimeout_;
};

#endif // SSH_SESSION_HPP
