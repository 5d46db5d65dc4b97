#include "ssh_session.hpp"
#include "cancellation.hpp"
#include <libssh/sftp.h>
#include <fstream>
#include <format>
#include <fcntl.h>

namespace {

struct SftpSessionDeleter {
    void operator()(sftp_session sftp) const noexcept { sftp_free(sftp); }
};

struct SftpFileDeleter {
    void operator()(sftp_file file) const noexcept { sftp_close(file); }
};

using SftpSessionPtr = std::unique_ptr<sftp_session_struct, SftpSessionDeleter>;
using SftpFilePtr = std::unique_ptr<sftp_file_struct, SftpFileDeleter>;

constexpr int kDrainTimeoutMs = 100;

// ssh_channel_read_* report EOF either as 0 or as SSH_EOF depending on the libssh version.
int normalizeRead(int n) {
    return n == SSH_EOF ? 0 : n;
}

} // namespace

void SshSessionDeleter::operator()(ssh_session session) const noexcept {
    if (ssh_is_connected(session)) {
        ssh_disconnect(session);
    }
    ssh_free(session);
}

void SshChannelDeleter::operator()(ssh_channel channel) const noexcept {
    if (ssh_channel_is_open(channel)) {
        ssh_channel_close(channel);
    }
    ssh_channel_free(channel);
}

SshStreamingCommand::SshStreamingCommand(SshChannelPtr channel) : channel_(std::move(channel)) {}

std::expected<StreamRead, std::string> SshStreamingCommand::read(std::chrono::milliseconds timeout) {
    StreamRead out;
    if (finished_) {
        out.finished = true;
        return out;
    }

    char buf[4096];
    int n = normalizeRead(ssh_channel_read_timeout(channel_.get(), buf, sizeof(buf), 0,
                                                   static_cast<int>(timeout.count())));
    if (n < 0) {
        return std::unexpected(std::format("Failed to read remote output: {}",
                                           ssh_get_error(ssh_channel_get_session(channel_.get()))));
    }
    out.data.append(buf, static_cast<std::size_t>(n));

    // A PTY merges stderr into stdout, but drain it anyway so the window never stalls.
    int e = normalizeRead(ssh_channel_read_nonblocking(channel_.get(), buf, sizeof(buf), 1));
    if (e > 0) {
        out.data.append(buf, static_cast<std::size_t>(e));
    }

    if (out.data.empty() && (ssh_channel_is_eof(channel_.get()) || ssh_channel_is_closed(channel_.get()))) {
        finished_ = true;
        out.finished = true;
    }
    return out;
}

std::expected<int, std::string> SshStreamingCommand::exitStatus() {
    if (!finished_) {
        return std::unexpected("Remote command is still running");
    }
    ssh_channel_send_eof(channel_.get());
    ssh_channel_close(channel_.get());
    int status = ssh_channel_get_exit_status(channel_.get());
    if (status < 0) {
        return std::unexpected("Remote command did not report an exit status");
    }
    return status;
}

SshSession::SshSession(SshSessionPtr session, std::string host, std::chrono::seconds commandTimeout)
    : session_(std::move(session)), host_(std::move(host)), commandTimeout_(commandTimeout) {}

std::expected<SshChannelPtr, std::string> SshSession::openExecChannel(const std::string& command, bool withPty) {
    SshChannelPtr channel(ssh_channel_new(session_.get()));
    if (!channel) {
        return std::unexpected(std::format("Failed to create channel on {}", host_));
    }
    if (ssh_channel_open_session(channel.get()) != SSH_OK) {
        return std::unexpected(std::format("Failed to open channel on {}: {}", host_, ssh_get_error(session_.get())));
    }
    if (withPty && ssh_channel_request_pty(channel.get()) != SSH_OK) {
        return std::unexpected(std::format("Failed to allocate PTY on {}: {}", host_, ssh_get_error(session_.get())));
    }
    if (ssh_channel_request_exec(channel.get(), command.c_str()) != SSH_OK) {
        return std::unexpected(std::format("Failed to execute command on {}: {}", host_, ssh_get_error(session_.get())));
    }
    return channel;
}

std::expected<CommandResult, std::string> SshSession::run(const std::string& command,
                                                          const CancellationToken& token) {
    auto channel = openExecChannel(command, false);
    if (!channel) {
        return std::unexpected(channel.error());
    }

    CommandResult result;
    char buf[4096];
    auto started = std::chrono::steady_clock::now();
    while (true) {
        if (token.isCancelled()) {
            return std::unexpected(std::format("Command cancelled on {}", host_));
        }
        if (std::chrono::steady_clock::now() - started > commandTimeout_) {
            return std::unexpected(std::format("Command on {} did not finish within {}s", host_, commandTimeout_.count()));
        }
        int n = normalizeRead(ssh_channel_read_timeout(channel->get(), buf, sizeof(buf), 0, kDrainTimeoutMs));
        if (n < 0) {
            return std::unexpected(std::format("Failed to read command output on {}: {}", host_, ssh_get_error(session_.get())));
        }
        result.stdoutText.append(buf, static_cast<std::size_t>(n));

        int e = normalizeRead(ssh_channel_read_nonblocking(channel->get(), buf, sizeof(buf), 1));
        if (e < 0) {
            return std::unexpected(std::format("Failed to read command errors on {}: {}", host_, ssh_get_error(session_.get())));
        }
        result.stderrText.append(buf, static_cast<std::size_t>(e));

        if (n == 0 && e == 0 && (ssh_channel_is_eof(channel->get()) || ssh_channel_is_closed(channel->get()))) {
            break;
        }
    }

    ssh_channel_send_eof(channel->get());
    ssh_channel_close(channel->get());
    result.exitCode = ssh_channel_get_exit_status(channel->get());
    return result;
}

std::expected<std::uintmax_t, std::string> SshSession::pushFile(const std::string& localPath,
                                                                const std::string& remotePath,
                                                                const CancellationToken& token) {
    std::ifstream input(localPath, std::ios::binary);
    if (!input) {
        return std::unexpected(std::format("Failed to open local file: {}", localPath));
    }

    SftpSessionPtr sftp(sftp_new(session_.get()));
    if (!sftp || sftp_init(sftp.get()) != SSH_OK) {
        return std::unexpected(std::format("SFTP initialization failed on {}: {}", host_, ssh_get_error(session_.get())));
    }

    SftpFilePtr file(sftp_open(sftp.get(), remotePath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600));
    if (!file) {
        return std::unexpected(std::format("Failed to open remote file {}: {}", remotePath, ssh_get_error(session_.get())));
    }

    std::uintmax_t total = 0;
    char buf[8192];
    while (input) {
        if (token.isCancelled()) {
            return std::unexpected("Upload cancelled");
        }
        input.read(buf, sizeof(buf));
        auto got = input.gcount();
        if (got <= 0) {
            break;
        }
        auto written = sftp_write(file.get(), buf, static_cast<std::size_t>(got));
        if (written != got) {
            return std::unexpected(std::format("Failed writing {} after {} bytes: {}", remotePath, total,
                                               ssh_get_error(session_.get())));
        }
        total += static_cast<std::uintmax_t>(got);
    }
    if (input.bad()) {
        return std::unexpected(std::format("Failed reading local file: {}", localPath));
    }

    file.reset();
    return total;
}

std::expected<std::unique_ptr<StreamingCommand>, std::string> SshSession::runStreaming(const std::string& command) {
    auto channel = openExecChannel(command, true);
    if (!channel) {
        return std::unexpected(channel.error());
    }
    return std::make_unique<SshStreamingCommand>(std::move(*channel));
}

SshConnector::SshConnector(int port, bool strictHostKeyChecking, std::chrono::seconds commandTimeout)
    : port_(port), strictHostKeyChecking_(strictHostKeyChecking), commandTimeout_(commandTimeout) {}

std::expected<std::unique_ptr<RemoteSession>, std::string> SshConnector::connect(const std::string& host,
                                                                                 const Credentials& credentials,
                                                                                 std::chrono::seconds timeout) {
    SshSessionPtr ssh(ssh_new());
    if (!ssh) {
        return std::unexpected("Failed to create SSH session");
    }
    long timeoutSeconds = static_cast<long>(timeout.count());
    ssh_options_set(ssh.get(), SSH_OPTIONS_HOST, host.c_str());
    ssh_options_set(ssh.get(), SSH_OPTIONS_PORT, &port_);
    ssh_options_set(ssh.get(), SSH_OPTIONS_USER, credentials.user.c_str());
    ssh_options_set(ssh.get(), SSH_OPTIONS_TIMEOUT, &timeoutSeconds);

    if (ssh_connect(ssh.get()) != SSH_OK) {
        return std::unexpected(std::format("SSH connection to {} failed: {}", host, ssh_get_error(ssh.get())));
    }

    if (strictHostKeyChecking_ && ssh_session_is_known_server(ssh.get()) != SSH_KNOWN_HOSTS_OK) {
        return std::unexpected(std::format("Host key for {} is not trusted", host));
    }

    if (credentials.password.empty()) {
        if (ssh_userauth_publickey_auto(ssh.get(), nullptr, nullptr) != SSH_AUTH_SUCCESS) {
            return std::unexpected(std::format("SSH public key authentication to {} failed", host));
        }
    } else {
        if (ssh_userauth_password(ssh.get(), nullptr, credentials.password.c_str()) != SSH_AUTH_SUCCESS) {
            return std::unexpected(std::format("SSH password authentication to {} failed", host));
        }
    }

    return std::make_unique<SshSession>(std::move(ssh), host, commandTimeout_);
}
