/**
 * @file remote_session.hpp
 * @brief Interfaces for authenticated remote command sessions.
 *
 * A session runs one-shot commands, copies files to the remote host, and attaches to
 * long-running commands whose output is consumed incrementally. Sessions are
 * exclusively owned; destroying one closes the underlying connection.
 */

#ifndef REMOTE_SESSION_HPP
#define REMOTE_SESSION_HPP

#include <string>
#include <memory>
#include <expected>
#include <chrono>
#include <cstdint>
#include "migration_types.hpp"

class CancellationToken;

/**
 * @brief Captured output of a completed remote command.
 */
struct CommandResult {
    std::string stdoutText;
    std::string stderrText;
    int exitCode = -1;
};

/**
 * @brief Result of one bounded read from a streaming command.
 */
struct StreamRead {
    std::string data;      ///< Output received during this read, possibly empty.
    bool finished = false; ///< The remote process closed its output.
};

/**
 * @brief Handle to a remote process whose output is read while it runs.
 */
class StreamingCommand {
public:
    virtual ~StreamingCommand() = default;

    /**
     * @brief Reads whatever output arrives within the timeout.
     *
     * Never blocks longer than the timeout. Once finished is reported, later reads
     * return finished with no data.
     *
     * @param timeout Upper bound on the wait.
     * @return std::expected<StreamRead, std::string> Output chunk or a transport error.
     */
    virtual std::expected<StreamRead, std::string> read(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Returns the remote exit status after the output finished.
     *
     * @return std::expected<int, std::string> Exit status or an error if it was not reported.
     */
    virtual std::expected<int, std::string> exitStatus() = 0;
};

/**
 * @brief An open, authenticated session to one remote host.
 */
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    /**
     * @brief Runs a command to completion and captures its output.
     *
     * Gives up with an error when the token is cancelled or the session's command
     * time limit passes before the command finishes.
     *
     * @param command Shell command line; callers quote arguments with shellQuote().
     * @param token Checked while waiting for output.
     * @return std::expected<CommandResult, std::string> Output and exit code, or a transport error.
     */
    virtual std::expected<CommandResult, std::string> run(const std::string& command,
                                                          const CancellationToken& token) = 0;

    /**
     * @brief Copies a local file to an absolute remote path.
     *
     * @param localPath File to send.
     * @param remotePath Full destination path, including the filename.
     * @param token Checked between chunks.
     * @return std::expected<std::uintmax_t, std::string> Bytes written or an error message.
     */
    virtual std::expected<std::uintmax_t, std::string> pushFile(const std::string& localPath,
                                                                const std::string& remotePath,
                                                                const CancellationToken& token) = 0;

    /**
     * @brief Starts a command with a pseudo-terminal and returns a handle to its output.
     *
     * The handle must not outlive this session.
     *
     * @param command Shell command line.
     * @return std::expected<std::unique_ptr<StreamingCommand>, std::string> Handle or an error.
     */
    virtual std::expected<std::unique_ptr<StreamingCommand>, std::string> runStreaming(const std::string& command) = 0;
};

/**
 * @brief Opens remote sessions.
 */
class RemoteConnector {
public:
    virtual ~RemoteConnector() = default;

    /**
     * @brief Opens and authenticates a session.
     *
     * @param host Host name or address.
     * @param credentials Login credentials.
     * @param timeout Connect timeout.
     * @return std::expected<std::unique_ptr<RemoteSession>, std::string> Session or a connection error.
     */
    virtual std::expected<std::unique_ptr<RemoteSession>, std::string> connect(const std::string& host,
                                                                               const Credentials& credentials,
                                                                               std::chrono::seconds timeout) = 0;
};

/**
 * @brief Quotes a value for safe interpolation into a POSIX shell command.
 *
 * @param value Raw argument.
 * @return std::string The value wrapped in single quotes with embedded quotes escaped.
 */
std::string shellQuote(const std::string& value);

#endif // REMOTE_SESSION_HPP
