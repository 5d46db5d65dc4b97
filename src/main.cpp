#include "cancellation.hpp"
#include "migration_api.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <print>
#include <string>

namespace {

std::atomic<CancellationToken*> gCancelToken{nullptr};

void signalHandler(int /*sig*/) {
    if (auto* token = gCancelToken.load()) {
        token->cancel();
    }
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config <path>] [--check-only] [--overwrite]"
                 " --source-host <host> --source-user <user>"
                 " --dest-host <host> --dest-user <user>"
                 " --username <account> --domain <domain>\n"
                 "Passwords are read from CPMIGRATE_SOURCE_PASS and CPMIGRATE_DEST_PASS."
              << std::endl;
}

std::string envOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return value ? value : "";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile;
    bool checkOnly = false;
    MigrationRequest request;
    request.destinationCredentials.user = "root";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;
        if (arg == "--check-only") {
            checkOnly = true;
        } else if (arg == "--overwrite") {
            request.overwrite = true;
        } else if (arg == "--config" && hasValue) {
            configFile = argv[++i];
        } else if (arg == "--source-host" && hasValue) {
            request.sourceHost = argv[++i];
        } else if (arg == "--source-user" && hasValue) {
            request.sourceCredentials.user = argv[++i];
        } else if (arg == "--dest-host" && hasValue) {
            request.destinationHost = argv[++i];
        } else if (arg == "--dest-user" && hasValue) {
            request.destinationCredentials.user = argv[++i];
        } else if (arg == "--username" && hasValue) {
            request.username = argv[++i];
        } else if (arg == "--domain" && hasValue) {
            request.domain = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Error: Unknown or incomplete argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }
    request.sourceCredentials.password = envOrEmpty("CPMIGRATE_SOURCE_PASS");
    request.destinationCredentials.password = envOrEmpty("CPMIGRATE_DEST_PASS");

    CancellationToken token;
    gCancelToken.store(&token);
    struct sigaction sa {};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    if (sigaction(SIGINT, &sa, nullptr) != 0 || sigaction(SIGTERM, &sa, nullptr) != 0) {
        std::cerr << "Warning: Failed to install signal handlers; interrupts will not cancel cleanly." << std::endl;
    }

    MigrationResult result = checkOnly ? MigrationAPI::checkConflicts(configFile, request, token)
                                       : MigrationAPI::startMigration(configFile, request, token);
    gCancelToken.store(nullptr);

    if (!result.transcript.empty()) {
        std::println("{}", result.transcript);
    }
    if (result.success) {
        std::println("{}", result.detail);
        return 0;
    }
    std::println(stderr, "Error ({}, stage {}): {}", toString(result.error), toString(result.stage), result.detail);
    return result.error == ErrorKind::ValidationError ? 2 : 1;
}
