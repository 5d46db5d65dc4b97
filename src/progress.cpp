#include "progress.hpp"
#include <format>

LogProgressSink::LogProgressSink(const MigrationConfig& config) : config(config) {}

void LogProgressSink::publish(const ProgressEvent& event) {
    config.logMessage(std::format("[{}] {}", toString(event.stage), event.message));
}
