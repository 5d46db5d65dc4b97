/**
 * @file progress.hpp
 * @brief Progress reporting for running migrations.
 *
 * The pipeline publishes stage changes, poll attempts, transfer sizes and restore output
 * as they happen. Where the events end up is decided by the sink.
 */

#ifndef PROGRESS_HPP
#define PROGRESS_HPP

#include <string>
#include "migration_config.hpp"
#include "migration_types.hpp"

struct ProgressEvent {
    PipelineStage stage = PipelineStage::Idle;
    std::string message;
};

/**
 * @brief Interface for progress sinks.
 */
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    /**
     * @brief Receives one event. Must not throw.
     */
    virtual void publish(const ProgressEvent& event) = 0;
};

/**
 * @brief Writes progress events through the configured log.
 */
class LogProgressSink : public ProgressSink {
public:
    explicit LogProgressSink(const MigrationConfig& config);

    void publish(const ProgressEvent& event) override;

private:
    const MigrationConfig& config;
};

#endif // PROGRESS_HPP
