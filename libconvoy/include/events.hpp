#ifndef CONVOY_EVENTS_HPP
#define CONVOY_EVENTS_HPP

#include "job.hpp"
#include <string>
#include <sys/types.h>
#include <variant>

namespace convoy {

/**
 * @brief Events emitted by a job while it moves through the pipeline.
 *
 * Workers send them to the coordinator over the results channel; the
 * coordinator republishes every decoded event on its EventBus so that
 * front ends (progress bar, report) can subscribe by type. They are
 * plain data carriers. Events of one job are strictly ordered.
 */

/**
 * @brief Emitted once, when a worker picks a job up.
 */
struct JobStartedEvent {
    JobId job_id = 0;
    std::string filename;        ///< Base name of the input
    int total_stages = kStageCount;
    pid_t worker_pid = 0;        ///< Process running the job
};

/**
 * @brief Emitted exactly kStageCount times per job.
 */
struct StageProgressEvent {
    JobId job_id = 0;
    std::string description;     ///< "Staged", "Converted", "Finalized" or "Failed"
    int stages_done = 0;
    int total_stages = kStageCount;
    double percentage = 0.0;
};

/**
 * @brief Percentage of the current job, sent right after each StageProgress.
 */
struct FileProgressEvent {
    JobId job_id = 0;
    double percentage = 0.0;
};

/**
 * @brief One line of informational output (tool stdout, routine messages).
 */
struct OutputLineEvent {
    JobId job_id = 0;
    std::string message;
};

/**
 * @brief One line of error output (tool stderr, failures, warnings).
 */
struct ErrorLineEvent {
    JobId job_id = 0;
    std::string message;
};

/**
 * @brief Terminal event of a job, always after its last StageProgress.
 */
struct JobCompletedEvent {
    JobId job_id = 0;
    bool success = false;
    JobError error = JobError::None;
    std::string message;
};

using Event = std::variant<JobStartedEvent,
                           StageProgressEvent,
                           FileProgressEvent,
                           OutputLineEvent,
                           ErrorLineEvent,
                           JobCompletedEvent>;

/**
 * @brief Returns the job id carried by any event alternative.
 */
inline JobId event_job_id(const Event& e) {
    return std::visit([](const auto& ev) { return ev.job_id; }, e);
}

} // namespace convoy

#endif // CONVOY_EVENTS_HPP
