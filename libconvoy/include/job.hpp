/**
 * @file job.hpp
 * @brief Job identifiers, descriptors, error categories and job state.
 */

#ifndef CONVOY_JOB_HPP
#define CONVOY_JOB_HPP

#include "settings_snapshot.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <sys/types.h>
#include <vector>

namespace convoy {

    using JobId = std::int64_t;

    /**
     * @brief Number of StageProgress events every job emits.
     */
    inline constexpr int kStageCount = 3;

    /**
     * @brief Failure categories of a job.
     */
    enum class JobError {
        None,       ///< No failure
        Setup,      ///< Settings restore or workspace creation failed
        Staging,    ///< Local copy, dependency resolution or archive unpacking failed
        Conversion, ///< Routine returned false or the primary output is missing/empty
        Finalize,   ///< Moving the primary output to its destination failed
        Unhandled   ///< Unexpected exception caught at the worker loop
    };

    inline const char* job_error_to_string(const JobError e) {
        switch (e) {
            case JobError::None:       return "none";
            case JobError::Setup:      return "setup";
            case JobError::Staging:    return "staging";
            case JobError::Conversion: return "conversion";
            case JobError::Finalize:   return "finalize";
            case JobError::Unhandled:  return "unhandled";
        }
        return "unknown";
    }

    inline JobError job_error_from_string(const std::string& s) {
        if (s == "setup")      return JobError::Setup;
        if (s == "staging")    return JobError::Staging;
        if (s == "conversion") return JobError::Conversion;
        if (s == "finalize")   return JobError::Finalize;
        if (s == "unhandled")  return JobError::Unhandled;
        return JobError::None;
    }

    /**
     * @brief Self-contained description of one conversion request.
     *
     * Everything a worker needs travels inside the descriptor, including
     * the settings in effect when the job was submitted.
     */
    struct JobDescriptor {
        JobId job_id = 0;
        std::filesystem::path input_path;
        std::string routine_id;                     ///< Key into the ConversionRegistry
        std::filesystem::path output_dir;           ///< Empty: next to the input
        std::string primary_output_ext;             ///< Without dot, empty for folder/no output
        std::string secondary_output_ext;           ///< Without dot, may be empty
        bool overwrite_allowed = false;
        bool multi_file_input = false;              ///< Input is a .cue/.gdi descriptor
        std::vector<std::string> archive_media_exts; ///< Media to look for inside archive inputs
        SettingsSnapshot settings;
        std::string settings_error;                 ///< Set on decode when the carried settings were rejected
    };

    /**
     * @brief What a caller submits; the coordinator turns it into a
     * JobDescriptor by adding the id and the settings snapshot.
     */
    struct JobRequest {
        std::filesystem::path input_path;
        std::string routine_id;
        std::filesystem::path output_dir;
        std::string primary_output_ext;
        std::string secondary_output_ext;
        bool overwrite_allowed = false;
        bool multi_file_input = false;
        std::vector<std::string> archive_media_exts;
    };

    /**
     * @brief Lifecycle of a job as seen by the coordinator.
     */
    enum class JobStatus {
        Queued,
        Running,
        CompletedSuccess,
        CompletedFailure
    };

    inline const char* job_status_to_string(const JobStatus s) {
        switch (s) {
            case JobStatus::Queued:           return "queued";
            case JobStatus::Running:          return "running";
            case JobStatus::CompletedSuccess: return "success";
            case JobStatus::CompletedFailure: return "failure";
        }
        return "unknown";
    }

    inline bool is_terminal(const JobStatus s) {
        return s == JobStatus::CompletedSuccess || s == JobStatus::CompletedFailure;
    }

    /**
     * @brief Coordinator-owned view of one job.
     */
    struct JobState {
        JobId job_id = 0;
        std::string filename;
        std::filesystem::path input_path;
        JobStatus status = JobStatus::Queued;
        int stages_done = 0;
        double percentage = 0.0;
        pid_t worker_pid = 0;          ///< Set once the job is started
        JobError error = JobError::None;
        std::string message;           ///< Message of the terminal event
    };

} // namespace convoy

#endif // CONVOY_JOB_HPP
