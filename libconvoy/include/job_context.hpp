/**
 * @file job_context.hpp
 * @brief Per-job state shared by the pipeline stages and the conversion routine.
 */

#ifndef CONVOY_JOB_CONTEXT_HPP
#define CONVOY_JOB_CONTEXT_HPP

#include "engine_config.hpp"
#include "events.hpp"
#include "job.hpp"
#include "subprocess.hpp"
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace convoy {

    class IArchiveStager;

    using EventSink = std::function<void(const Event&)>;

    /**
     * @brief Event emitter and stage counter of one job.
     *
     * Owns the only copy of the stage counter, so the number of
     * StageProgress events sent for a job is exactly kStageCount: stages
     * report one by one with report_stage(), and complete_stages() fills
     * in whatever an early failure skipped.
     */
    class JobContext {
    public:
        /// Longest message carried by a single OutputLine/ErrorLine event.
        static constexpr std::size_t kMaxMessageLength = 16 * 1024;

        JobContext(const JobDescriptor& job, EventSink sink, IArchiveStager& stager);

        [[nodiscard]] JobId job_id() const noexcept { return job_.job_id; }
        [[nodiscard]] const JobDescriptor& job() const noexcept { return job_; }
        [[nodiscard]] const EngineConfig& settings() const noexcept { return settings_; }
        [[nodiscard]] IArchiveStager& archive_stager() noexcept { return stager_; }
        /// Where this job's events go.
        [[nodiscard]] const EventSink& event_sink() const noexcept { return sink_; }

        /// Extension the routine must produce as `<base_name>.<ext>`.
        [[nodiscard]] const std::string& target_ext() const noexcept { return job_.primary_output_ext; }

        /**
         * @brief Installs the settings restored from the job snapshot.
         */
        void set_settings(EngineConfig settings) { settings_ = std::move(settings); }

        void output(std::string_view message);
        void error(std::string_view message);

        void started();

        /**
         * @brief Emits the next StageProgress event, followed by the matching
         * FileProgressEvent. Ignored once kStageCount events were sent.
         */
        void report_stage(std::string_view description);

        /**
         * @brief Emits the StageProgress events still missing, with @p description.
         */
        void complete_stages(std::string_view description);

        /**
         * @brief Emits the terminal event. Missing stage events are sent first.
         * Only the first call has an effect.
         */
        void completed(bool success, JobError error, std::string_view message);

        [[nodiscard]] int stages_done() const noexcept { return stages_done_; }
        [[nodiscard]] bool is_completed() const noexcept { return completed_; }

        /**
         * @brief Runs an external tool with the job timeout, streaming its
         * stdout to output() and its stderr to error().
         */
        CommandResult run_tool(const std::vector<std::string>& argv,
                               const std::filesystem::path& cwd = {});

    private:
        void emit(const Event& event);

        JobDescriptor job_;
        EventSink sink_;
        IArchiveStager& stager_;
        EngineConfig settings_;
        int stages_done_ = 0;
        bool completed_ = false;
    };

} // namespace convoy

#endif // CONVOY_JOB_CONTEXT_HPP
