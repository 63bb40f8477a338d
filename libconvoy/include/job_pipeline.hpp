/**
 * @file job_pipeline.hpp
 * @brief Per-job state machine: Preparing, Staging, Converting, Finalizing, Cleanup.
 */

#ifndef CONVOY_JOB_PIPELINE_HPP
#define CONVOY_JOB_PIPELINE_HPP

#include "job.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace convoy {

    class ConversionRegistry;
    class IConversionRoutine;
    class JobContext;
    class Workspace;

    /**
     * @brief Outcome of one pipeline stage.
     */
    struct StageResult {
        JobError error = JobError::None;
        std::string message;

        [[nodiscard]] bool ok() const noexcept { return error == JobError::None; }

        static StageResult success() { return {}; }
        static StageResult failure(const JobError error, std::string message) {
            return {error, std::move(message)};
        }
    };

    /**
     * @brief Runs one job from its descriptor to its terminal event.
     *
     * @details Every expected failure ends the job through a StageResult:
     * the workspace is removed, the missing StageProgress events are
     * synthesized as "Failed" and a JobCompleted event follows. Exceptions
     * are not caught here; they unwind through the Workspace destructor and
     * are reported by the worker loop.
     */
    class JobPipeline {
    public:
        explicit JobPipeline(const ConversionRegistry& registry) : registry_(registry) {}

        /**
         * @brief Processes the job of @p ctx.
         * @return true if the job completed successfully.
         */
        bool run(JobContext& ctx) const;

    private:
        struct Prepared {
            IConversionRoutine* routine = nullptr;
            std::filesystem::path destination_dir;
            std::string base_name;
        };

        StageResult prepare(JobContext& ctx, Prepared& prepared, std::optional<Workspace>& workspace) const;
        static StageResult stage(JobContext& ctx, const Workspace& workspace, std::filesystem::path& staged_input);
        static StageResult convert(JobContext& ctx, const Prepared& prepared, const Workspace& workspace,
                                   const std::filesystem::path& staged_input);
        static StageResult finalize(JobContext& ctx, const Prepared& prepared, const Workspace& workspace);
        static void dispose_sources(JobContext& ctx);

        const ConversionRegistry& registry_;
    };

} // namespace convoy

#endif // CONVOY_JOB_PIPELINE_HPP
