#include "../../include/job_context.hpp"
#include "../../include/logger.hpp"

#include <unistd.h>

namespace convoy {

    namespace {
        std::string clip(std::string_view message) {
            if (message.size() <= JobContext::kMaxMessageLength) return std::string(message);
            return std::string(message.substr(0, JobContext::kMaxMessageLength)) + " [...]";
        }
    }

    JobContext::JobContext(const JobDescriptor& job, EventSink sink, IArchiveStager& stager)
        : job_(job), sink_(std::move(sink)), stager_(stager) {}

    void JobContext::emit(const Event& event) {
        if (sink_) sink_(event);
    }

    void JobContext::output(const std::string_view message) {
        emit(OutputLineEvent{job_.job_id, clip(message)});
    }

    void JobContext::error(const std::string_view message) {
        emit(ErrorLineEvent{job_.job_id, clip(message)});
    }

    void JobContext::started() {
        JobStartedEvent e;
        e.job_id = job_.job_id;
        e.filename = job_.input_path.filename().string();
        e.total_stages = kStageCount;
        e.worker_pid = ::getpid();
        emit(e);
    }

    void JobContext::report_stage(const std::string_view description) {
        if (stages_done_ >= kStageCount) {
            Logger::log(LogLevel::Warning, "Extra stage report ignored: " + std::string(description),
                        "job " + std::to_string(job_.job_id));
            return;
        }
        ++stages_done_;
        StageProgressEvent e;
        e.job_id = job_.job_id;
        e.description = std::string(description);
        e.stages_done = stages_done_;
        e.total_stages = kStageCount;
        e.percentage = 100.0 * stages_done_ / kStageCount;
        emit(e);
        emit(FileProgressEvent{job_.job_id, e.percentage});
    }

    void JobContext::complete_stages(const std::string_view description) {
        while (stages_done_ < kStageCount) {
            report_stage(description);
        }
    }

    void JobContext::completed(const bool success, const JobError error, const std::string_view message) {
        if (completed_) return;
        complete_stages(success ? "Done" : "Failed");
        completed_ = true;
        emit(JobCompletedEvent{job_.job_id, success, success ? JobError::None : error, std::string(message)});
    }

    CommandResult JobContext::run_tool(const std::vector<std::string>& argv, const std::filesystem::path& cwd) {
        std::string line;
        for (const auto& a : argv) {
            if (!line.empty()) line += ' ';
            line += a.find(' ') == std::string::npos ? a : "\"" + a + "\"";
        }
        output(">> Running: " + line);

        CommandResult result = run_command(argv, cwd, settings_.subprocess_timeout,
            [this](const std::string_view l) { output(l); },
            [this](const std::string_view l) { error(l); });

        if (!result.launched) {
            error("ERROR: " + result.error);
        } else if (result.timed_out) {
            error("ERROR: '" + argv.front() + "' timed out after " +
                  std::to_string(settings_.subprocess_timeout.count()) + "s");
        } else if (result.exit_code != 0) {
            error("ERROR: '" + argv.front() + "' exited with code " + std::to_string(result.exit_code));
        }
        return result;
    }

} // namespace convoy
