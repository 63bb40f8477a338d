#include "../../include/event_codec.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace convoy {

    using nlohmann::json;

    namespace {
        json wrap(const JobId id, const char* type, json data) {
            return json{{"job_id", id}, {"type", type}, {"data", std::move(data)}};
        }

        // Linux file names are bytes: anything that is not UTF-8 travels as a byte array
        json path_to_json(const std::filesystem::path& path) {
            const std::string& native = path.native();
            json as_string = native;
            try {
                (void)as_string.dump();
                return as_string;
            } catch (const json::type_error&) {
                return std::vector<std::uint8_t>(native.begin(), native.end());
            }
        }

        std::filesystem::path path_from_json(const json& j) {
            if (j.is_array()) {
                const auto bytes = j.get<std::vector<std::uint8_t>>();
                return std::string(bytes.begin(), bytes.end());
            }
            return j.get<std::string>();
        }
    }

    std::string encode_event(const Event& event) {
        const json j = std::visit([](const auto& e) -> json {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, JobStartedEvent>) {
                return wrap(e.job_id, "job_started",
                            {{"filename", e.filename}, {"total_stages", e.total_stages},
                             {"worker_pid", static_cast<std::int64_t>(e.worker_pid)}});
            } else if constexpr (std::is_same_v<T, StageProgressEvent>) {
                return wrap(e.job_id, "status_update",
                            {{"description", e.description}, {"current_step", e.stages_done},
                             {"total_steps", e.total_stages}, {"percentage", e.percentage}});
            } else if constexpr (std::is_same_v<T, FileProgressEvent>) {
                return wrap(e.job_id, "file_progress_update", {{"percentage", e.percentage}});
            } else if constexpr (std::is_same_v<T, OutputLineEvent>) {
                return wrap(e.job_id, "output_update", {{"message", e.message}});
            } else if constexpr (std::is_same_v<T, ErrorLineEvent>) {
                return wrap(e.job_id, "error_update", {{"message", e.message}});
            } else {
                return wrap(e.job_id, "job_completed",
                            {{"success", e.success}, {"error", job_error_to_string(e.error)},
                             {"message", e.message}});
            }
        }, event);
        // invalid UTF-8 from tool output is replaced rather than thrown on
        return j.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    Event decode_event(const std::string_view message) {
        const json j = json::parse(message);
        const auto id = j.at("job_id").get<JobId>();
        const auto type = j.at("type").get<std::string>();
        const json& data = j.at("data");

        if (type == "job_started") {
            JobStartedEvent e;
            e.job_id = id;
            e.filename = data.value("filename", std::string{});
            e.total_stages = data.value("total_stages", kStageCount);
            e.worker_pid = static_cast<pid_t>(data.value("worker_pid", std::int64_t{0}));
            return e;
        }
        if (type == "status_update") {
            StageProgressEvent e;
            e.job_id = id;
            e.description = data.value("description", std::string{});
            e.stages_done = data.at("current_step").get<int>();
            e.total_stages = data.value("total_steps", kStageCount);
            const double fallback = e.total_stages > 0
                ? 100.0 * e.stages_done / e.total_stages : 0.0;
            e.percentage = data.value("percentage", fallback);
            return e;
        }
        if (type == "file_progress_update") {
            return FileProgressEvent{id, data.at("percentage").get<double>()};
        }
        if (type == "output_update") {
            return OutputLineEvent{id, data.at("message").get<std::string>()};
        }
        if (type == "error_update") {
            return ErrorLineEvent{id, data.at("message").get<std::string>()};
        }
        if (type == "job_completed") {
            JobCompletedEvent e;
            e.job_id = id;
            e.success = data.at("success").get<bool>();
            e.error = job_error_from_string(data.value("error", std::string{}));
            if (!e.success && e.error == JobError::None) e.error = JobError::Unhandled;
            e.message = data.value("message", std::string{});
            return e;
        }
        throw std::invalid_argument("unknown event type: " + type);
    }

    std::string encode_job(const JobDescriptor& job) {
        const json payload = {
            {"job_id", job.job_id},
            {"input_path", path_to_json(job.input_path)},
            {"routine_id", job.routine_id},
            {"output_dir", path_to_json(job.output_dir)},
            {"primary_output_ext", job.primary_output_ext},
            {"secondary_output_ext", job.secondary_output_ext},
            {"overwrite_allowed", job.overwrite_allowed},
            {"multi_file_input", job.multi_file_input},
            {"archive_media_exts", job.archive_media_exts},
            {"settings", job.settings.to_json()}
        };
        try {
            return json{{"type", "job"}, {"job", payload}}.dump();
        } catch (const json::type_error& e) {
            throw std::invalid_argument(std::string("job is not serializable: ") + e.what());
        }
    }

    JobDescriptor decode_job(const std::string_view message) {
        const json j = json::parse(message);
        if (j.at("type").get<std::string>() != "job") {
            throw std::invalid_argument("queue message is not a job");
        }
        const json& p = j.at("job");
        JobDescriptor job;
        job.job_id = p.at("job_id").get<JobId>();
        job.input_path = path_from_json(p.at("input_path"));
        job.routine_id = p.at("routine_id").get<std::string>();
        if (const auto it = p.find("output_dir"); it != p.end()) job.output_dir = path_from_json(*it);
        job.primary_output_ext = p.value("primary_output_ext", std::string{});
        job.secondary_output_ext = p.value("secondary_output_ext", std::string{});
        job.overwrite_allowed = p.value("overwrite_allowed", false);
        job.multi_file_input = p.value("multi_file_input", false);
        job.archive_media_exts = p.value("archive_media_exts", std::vector<std::string>{});
        try {
            job.settings = SettingsSnapshot::from_json(p.value("settings", json::object()));
        } catch (const SettingsError& e) {
            // reported by the pipeline as a setup failure of this job
            job.settings_error = e.what();
        }
        return job;
    }

    JobId peek_job_id(const std::string_view message) noexcept {
        const json j = json::parse(message, nullptr, false);
        if (j.is_discarded() || !j.is_object()) return 0;
        const auto it = j.find("job");
        if (it == j.end() || !it->is_object()) return 0;
        const auto id = it->find("job_id");
        if (id == it->end() || !id->is_number_integer()) return 0;
        return id->get<JobId>();
    }

    std::string encode_shutdown() {
        return json{{"type", "shutdown"}}.dump();
    }

    bool is_shutdown(const std::string_view message) noexcept {
        const json j = json::parse(message, nullptr, false);
        if (j.is_discarded() || !j.is_object()) return false;
        const auto it = j.find("type");
        return it != j.end() && it->is_string() && it->get<std::string>() == "shutdown";
    }

} // namespace convoy
