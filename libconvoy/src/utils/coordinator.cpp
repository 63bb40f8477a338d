#include "../../include/coordinator.hpp"
#include "../../include/conversion_registry.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/event_codec.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <type_traits>

namespace convoy {

    namespace {

        constexpr auto kShutdownTick = std::chrono::milliseconds(20);
        constexpr std::size_t kRespawnsPerWorker = 3;
        constexpr auto kLostJobGrace = std::chrono::seconds(2);

        std::string job_tag(const JobId id) {
            return "job " + std::to_string(id);
        }

    } // namespace

    Coordinator::Coordinator(const ConversionRegistry& registry, EngineConfig config,
                             const std::size_t num_workers, EventBus& bus)
        : registry_(registry),
          config_(std::move(config)),
          num_workers_(std::max<std::size_t>(1, num_workers)),
          bus_(bus),
          pool_([this] { return run_worker_loop(queue_, results_, registry_); }),
          respawns_left_(num_workers_ * kRespawnsPerWorker) {}

    Coordinator::~Coordinator() {
        try {
            shutdown();
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("Shutdown failed: ") + e.what(), "coordinator");
        }
    }

    JobId Coordinator::submit(const JobRequest& request) {
        if (shutting_down_) {
            throw std::logic_error("coordinator is shut down");
        }
        if (!registry_.contains(request.routine_id)) {
            throw std::invalid_argument("unknown conversion routine '" + request.routine_id + "'");
        }

        JobDescriptor job;
        job.job_id = next_id_;
        job.input_path = request.input_path;
        job.routine_id = request.routine_id;
        job.output_dir = request.output_dir;
        job.primary_output_ext = request.primary_output_ext;
        job.secondary_output_ext = request.secondary_output_ext;
        job.overwrite_allowed = request.overwrite_allowed;
        job.multi_file_input = request.multi_file_input;
        job.archive_media_exts = request.archive_media_exts;
        job.settings = config_.snapshot();

        queue_.push(encode_job(job));
        ++next_id_;
        ++submitted_;

        JobState state;
        state.job_id = job.job_id;
        state.filename = job.input_path.filename().string();
        state.input_path = job.input_path;
        jobs_.emplace(job.job_id, std::move(state));

        Logger::log(LogLevel::Debug, "Queued " + job.input_path.string() + " (" + job.routine_id + ")",
                    job_tag(job.job_id));
        return job.job_id;
    }

    void Coordinator::start() {
        if (started_) return;
        if (shutting_down_) {
            throw std::logic_error("coordinator is shut down");
        }
        pool_.start(num_workers_);
        started_ = true;
        queue_.flush();
    }

    void Coordinator::poll() {
        if (!started_) return;
        const auto exits = pool_.reap();
        drain_results();
        handle_worker_exits(exits);
        queue_.flush();
        fail_lost_jobs();
    }

    bool Coordinator::batch_complete() const {
        // a job still in the queue is always tracked as queued
        return std::all_of(jobs_.begin(), jobs_.end(), [](const auto& entry) {
            return is_terminal(entry.second.status);
        });
    }

    std::size_t Coordinator::cancel() {
        cancelled_flag_ = true;
        std::size_t dropped = 0;
        for (const JobId id : queue_.drain()) {
            const auto it = jobs_.find(id);
            if (it == jobs_.end() || it->second.status != JobStatus::Queued) continue;
            Logger::log(LogLevel::Info, "Cancelled " + it->second.filename, job_tag(id));
            jobs_.erase(it);
            ++dropped;
        }
        cancelled_ += dropped;

        const auto running = std::count_if(jobs_.begin(), jobs_.end(), [](const auto& entry) {
            return !is_terminal(entry.second.status);
        });
        Logger::log(LogLevel::Info, "Cancellation: " + std::to_string(dropped) + " queued job(s) dropped, " +
                    std::to_string(running) + " left to finish", "coordinator");
        return dropped;
    }

    BatchSummary Coordinator::run_until_complete(const std::atomic<bool>* stop_requested) {
        start();
        while (true) {
            poll();
            if (stop_requested && stop_requested->load() && !cancelled_flag_) {
                cancel();
            }
            if (batch_complete()) break;
            std::this_thread::sleep_for(kPollInterval);
        }
        return summary();
    }

    void Coordinator::shutdown() {
        if (shutting_down_) return;
        shutting_down_ = true;
        if (!started_) return;

        for (std::size_t i = 0; i < pool_.live_count(); ++i) {
            queue_.push_sentinel();
        }
        while (pool_.live_count() > 0) {
            const auto exits = pool_.reap();
            drain_results();
            handle_worker_exits(exits);
            queue_.flush();
            if (pool_.live_count() > 0) std::this_thread::sleep_for(kShutdownTick);
        }
        drain_results();
        Logger::log(LogLevel::Info, "Worker pool stopped", "coordinator");
    }

    BatchSummary Coordinator::summary() const {
        BatchSummary s;
        s.succeeded = succeeded_;
        s.failed = failed_;
        s.cancelled = cancelled_;
        s.total = submitted_;
        return s;
    }

    void Coordinator::drain_results() {
        for (const auto& event : results_.drain()) {
            apply(event);
        }
    }

    void Coordinator::apply(const Event& event) {
        const JobId id = event_job_id(event);
        const auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            Logger::log(LogLevel::Warning, "Dropping event for unknown job " + std::to_string(id), "coordinator");
            return;
        }
        JobState& state = it->second;
        if (is_terminal(state.status)) {
            Logger::log(LogLevel::Warning, "Dropping event for finished job " + std::to_string(id), "coordinator");
            return;
        }
        const std::string tag = job_tag(id);

        std::visit([&](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, JobStartedEvent>) {
                state.status = JobStatus::Running;
                state.worker_pid = e.worker_pid;
                if (state.filename.empty()) state.filename = e.filename;
                Logger::log(LogLevel::Info, "Started " + state.filename + " on worker " +
                            std::to_string(e.worker_pid), tag);
            } else if constexpr (std::is_same_v<T, StageProgressEvent>) {
                state.stages_done = std::max(state.stages_done, std::clamp(e.stages_done, 0, kStageCount));
                state.percentage = std::clamp(e.percentage, 0.0, 100.0);
                Logger::log(LogLevel::Debug, e.description + " (" + std::to_string(state.stages_done) + "/" +
                            std::to_string(kStageCount) + ")", tag);
            } else if constexpr (std::is_same_v<T, FileProgressEvent>) {
                state.percentage = std::max(state.percentage, std::clamp(e.percentage, 0.0, 100.0));
            } else if constexpr (std::is_same_v<T, OutputLineEvent>) {
                Logger::log(LogLevel::Debug, e.message, tag);
            } else if constexpr (std::is_same_v<T, ErrorLineEvent>) {
                Logger::log(LogLevel::Info, e.message, tag);
            } else {
                state.status = e.success ? JobStatus::CompletedSuccess : JobStatus::CompletedFailure;
                state.error = e.error;
                state.message = e.message;
                if (e.success) {
                    ++succeeded_;
                    Logger::log(LogLevel::Info, state.filename + ": " + e.message, tag);
                } else {
                    ++failed_;
                    Logger::log(LogLevel::Error, state.filename + " failed (" +
                                job_error_to_string(e.error) + "): " + e.message, tag);
                }
            }
            bus_.publish(e);
        }, event);
    }

    void Coordinator::handle_worker_exits(const std::vector<WorkerPool::Exit>& exits) {
        if (!exits.empty() && !shutting_down_) worker_lost_ = true;
        for (const auto& exit : exits) {
            for (auto& [id, state] : jobs_) {
                if (state.status == JobStatus::Running && state.worker_pid == exit.pid) {
                    fail_job(state, "worker process " + std::to_string(exit.pid) + " " + exit.describe());
                }
            }
            if (shutting_down_) continue;

            if (respawns_left_ == 0) {
                Logger::log(LogLevel::Error, "Worker respawn limit reached", "coordinator");
                continue;
            }
            --respawns_left_;
            try {
                pool_.spawn_one();
            } catch (const std::system_error& e) {
                Logger::log(LogLevel::Error, std::string("Cannot replace worker: ") + e.what(), "coordinator");
            }
        }

        if (!exits.empty() && !shutting_down_ && pool_.live_count() == 0) {
            Logger::log(LogLevel::Error, "No worker process left, failing the remaining jobs", "coordinator");
            queue_.drain();
            for (auto& [id, state] : jobs_) {
                if (!is_terminal(state.status)) fail_job(state, "no worker process left");
            }
        }
    }

    void Coordinator::fail_lost_jobs() {
        // a worker that died between dequeuing a job and starting it took the job along
        const bool waiting = std::any_of(jobs_.begin(), jobs_.end(), [](const auto& entry) {
            return entry.second.status == JobStatus::Queued;
        });
        if (!worker_lost_ || !waiting || !queue_.empty()) {
            queue_empty_since_.reset();
            return;
        }
        const auto now = std::chrono::steady_clock::now();
        if (!queue_empty_since_) {
            queue_empty_since_ = now;
            return;
        }
        if (now - *queue_empty_since_ < kLostJobGrace) return;

        for (auto& [id, state] : jobs_) {
            if (state.status == JobStatus::Queued) {
                fail_job(state, "job lost by a worker process that exited before starting it");
            }
        }
        worker_lost_ = false;
        queue_empty_since_.reset();
    }

    void Coordinator::fail_job(JobState& state, const std::string& reason) {
        const JobId id = state.job_id;
        apply(ErrorLineEvent{id, "ERROR: " + reason});
        for (int n = state.stages_done + 1; n <= kStageCount; ++n) {
            StageProgressEvent stage;
            stage.job_id = id;
            stage.description = "Failed";
            stage.stages_done = n;
            stage.total_stages = kStageCount;
            stage.percentage = 100.0 * n / kStageCount;
            apply(stage);
            apply(FileProgressEvent{id, stage.percentage});
        }
        apply(JobCompletedEvent{id, false, JobError::Unhandled, reason});
    }

} // namespace convoy
