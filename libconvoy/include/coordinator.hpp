/**
 * @file coordinator.hpp
 * @brief Batch front door: submission, result aggregation, cancellation.
 */

#ifndef CONVOY_COORDINATOR_HPP
#define CONVOY_COORDINATOR_HPP

#include "engine_config.hpp"
#include "events.hpp"
#include "job.hpp"
#include "job_queue.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace convoy {

    class ConversionRegistry;
    class EventBus;

    /**
     * @brief Aggregate outcome of a batch.
     */
    struct BatchSummary {
        std::size_t succeeded = 0;
        std::size_t failed = 0;
        std::size_t cancelled = 0;
        std::size_t total = 0;     ///< Submitted jobs, cancelled ones included
    };

    /**
     * @brief Runs a batch of jobs on a pool of worker processes.
     *
     * @details The coordinator is single threaded. submit() turns requests
     * into descriptors carrying a snapshot of the current EngineConfig and
     * queues them; poll() drains the results channel without blocking,
     * updates the JobState table and republishes every event on the
     * EventBus. Events of unknown jobs are dropped with a warning.
     *
     * A worker that dies while running a job fails that job: the missing
     * StageProgress events and an Unhandled JobCompleted are synthesized
     * and a replacement worker is started. Jobs still queued once the job
     * queue has stayed empty for a while after a worker died were taken
     * by that worker before it could start them, and fail the same way.
     */
    class Coordinator {
    public:
        static constexpr std::chrono::milliseconds kPollInterval{100};

        /**
         * @param registry Routines available to the workers; must outlive the coordinator.
         * @param config Live settings, snapshotted per submitted job.
         * @param num_workers Pool size, at least 1.
         * @param bus Receives every event applied to the job table.
         */
        Coordinator(const ConversionRegistry& registry, EngineConfig config, std::size_t num_workers, EventBus& bus);
        ~Coordinator();

        Coordinator(const Coordinator&) = delete;
        Coordinator& operator=(const Coordinator&) = delete;

        /// Settings used for jobs submitted from now on.
        EngineConfig& config() noexcept { return config_; }
        [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

        /**
         * @brief Queues a job.
         * @return The new job id, greater than every id returned before.
         * @throws std::invalid_argument if the routine id is not registered, or
         * if a string of the job other than its paths is not valid UTF-8.
         * @throws std::logic_error after shutdown().
         */
        JobId submit(const JobRequest& request);

        /**
         * @brief Forks the worker pool. Jobs submitted earlier are already queued.
         */
        void start();

        /**
         * @brief One coordinator tick: reap workers, apply queued events,
         * top up the job queue. Never blocks.
         */
        void poll();

        /**
         * @brief True when no job is waiting and every tracked job is terminal.
         */
        [[nodiscard]] bool batch_complete() const;

        /**
         * @brief Drops every job not yet picked up by a worker.
         *
         * Dropped jobs leave the job table and count as cancelled; running
         * jobs are left alone and finish on their own.
         * @return Number of jobs dropped.
         */
        std::size_t cancel();

        /**
         * @brief Starts the pool if needed and polls until batch_complete().
         * @param stop_requested When set, cancel() is called once.
         */
        BatchSummary run_until_complete(const std::atomic<bool>* stop_requested = nullptr);

        /**
         * @brief Sends one sentinel per worker and waits for the pool to exit,
         * applying the events still in flight. Idempotent.
         */
        void shutdown();

        [[nodiscard]] BatchSummary summary() const;
        [[nodiscard]] const std::map<JobId, JobState>& jobs() const noexcept { return jobs_; }
        [[nodiscard]] bool cancelled() const noexcept { return cancelled_flag_; }
        [[nodiscard]] std::size_t live_workers() const noexcept { return pool_.live_count(); }

    private:
        void apply(const Event& event);
        void drain_results();
        void handle_worker_exits(const std::vector<WorkerPool::Exit>& exits);
        void fail_lost_jobs();
        void fail_job(JobState& state, const std::string& reason);

        const ConversionRegistry& registry_;
        EngineConfig config_;
        std::size_t num_workers_;
        EventBus& bus_;

        JobQueue queue_;
        ResultChannel results_;
        WorkerPool pool_;
        std::size_t respawns_left_;

        std::map<JobId, JobState> jobs_;
        JobId next_id_ = 1;
        std::size_t succeeded_ = 0;
        std::size_t failed_ = 0;
        std::size_t cancelled_ = 0;
        std::size_t submitted_ = 0;
        bool started_ = false;
        bool shutting_down_ = false;
        bool cancelled_flag_ = false;
        bool worker_lost_ = false;
        std::optional<std::chrono::steady_clock::time_point> queue_empty_since_;
    };

} // namespace convoy

#endif // CONVOY_COORDINATOR_HPP
