/**
 * @file worker_pool.hpp
 * @brief Fixed-size pool of forked worker processes.
 */

#ifndef CONVOY_WORKER_POOL_HPP
#define CONVOY_WORKER_POOL_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <set>
#include <string>
#include <sys/types.h>
#include <vector>

namespace convoy {

    class ConversionRegistry;
    class JobQueue;
    class ResultChannel;

    /**
     * @brief Body of a worker process: dequeue, process, repeat until the
     * shutdown sentinel arrives.
     *
     * Each job runs through a JobPipeline; any exception escaping it is
     * reported as an Unhandled failure of that job and the loop goes on.
     * @return Process exit code.
     */
    int run_worker_loop(JobQueue& queue, ResultChannel& results, const ConversionRegistry& registry);

    /**
     * @brief Owns the worker processes of a coordinator.
     *
     * @details Workers are created with fork(), so they start with a copy of
     * the coordinator's memory (registry, channels, log sinks) and share
     * nothing with it afterwards but the socket pairs. Workers ignore SIGINT:
     * an interrupt typed in the terminal reaches only the coordinator, which
     * turns it into a cancellation.
     */
    class WorkerPool {
    public:
        using WorkerMain = std::function<int()>;

        /**
         * @brief How a worker process ended.
         */
        struct Exit {
            pid_t pid = 0;
            int status = 0;      ///< Raw waitpid() status
            bool clean = false;  ///< Exited with code 0
            std::string describe() const;
        };

        /**
         * @param worker_main Runs in every child; its result becomes the exit code.
         */
        explicit WorkerPool(WorkerMain worker_main) : worker_main_(std::move(worker_main)) {}
        ~WorkerPool();

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        /**
         * @brief Forks @p count workers.
         * @throws std::system_error if fork() fails.
         */
        void start(std::size_t count);

        /**
         * @brief Forks one more worker.
         * @return Its pid.
         * @throws std::system_error if fork() fails.
         */
        pid_t spawn_one();

        /**
         * @brief Collects workers that have exited, without blocking.
         *
         * Only the pool's own pids are waited for, so tool processes of the
         * calling process are never reaped by accident.
         */
        std::vector<Exit> reap();

        [[nodiscard]] std::size_t live_count() const noexcept { return live_.size(); }
        [[nodiscard]] const std::set<pid_t>& pids() const noexcept { return live_; }

        /**
         * @brief Waits until every worker has exited or @p timeout elapses.
         * @return The exits collected while waiting.
         */
        std::vector<Exit> join(std::chrono::milliseconds timeout);

    private:
        WorkerMain worker_main_;
        std::set<pid_t> live_;
    };

} // namespace convoy

#endif // CONVOY_WORKER_POOL_HPP
