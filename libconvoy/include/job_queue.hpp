/**
 * @file job_queue.hpp
 * @brief Cross-process job queue and results channel.
 */

#ifndef CONVOY_JOB_QUEUE_HPP
#define CONVOY_JOB_QUEUE_HPP

#include "channel.hpp"
#include "events.hpp"
#include "job.hpp"
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace convoy {

    /**
     * @brief FIFO of encoded jobs, one producer (the coordinator) and many
     * consumers (the workers).
     *
     * @details The socket holds only a handful of messages at once, so the
     * producer keeps a backlog of what did not fit and tops the socket up
     * with flush() on every tick. push() therefore never blocks.
     */
    class JobQueue {
    public:
        struct Item {
            bool is_sentinel = false;
            std::string payload; ///< Encoded job when !is_sentinel
        };

        JobQueue() = default;

        /**
         * @brief Enqueues an encoded job (see encode_job()).
         * @throws std::length_error if the payload exceeds MessageChannel::kMaxMessage.
         */
        void push(std::string payload);

        /**
         * @brief Enqueues one shutdown sentinel.
         */
        void push_sentinel();

        /**
         * @brief Moves as much of the backlog into the socket as fits.
         * @return Number of messages moved.
         */
        std::size_t flush();

        /**
         * @brief Worker side: waits for the next job or sentinel.
         * @return std::nullopt if the producer is gone.
         */
        std::optional<Item> pop();

        /**
         * @brief Producer side: removes every job not yet dequeued.
         *
         * Sentinels survive the drain and are requeued.
         * @return Ids of the removed jobs.
         */
        std::vector<JobId> drain();

        /// True when nothing waits in the producer backlog.
        [[nodiscard]] bool backlog_empty() const noexcept { return backlog_.empty(); }
        [[nodiscard]] std::size_t backlog_size() const noexcept { return backlog_.size(); }

        /// True when no message waits in the backlog nor in the socket.
        [[nodiscard]] bool empty() const noexcept { return backlog_.empty() && !channel_.has_pending(); }

        /// Called in a worker right after fork().
        void detach_producer() noexcept { channel_.close_write_end(); }

    private:
        MessageChannel channel_;
        std::deque<std::string> backlog_;
    };

    /**
     * @brief Events flowing from the workers back to the coordinator.
     */
    class ResultChannel {
    public:
        ResultChannel() = default;

        /**
         * @brief Worker side: sends one event, waiting for room.
         * @return false if the coordinator is gone.
         */
        bool publish(const Event& event);

        /**
         * @brief Coordinator side: every event currently queued, in arrival order.
         *
         * Undecodable messages are logged and skipped.
         * @param max_events Upper bound per call, 0 for no bound.
         */
        std::vector<Event> drain(std::size_t max_events = 0);

        /// Called in a worker right after fork().
        void detach_consumer() noexcept { channel_.close_read_end(); }

    private:
        MessageChannel channel_;
    };

} // namespace convoy

#endif // CONVOY_JOB_QUEUE_HPP
