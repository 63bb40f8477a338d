/**
 * @file event_codec.hpp
 * @brief JSON wire format of the job queue and the results channel.
 *
 * Event messages look like
 * `{"job_id": 7, "type": "status_update", "data": {...}}` with type one of
 * job_started, status_update, file_progress_update, output_update,
 * error_update and job_completed. Queue messages are either a job payload
 * `{"type": "job", "job": {...}}` or the shutdown sentinel
 * `{"type": "shutdown"}`. Job paths that are not valid UTF-8 are sent as
 * arrays of bytes so that they reach the worker unchanged.
 */

#ifndef CONVOY_EVENT_CODEC_HPP
#define CONVOY_EVENT_CODEC_HPP

#include "events.hpp"
#include "job.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace convoy {

    /**
     * @brief Serializes an event to a single wire message.
     */
    std::string encode_event(const Event& event);

    /**
     * @brief Parses a wire message back into an event.
     * @throws nlohmann::json::exception on malformed JSON or missing fields.
     * @throws std::invalid_argument on an unknown event type.
     */
    Event decode_event(std::string_view message);

    /**
     * @brief Serializes a job descriptor into a queue message.
     * @throws std::invalid_argument if a string other than a path (routine id,
     * extension, setting) is not valid UTF-8.
     */
    std::string encode_job(const JobDescriptor& job);

    /**
     * @brief Parses a queue message holding a job payload.
     * @throws nlohmann::json::exception on malformed payloads.
     * @throws std::invalid_argument if the message is not a job.
     * Rejected settings do not throw: they are reported through
     * JobDescriptor::settings_error.
     */
    JobDescriptor decode_job(std::string_view message);

    /**
     * @brief Best-effort extraction of the job id from a queue message.
     * @return The id, or 0 if none can be read.
     */
    JobId peek_job_id(std::string_view message) noexcept;

    /**
     * @brief The shutdown sentinel.
     */
    std::string encode_shutdown();

    /**
     * @brief True if @p message is the shutdown sentinel.
     */
    bool is_shutdown(std::string_view message) noexcept;

} // namespace convoy

#endif // CONVOY_EVENT_CODEC_HPP
