#include "../../include/job_queue.hpp"
#include "../../include/event_codec.hpp"
#include "../../include/logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <stdexcept>

namespace convoy {

    void JobQueue::push(std::string payload) {
        if (payload.size() > MessageChannel::kMaxMessage) {
            throw std::length_error("job payload of " + std::to_string(payload.size()) +
                                    " bytes exceeds the queue limit");
        }
        backlog_.push_back(std::move(payload));
        flush();
    }

    void JobQueue::push_sentinel() {
        push(encode_shutdown());
    }

    std::size_t JobQueue::flush() {
        std::size_t moved = 0;
        while (!backlog_.empty()) {
            const auto status = channel_.try_send(backlog_.front());
            if (status == MessageChannel::SendStatus::WouldBlock) break;
            if (status == MessageChannel::SendStatus::Closed) {
                Logger::log(LogLevel::Error, "Job queue closed with " + std::to_string(backlog_.size()) +
                            " message(s) pending", "job_queue");
                break;
            }
            backlog_.pop_front();
            ++moved;
        }
        return moved;
    }

    std::optional<JobQueue::Item> JobQueue::pop() {
        auto message = channel_.receive();
        if (!message) return std::nullopt;

        Item item;
        item.is_sentinel = is_shutdown(*message);
        if (!item.is_sentinel) item.payload = std::move(*message);
        return item;
    }

    std::vector<JobId> JobQueue::drain() {
        std::vector<JobId> removed;
        std::size_t sentinels = 0;

        const auto take = [&](const std::string& message) {
            if (is_shutdown(message)) {
                ++sentinels;
            } else {
                removed.push_back(peek_job_id(message));
            }
        };

        while (auto message = channel_.try_receive()) {
            take(*message);
        }
        for (const auto& message : backlog_) {
            take(message);
        }
        backlog_.clear();

        for (std::size_t i = 0; i < sentinels; ++i) {
            backlog_.push_back(encode_shutdown());
        }
        flush();
        return removed;
    }

    bool ResultChannel::publish(const Event& event) {
        std::string message = encode_event(event);
        if (message.size() > MessageChannel::kMaxMessage) {
            Logger::log(LogLevel::Warning, "Event too large for the results channel, truncating it",
                        "job " + std::to_string(event_job_id(event)));
            Event clipped = event;
            std::visit([](auto& e) {
                if constexpr (requires { e.message; }) {
                    e.message.resize(std::min<std::size_t>(e.message.size(), 1024));
                }
            }, clipped);
            message = encode_event(clipped);
        }
        return channel_.send(message) == MessageChannel::SendStatus::Sent;
    }

    std::vector<Event> ResultChannel::drain(const std::size_t max_events) {
        std::vector<Event> events;
        while (max_events == 0 || events.size() < max_events) {
            auto message = channel_.try_receive();
            if (!message) break;
            try {
                events.push_back(decode_event(*message));
            } catch (const nlohmann::json::exception& e) {
                Logger::log(LogLevel::Warning, std::string("Malformed event skipped: ") + e.what(), "results");
            } catch (const std::invalid_argument& e) {
                Logger::log(LogLevel::Warning, std::string("Unknown event skipped: ") + e.what(), "results");
            }
        }
        return events;
    }

} // namespace convoy
