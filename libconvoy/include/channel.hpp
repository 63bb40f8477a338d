/**
 * @file channel.hpp
 * @brief Message-preserving socket pair shared between the coordinator and
 * its forked workers.
 */

#ifndef CONVOY_CHANNEL_HPP
#define CONVOY_CHANNEL_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace convoy {

    /**
     * @brief One-way channel over an AF_UNIX SOCK_SEQPACKET socket pair.
     *
     * @details Messages written to the write end are read whole from the
     * read end, one message per receive call. Both ends survive fork(), so
     * any number of processes can write or read concurrently: each message
     * reaches exactly one reader. Both descriptors are close-on-exec, so
     * the external tools never inherit them.
     */
    class MessageChannel {
    public:
        /// Largest message accepted by send().
        static constexpr std::size_t kMaxMessage = 128 * 1024;

        enum class SendStatus {
            Sent,
            WouldBlock, ///< Peer queue full, nothing written
            Closed      ///< No reader left or unrecoverable error
        };

        /**
         * @throws std::system_error if the socket pair cannot be created.
         */
        MessageChannel();
        ~MessageChannel();

        MessageChannel(const MessageChannel&) = delete;
        MessageChannel& operator=(const MessageChannel&) = delete;

        /**
         * @brief Writes one message, waiting for room if the peer queue is full.
         * @throws std::length_error if @p message exceeds kMaxMessage.
         */
        SendStatus send(std::string_view message);

        /**
         * @brief Writes one message without waiting.
         * @throws std::length_error if @p message exceeds kMaxMessage.
         */
        SendStatus try_send(std::string_view message);

        /**
         * @brief Waits for the next message.
         * @return std::nullopt once every write end is closed or on error.
         */
        std::optional<std::string> receive();

        /**
         * @brief Next message if one is queued.
         */
        std::optional<std::string> try_receive();

        /// True if a message waits at the read end. Nothing is consumed.
        [[nodiscard]] bool has_pending() const noexcept;

        /// Closes this process' copy of the write end.
        void close_write_end() noexcept;
        /// Closes this process' copy of the read end.
        void close_read_end() noexcept;

    private:
        SendStatus send_with_flags(std::string_view message, int flags);
        std::optional<std::string> receive_with_flags(int flags);

        int write_fd_ = -1;
        int read_fd_ = -1;
    };

} // namespace convoy

#endif // CONVOY_CHANNEL_HPP
