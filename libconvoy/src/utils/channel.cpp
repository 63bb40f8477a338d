#include "../../include/channel.hpp"
#include "../../include/logger.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <sys/socket.h>
#include <unistd.h>

namespace convoy {

    MessageChannel::MessageChannel() {
        int fds[2];
        if (::socketpair(AF_UNIX, SOCK_SEQPACKET | SOCK_CLOEXEC, 0, fds) != 0) {
            throw std::system_error(errno, std::generic_category(), "socketpair");
        }
        write_fd_ = fds[0];
        read_fd_ = fds[1];
    }

    MessageChannel::~MessageChannel() {
        close_write_end();
        close_read_end();
    }

    void MessageChannel::close_write_end() noexcept {
        if (write_fd_ >= 0) {
            ::close(write_fd_);
            write_fd_ = -1;
        }
    }

    void MessageChannel::close_read_end() noexcept {
        if (read_fd_ >= 0) {
            ::close(read_fd_);
            read_fd_ = -1;
        }
    }

    MessageChannel::SendStatus MessageChannel::send(const std::string_view message) {
        return send_with_flags(message, 0);
    }

    MessageChannel::SendStatus MessageChannel::try_send(const std::string_view message) {
        return send_with_flags(message, MSG_DONTWAIT);
    }

    MessageChannel::SendStatus MessageChannel::send_with_flags(const std::string_view message, const int flags) {
        if (message.size() > kMaxMessage) {
            throw std::length_error("message of " + std::to_string(message.size()) +
                                    " bytes exceeds the channel limit");
        }
        if (write_fd_ < 0) return SendStatus::Closed;

        while (true) {
            const ssize_t n = ::send(write_fd_, message.data(), message.size(), flags | MSG_NOSIGNAL);
            if (n >= 0) return SendStatus::Sent;
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return SendStatus::WouldBlock;
            Logger::log(LogLevel::Error, std::string("send failed: ") + std::strerror(errno), "channel");
            return SendStatus::Closed;
        }
    }

    std::optional<std::string> MessageChannel::receive() {
        return receive_with_flags(0);
    }

    std::optional<std::string> MessageChannel::try_receive() {
        return receive_with_flags(MSG_DONTWAIT);
    }

    bool MessageChannel::has_pending() const noexcept {
        if (read_fd_ < 0) return false;
        char byte;
        ssize_t n;
        do {
            n = ::recv(read_fd_, &byte, sizeof(byte), MSG_PEEK | MSG_DONTWAIT | MSG_TRUNC);
        } while (n < 0 && errno == EINTR);
        return n >= 0;
    }

    std::optional<std::string> MessageChannel::receive_with_flags(const int flags) {
        if (read_fd_ < 0) return std::nullopt;

        std::vector<char> buffer(kMaxMessage);
        while (true) {
            // MSG_TRUNC makes recv report the full length of an oversized message
            const ssize_t n = ::recv(read_fd_, buffer.data(), buffer.size(), flags | MSG_TRUNC);
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    Logger::log(LogLevel::Error, std::string("recv failed: ") + std::strerror(errno), "channel");
                }
                return std::nullopt;
            }
            if (n == 0) return std::nullopt;
            if (static_cast<std::size_t>(n) > buffer.size()) {
                Logger::log(LogLevel::Warning, "Dropped oversized message of " + std::to_string(n) + " bytes",
                            "channel");
                continue;
            }
            return std::string(buffer.data(), static_cast<std::size_t>(n));
        }
    }

} // namespace convoy
