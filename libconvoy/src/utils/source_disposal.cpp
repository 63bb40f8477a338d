#include "../../include/source_disposal.hpp"
#include "../../include/logger.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fcntl.h>
#include <string>
#include <unistd.h>

namespace convoy {

    namespace fs = std::filesystem;

    namespace {

        std::string percent_encode(const std::string& s) {
            static const char* hex = "0123456789ABCDEF";
            std::string out;
            for (const unsigned char c : s) {
                if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~') {
                    out.push_back(static_cast<char>(c));
                } else {
                    out.push_back('%');
                    out.push_back(hex[c >> 4]);
                    out.push_back(hex[c & 0x0F]);
                }
            }
            return out;
        }

        std::string deletion_date() {
            const std::time_t now = std::time(nullptr);
            std::tm local{};
            localtime_r(&now, &local);
            char buf[32];
            std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
            return buf;
        }

        bool write_all(const int fd, const std::string& data) {
            std::size_t off = 0;
            while (off < data.size()) {
                const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
                off += static_cast<std::size_t>(n);
            }
            return true;
        }

    } // namespace

    fs::path trash_directory() {
        if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
            return fs::path(xdg) / "Trash";
        }
        const char* home = std::getenv("HOME");
        return fs::path(home ? home : ".") / ".local/share/Trash";
    }

    bool move_to_trash(const fs::path& path, std::error_code& ec) {
        ec.clear();
        const fs::path absolute = fs::absolute(path, ec);
        if (ec) return false;

        const fs::path trash = trash_directory();
        fs::create_directories(trash / "files", ec);
        if (!ec) fs::create_directories(trash / "info", ec);
        if (ec) return false;

        const std::string name = absolute.filename().string();
        const std::string info_text = "[Trash Info]\nPath=" + percent_encode(absolute.lexically_normal().string()) +
                                      "\nDeletionDate=" + deletion_date() + "\n";

        for (int n = 0; n < 1000; ++n) {
            const std::string candidate = n == 0 ? name : name + "." + std::to_string(n);
            const fs::path info = trash / "info" / (candidate + ".trashinfo");
            const int fd = ::open(info.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
            if (fd < 0) {
                if (errno == EEXIST) continue;
                ec.assign(errno, std::generic_category());
                return false;
            }
            const bool written = write_all(fd, info_text);
            ::close(fd);
            if (!written) {
                std::error_code ignored;
                fs::remove(info, ignored);
                ec.assign(EIO, std::generic_category());
                return false;
            }

            const fs::path target = trash / "files" / candidate;
            std::error_code exists_ec;
            if (fs::exists(fs::symlink_status(target, exists_ec))) {
                // stale file without info entry
                std::error_code ignored;
                fs::remove(info, ignored);
                continue;
            }
            fs::rename(absolute, target, ec);
            if (ec) {
                std::error_code ignored;
                fs::remove(info, ignored);
                return false;
            }
            return true;
        }
        ec = std::make_error_code(std::errc::file_exists);
        return false;
    }

    DisposalMethod dispose_source(const fs::path& path, std::string& detail) {
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(path, ec))) {
            return DisposalMethod::Missing;
        }
        if (move_to_trash(path, ec)) {
            Logger::log(LogLevel::Debug, "Moved to trash: " + path.string(), "source_disposal");
            return DisposalMethod::Trashed;
        }
        Logger::log(LogLevel::Debug, "Trash unavailable for " + path.string() + " (" + ec.message() +
                    "), deleting", "source_disposal");

        fs::remove_all(path, ec);
        if (ec) {
            detail = ec.message();
            return DisposalMethod::Failed;
        }
        return DisposalMethod::Deleted;
    }

} // namespace convoy
