#include "../../include/subprocess.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <regex>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace convoy {

    namespace {

        constexpr auto kKillGrace = std::chrono::seconds(5);

        /// Accumulates raw pipe bytes and emits complete lines.
        class LineSplitter {
        public:
            explicit LineSplitter(const LineHandler& handler) : handler_(handler) {}

            void feed(const char* data, const std::size_t len) {
                for (std::size_t i = 0; i < len; ++i) {
                    const char c = data[i];
                    if (c == '\n' || c == '\r') {
                        emit();
                    } else {
                        buf_.push_back(c);
                    }
                }
            }

            void finish() { emit(); }

        private:
            void emit() {
                if (buf_.empty()) return;
                const std::string line = strip_ansi_codes(buf_);
                buf_.clear();
                if (!line.empty() && handler_) handler_(line);
            }

            const LineHandler& handler_;
            std::string buf_;
        };

        void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        int wait_child(const pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) return -1;
            }
            if (WIFEXITED(status)) return WEXITSTATUS(status);
            if (WIFSIGNALED(status)) return -WTERMSIG(status);
            return -1;
        }

        /// SIGTERM to the group, SIGKILL if it is still alive after the grace period.
        int terminate_group(const pid_t pid) {
            ::kill(-pid, SIGTERM);
            const auto give_up = std::chrono::steady_clock::now() + kKillGrace;
            int status = 0;
            while (std::chrono::steady_clock::now() < give_up) {
                const pid_t r = ::waitpid(pid, &status, WNOHANG);
                if (r == pid) {
                    ::kill(-pid, SIGKILL); // leftovers of the group
                    return WIFEXITED(status) ? WEXITSTATUS(status) : -WTERMSIG(status);
                }
                if (r < 0 && errno != EINTR) return -1;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            ::kill(-pid, SIGKILL);
            return wait_child(pid);
        }

    } // namespace

    std::string strip_ansi_codes(const std::string_view text) {
        static const std::regex ansi(R"(\x1B(?:[@-Z\\\-_]|\[[0-?]*[ -/]*[@-~]))");
        return std::regex_replace(std::string(text), ansi, "");
    }

    std::optional<std::filesystem::path> find_executable(const std::string& name) {
        if (name.empty()) return std::nullopt;
        if (name.find('/') != std::string::npos) {
            if (::access(name.c_str(), X_OK) == 0) return std::filesystem::absolute(name);
            return std::nullopt;
        }
        const char* path_env = std::getenv("PATH");
        const std::string path_list = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
        std::size_t start = 0;
        while (start <= path_list.size()) {
            const auto end = path_list.find(':', start);
            const std::string dir = path_list.substr(start, end == std::string::npos ? std::string::npos : end - start);
            const auto candidate = std::filesystem::path(dir.empty() ? "." : dir) / name;
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
                return std::filesystem::absolute(candidate, ec);
            }
            if (end == std::string::npos) break;
            start = end + 1;
        }
        return std::nullopt;
    }

    CommandResult run_command(const std::vector<std::string>& argv,
                              const std::filesystem::path& cwd,
                              const std::chrono::seconds timeout,
                              const LineHandler& on_stdout,
                              const LineHandler& on_stderr) {
        CommandResult result;
        if (argv.empty()) {
            result.error = "empty command line";
            return result;
        }

        int out_pipe[2] = {-1, -1};
        int err_pipe[2] = {-1, -1};
        if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0) {
            result.error = std::string("pipe failed: ") + std::strerror(errno);
            close_fd(out_pipe[0]); close_fd(out_pipe[1]);
            close_fd(err_pipe[0]); close_fd(err_pipe[1]);
            return result;
        }

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);
        if (!cwd.empty()) {
            posix_spawn_file_actions_addchdir_np(&actions, cwd.c_str());
        }

        posix_spawnattr_t attr;
        posix_spawnattr_init(&attr);
        posix_spawnattr_setpgroup(&attr, 0);
        sigset_t defaults;
        sigemptyset(&defaults);
        sigaddset(&defaults, SIGINT);
        sigaddset(&defaults, SIGTERM);
        sigaddset(&defaults, SIGPIPE);
        posix_spawnattr_setsigdefault(&attr, &defaults);
        sigset_t mask;
        sigemptyset(&mask);
        posix_spawnattr_setsigmask(&attr, &mask);
        posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);

        pid_t pid = -1;
        const int rc = ::posix_spawnp(&pid, argv[0].c_str(), &actions, &attr, args.data(), environ);
        posix_spawn_file_actions_destroy(&actions);
        posix_spawnattr_destroy(&attr);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[1]);

        if (rc != 0) {
            result.error = "failed to launch '" + argv[0] + "': " + std::strerror(rc);
            close_fd(out_pipe[0]);
            close_fd(err_pipe[0]);
            return result;
        }
        result.launched = true;
        Logger::log(LogLevel::Debug, "Spawned '" + argv[0] + "' as pid " + std::to_string(pid), "subprocess");

        LineSplitter out_lines(on_stdout);
        LineSplitter err_lines(on_stderr);
        pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
        LineSplitter* splitters[2] = {&out_lines, &err_lines};

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        char buf[4096];
        while (fds[0].fd >= 0 || fds[1].fd >= 0) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timed_out = true;
                break;
            }
            const int wait_ms = static_cast<int>(std::min<std::int64_t>(remaining.count(), 250));
            const int n = ::poll(fds, 2, wait_ms);
            if (n < 0) {
                if (errno == EINTR) continue;
                result.error = std::string("poll failed: ") + std::strerror(errno);
                break;
            }
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0 || fds[i].revents == 0) continue;
                const ssize_t got = ::read(fds[i].fd, buf, sizeof(buf));
                if (got > 0) {
                    splitters[i]->feed(buf, static_cast<std::size_t>(got));
                } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
                    close_fd(fds[i].fd);
                }
            }
        }
        out_lines.finish();
        err_lines.finish();

        if (result.timed_out) {
            Logger::log(LogLevel::Warning, "'" + argv[0] + "' exceeded " +
                        std::to_string(timeout.count()) + "s, terminating", "subprocess");
            result.exit_code = terminate_group(pid);
        } else if (!result.error.empty()) {
            result.exit_code = terminate_group(pid);
        } else {
            result.exit_code = wait_child(pid);
        }
        close_fd(fds[0].fd);
        close_fd(fds[1].fd);
        return result;
    }

} // namespace convoy
