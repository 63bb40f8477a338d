/**
 * @file subprocess.hpp
 * @brief Runs external tools and streams their output line by line.
 */

#ifndef CONVOY_SUBPROCESS_HPP
#define CONVOY_SUBPROCESS_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace convoy {

    /**
     * @brief Outcome of one external command.
     */
    struct CommandResult {
        bool launched = false;   ///< False if the process could not be spawned
        int exit_code = -1;      ///< Exit status, or -signal if killed by a signal
        bool timed_out = false;  ///< The process group was killed after the timeout
        std::string error;       ///< Spawn or wait failure description

        [[nodiscard]] bool ok() const { return launched && !timed_out && exit_code == 0; }
    };

    using LineHandler = std::function<void(std::string_view)>;

    /**
     * @brief Runs @p argv (argv[0] looked up in PATH) and waits for it.
     *
     * The child gets its own process group, stdin from /dev/null and
     * piped stdout/stderr. Output is split on '\n' and '\r' (progress
     * lines), stripped of ANSI escapes and passed to the handlers without
     * the terminator; empty lines are dropped. When @p timeout expires the
     * whole group receives SIGTERM, then SIGKILL after a short grace period.
     *
     * @param argv Program and arguments; must not be empty.
     * @param cwd Working directory of the child, empty to inherit.
     * @param timeout Wall clock limit.
     * @param on_stdout Called for every stdout line (may be empty).
     * @param on_stderr Called for every stderr line (may be empty).
     */
    CommandResult run_command(const std::vector<std::string>& argv,
                              const std::filesystem::path& cwd,
                              std::chrono::seconds timeout,
                              const LineHandler& on_stdout,
                              const LineHandler& on_stderr);

    /**
     * @brief Removes ANSI escape sequences (colors, cursor movement).
     */
    std::string strip_ansi_codes(std::string_view text);

    /**
     * @brief Resolves @p name through PATH (or checks it directly if it contains '/').
     * @return Absolute path of an executable file, or nullopt.
     */
    std::optional<std::filesystem::path> find_executable(const std::string& name);

} // namespace convoy

#endif // CONVOY_SUBPROCESS_HPP
