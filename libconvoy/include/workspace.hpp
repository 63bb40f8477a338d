/**
 * @file workspace.hpp
 * @brief Per-job temporary directory with guaranteed cleanup.
 */

#ifndef CONVOY_WORKSPACE_HPP
#define CONVOY_WORKSPACE_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string_view>
#include <system_error>

namespace convoy {

    struct EngineConfig;

    /**
     * @brief Directory that stages and builds the outputs of one job.
     *
     * Layout:
     *   <root>/staged/   local copies and unpacked archives
     *   <root>/output/   where the conversion routine writes
     *
     * The root is created with mkdtemp(), so two jobs never get the same
     * directory even when their inputs share a name. The destructor calls
     * cleanup(), which is idempotent.
     */
    class Workspace {
    public:
        static constexpr int kCleanupAttempts = 3;
        static constexpr std::chrono::milliseconds kCleanupBackoff{500};

        /**
         * @brief Creates a workspace under @p base_dir named after @p input.
         * @param base_dir Parent directory, created if missing.
         * @param input Input path; its stem prefixes the directory name.
         * @param ec Set on failure.
         * @return The workspace, or std::nullopt on failure.
         */
        static std::optional<Workspace> create(const std::filesystem::path& base_dir,
                                               const std::filesystem::path& input,
                                               std::error_code& ec);

        /**
         * @brief Base directory for the workspace of @p input under @p settings.
         *
         * With copy_locally enabled this is the configured temp directory,
         * otherwise a `_processing_temps_` folder beside the input.
         */
        static std::filesystem::path base_dir_for(const EngineConfig& settings,
                                                  const std::filesystem::path& input);

        Workspace(Workspace&& other) noexcept;
        Workspace& operator=(Workspace&& other) noexcept;
        Workspace(const Workspace&) = delete;
        Workspace& operator=(const Workspace&) = delete;
        ~Workspace();

        [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
        [[nodiscard]] std::filesystem::path staging_dir() const { return root_ / "staged"; }
        [[nodiscard]] std::filesystem::path output_dir() const { return root_ / "output"; }

        /**
         * @brief Removes the workspace; safe to call any number of times.
         * @return true if the directory is gone afterwards.
         */
        bool cleanup();

    private:
        Workspace(std::filesystem::path root, std::filesystem::path base, bool remove_base);

        std::filesystem::path root_;
        std::filesystem::path base_;    ///< Parent, removed when empty if remove_base_
        bool remove_base_ = false;
    };

    /**
     * @brief Recursively removes @p dir, retrying on transient errors.
     * @param dir Directory to remove. A missing directory counts as removed.
     * @param attempts Total number of attempts.
     * @param backoff Sleep between attempts.
     * @param tag Logger tag.
     * @return true if @p dir no longer exists.
     */
    bool remove_dir_with_retries(const std::filesystem::path& dir,
                                 int attempts = Workspace::kCleanupAttempts,
                                 std::chrono::milliseconds backoff = Workspace::kCleanupBackoff,
                                 std::string_view tag = "workspace");

} // namespace convoy

#endif // CONVOY_WORKSPACE_HPP
