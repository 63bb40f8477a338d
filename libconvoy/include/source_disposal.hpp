/**
 * @file source_disposal.hpp
 * @brief Removal of consumed inputs: trash first, permanent delete as fallback.
 */

#ifndef CONVOY_SOURCE_DISPOSAL_HPP
#define CONVOY_SOURCE_DISPOSAL_HPP

#include <filesystem>
#include <string>
#include <system_error>

namespace convoy {

    enum class DisposalMethod {
        Trashed,  ///< Moved to the user's trash
        Deleted,  ///< Trash unavailable, removed permanently
        Missing,  ///< Nothing to do
        Failed
    };

    inline const char* disposal_method_to_string(const DisposalMethod m) {
        switch (m) {
            case DisposalMethod::Trashed: return "trashed";
            case DisposalMethod::Deleted: return "deleted";
            case DisposalMethod::Missing: return "missing";
            case DisposalMethod::Failed:  return "failed";
        }
        return "unknown";
    }

    /**
     * @brief Home trash directory: $XDG_DATA_HOME/Trash or ~/.local/share/Trash.
     */
    std::filesystem::path trash_directory();

    /**
     * @brief Moves @p path into the freedesktop.org home trash.
     *
     * Writes `info/<name>.trashinfo` (exclusively, picking `name.N` on
     * clashes) and renames the file into `files/<name>`. Fails with
     * EXDEV when the trash is on another file system.
     */
    bool move_to_trash(const std::filesystem::path& path, std::error_code& ec);

    /**
     * @brief Trashes @p path, falling back to permanent deletion.
     * @param detail Receives a human readable reason on failure.
     */
    DisposalMethod dispose_source(const std::filesystem::path& path, std::string& detail);

} // namespace convoy

#endif // CONVOY_SOURCE_DISPOSAL_HPP
