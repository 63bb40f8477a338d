/**
 * @file disc_descriptor.hpp
 * @brief Dependency resolution for multi-file disc images (.cue / .gdi).
 *
 * A descriptor is a small text file listing the track files that make up
 * the image. Paths in the descriptor are relative to its own directory.
 */

#ifndef CONVOY_DISC_DESCRIPTOR_HPP
#define CONVOY_DISC_DESCRIPTOR_HPP

#include <filesystem>
#include <optional>
#include <vector>

namespace convoy {

    /**
     * @brief Files referenced by the FILE lines of a CUE sheet.
     * @return Normalized paths in order of appearance, or nullopt if the
     * sheet cannot be read. Referenced files are not checked for existence.
     */
    std::optional<std::vector<std::filesystem::path>>
    cue_dependencies(const std::filesystem::path& cue_path);

    /**
     * @brief Track files listed in a GDI descriptor.
     *
     * Track lines look like `1 0 4 2352 "track01.bin" 0`; the header line
     * (track count) and anything else that does not match is ignored.
     */
    std::optional<std::vector<std::filesystem::path>>
    gdi_dependencies(const std::filesystem::path& gdi_path);

    /**
     * @brief True for .cue and .gdi files (case-insensitive).
     */
    bool is_disc_descriptor(const std::filesystem::path& path);

    /**
     * @brief Dispatches on the extension; non-descriptors have no dependencies.
     */
    std::optional<std::vector<std::filesystem::path>>
    descriptor_dependencies(const std::filesystem::path& path);

    /**
     * @brief Existing files that belong with @p input and go away with it.
     *
     * Covers the descriptor dependencies and, for a .cue, every
     * `<stem>*.bin` in the same directory. @p input itself is not listed.
     */
    std::vector<std::filesystem::path> companion_files(const std::filesystem::path& input);

} // namespace convoy

#endif // CONVOY_DISC_DESCRIPTOR_HPP
