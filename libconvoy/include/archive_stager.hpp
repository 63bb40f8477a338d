/**
 * @file archive_stager.hpp
 * @brief Unpacks archive inputs into a job workspace.
 */

#ifndef CONVOY_ARCHIVE_STAGER_HPP
#define CONVOY_ARCHIVE_STAGER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace convoy {

    /**
     * @brief Archive extraction collaborator of the job pipeline.
     */
    class IArchiveStager {
    public:
        virtual ~IArchiveStager() = default;

        /**
         * @brief Extracts every entry of @p archive into @p destination.
         * @return true if the archive was read to the end.
         */
        virtual bool extract(const std::filesystem::path& archive,
                             const std::filesystem::path& destination) = 0;
    };

    /**
     * @brief IArchiveStager backed by libarchive (zip, 7z, rar, tar and
     * compressed tarballs). Entries escaping the destination are skipped.
     */
    class LibArchiveStager final : public IArchiveStager {
    public:
        bool extract(const std::filesystem::path& archive,
                     const std::filesystem::path& destination) override;
    };

    /**
     * @brief Maps an archive entry name to a path inside @p dest_dir.
     * @return false for empty names and names that resolve outside @p dest_dir.
     */
    bool sanitize_archive_entry_path(std::string_view entry_name,
                                     const std::filesystem::path& dest_dir,
                                     std::filesystem::path& out_path);

    /**
     * @brief First file under @p dir whose extension is in @p exts.
     *
     * Files directly in @p dir win over files in subdirectories; within a
     * level, extensions are tried in the order given and names in sorted
     * order.
     */
    std::optional<std::filesystem::path> find_media_file(const std::filesystem::path& dir,
                                                         const std::vector<std::string>& exts);

} // namespace convoy

#endif // CONVOY_ARCHIVE_STAGER_HPP
