/**
 * @file output_placement.hpp
 * @brief Moves finished outputs to their destination under the collision policy.
 */

#ifndef CONVOY_OUTPUT_PLACEMENT_HPP
#define CONVOY_OUTPUT_PLACEMENT_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace convoy {

    /// Highest numeric suffix tried before giving up on a name.
    inline constexpr int kMaxSuffixAttempts = 999;

    struct PlacementResult {
        bool ok = false;
        std::filesystem::path destination; ///< Final path when ok
        std::string error;
    };

    /**
     * @brief `dir/stem_n.ext` for @p path = `dir/stem.ext`.
     */
    std::filesystem::path suffixed_path(const std::filesystem::path& path, int n);

    /**
     * @brief Moves @p source (file or directory) to @p destination.
     *
     * With @p overwrite an existing destination is replaced. Without it,
     * the first free name among destination, `stem_1.ext` ... `stem_999.ext`
     * is claimed with a no-clobber primitive (link(2) for files on the same
     * device, an exclusive copy otherwise), so concurrent placements never
     * end up on the same name. Parent directories are created as needed.
     */
    PlacementResult place_output(const std::filesystem::path& source,
                                 const std::filesystem::path& destination,
                                 bool overwrite);

    /**
     * @brief Regular files under @p dir (recursive) whose extension is @p ext.
     * @param ext Extension without dot, compared case-insensitively.
     * @return Sorted paths.
     */
    std::vector<std::filesystem::path> find_outputs(const std::filesystem::path& dir,
                                                    const std::string& ext);

} // namespace convoy

#endif // CONVOY_OUTPUT_PLACEMENT_HPP
