/**
 * @file media_profiles.hpp
 * @brief Catalog of (job, media) pairs and the routine that serves each.
 */

#ifndef CONVOY_MEDIA_PROFILES_HPP
#define CONVOY_MEDIA_PROFILES_HPP

#include "job.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace convoy {

    /**
     * @brief One entry of the conversion menu.
     */
    struct MediaProfile {
        std::string job;                             ///< compress, extract, verify, info, archive
        std::string media;                           ///< Short key: cd, dvd, gamecube, hd, ld, raw, psp, chd, 7z, folder
        std::string label;                           ///< Human readable media name
        std::vector<std::string> input_exts;         ///< Accepted input extensions, no dot
        std::vector<std::string> output_exts;        ///< Selectable targets, first is the default
        std::vector<std::string> secondary_exts;     ///< Parallel to output_exts, empty for none
        std::string routine_id;
        std::vector<std::string> archive_media_exts; ///< Non-empty: archive inputs are unpacked first
    };

    /**
     * @brief Every built-in profile.
     */
    const std::vector<MediaProfile>& media_profiles();

    /**
     * @brief Looks up a profile by job and media key.
     * @return nullptr if there is none.
     */
    const MediaProfile* find_profile(const std::string& job, const std::string& media);

    /**
     * @brief True if @p input has one of the profile's input extensions.
     */
    bool profile_accepts(const MediaProfile& profile, const std::filesystem::path& input);

    /**
     * @brief Builds the request for converting @p input with @p profile.
     *
     * @param format Target extension; empty selects the profile default.
     * @param output_dir Destination, empty for the input's directory.
     * @throws std::invalid_argument if @p format is not offered by the profile.
     */
    JobRequest make_job_request(const MediaProfile& profile,
                                const std::filesystem::path& input,
                                const std::string& format,
                                const std::filesystem::path& output_dir,
                                bool overwrite);

} // namespace convoy

#endif // CONVOY_MEDIA_PROFILES_HPP
