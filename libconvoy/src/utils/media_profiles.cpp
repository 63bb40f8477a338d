#include "../../include/media_profiles.hpp"
#include "../../include/disc_descriptor.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace convoy {

    namespace {

        std::string lower(std::string s) {
            std::ranges::transform(s, s.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

    } // namespace

    const std::vector<MediaProfile>& media_profiles() {
        static const std::vector<MediaProfile> profiles = {
            // compress
            {"compress", "cd", "CD image", {"iso", "img", "cue", "toc", "gdi", "7z", "zip", "rar"},
             {"chd"}, {""}, "chdman.createcd", {"cue", "gdi", "toc", "iso", "img"}},
            {"compress", "dvd", "DVD image", {"iso", "7z", "zip", "rar", "gz"},
             {"chd"}, {""}, "chdman.createdvd", {"iso"}},
            {"compress", "gamecube", "GameCube/Wii", {"iso", "gcm", "gcz", "wia", "rvz", "7z", "zip", "rar"},
             {"rvz", "gcz", "wia"}, {"", "", ""}, "dolphin.compress", {"iso", "gcm", "gcz", "wia", "rvz"}},
            {"compress", "hd", "Hard Disk image", {"img", "7z", "zip", "rar"},
             {"chd"}, {""}, "chdman.createhd", {"img", "raw", "bin", "iso"}},
            {"compress", "ld", "LaserDisc image", {"avi", "raw", "7z", "zip", "rar"},
             {"chd"}, {""}, "chdman.createld", {"avi", "raw"}},
            {"compress", "raw", "Raw image", {"img", "raw", "7z", "zip", "rar"},
             {"chd"}, {""}, "chdman.createraw", {"img", "raw", "bin"}},
            {"compress", "psp", "PSP/PS2 ISO", {"iso", "7z", "zip", "rar"},
             {"cso"}, {""}, "maxcso.compress", {"iso"}},
            // extract
            {"extract", "cd", "CD image", {"chd"},
             {"cue", "toc", "gdi"}, {"bin", "bin", "bin"}, "chdman.extractcd", {}},
            {"extract", "dvd", "DVD image", {"chd"},
             {"iso"}, {""}, "chdman.extractdvd", {}},
            {"extract", "gamecube", "GameCube/Wii", {"rvz", "gcz", "wia"},
             {"iso"}, {""}, "dolphin.extract", {}},
            {"extract", "hd", "Hard Disk image", {"chd"},
             {"img"}, {""}, "chdman.extracthd", {}},
            {"extract", "ld", "LaserDisc image", {"chd"},
             {"avi", "raw"}, {"", ""}, "chdman.extractld", {}},
            {"extract", "raw", "Raw image", {"chd"},
             {"raw", "img"}, {"", ""}, "chdman.extractraw", {}},
            // inspection
            {"info", "chd", "CHD info (CD/DVD/HD/LD)", {"chd"}, {}, {}, "chdman.info", {}},
            {"verify", "chd", "Verify CHD (CD/DVD/HD/LD)", {"chd"}, {}, {}, "chdman.verify", {}},
            // archives
            {"archive", "7z", "Archive to 7z", {"zip", "rar", "7z", "tar", "gz", "bz2", "xz", "tgz"},
             {"7z"}, {""}, "sevenzip.repack", {}},
            {"archive", "folder", "Archive to folder", {"zip", "rar", "7z", "tar", "gz", "bz2", "xz", "tgz"},
             {}, {}, "sevenzip.extract", {}},
        };
        return profiles;
    }

    const MediaProfile* find_profile(const std::string& job, const std::string& media) {
        const auto& all = media_profiles();
        const auto it = std::find_if(all.begin(), all.end(), [&](const MediaProfile& p) {
            return p.job == lower(job) && p.media == lower(media);
        });
        return it == all.end() ? nullptr : &*it;
    }

    bool profile_accepts(const MediaProfile& profile, const std::filesystem::path& input) {
        std::string ext = lower(input.extension().string());
        if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
        return std::find(profile.input_exts.begin(), profile.input_exts.end(), ext) != profile.input_exts.end();
    }

    JobRequest make_job_request(const MediaProfile& profile,
                                const std::filesystem::path& input,
                                const std::string& format,
                                const std::filesystem::path& output_dir,
                                const bool overwrite) {
        JobRequest req;
        req.input_path = input;
        req.routine_id = profile.routine_id;
        req.output_dir = output_dir;
        req.overwrite_allowed = overwrite;
        req.multi_file_input = is_disc_descriptor(input);
        req.archive_media_exts = profile.archive_media_exts;

        if (!profile.output_exts.empty()) {
            std::size_t index = 0;
            if (!format.empty()) {
                const auto it = std::find(profile.output_exts.begin(), profile.output_exts.end(), lower(format));
                if (it == profile.output_exts.end()) {
                    throw std::invalid_argument("format '" + format + "' is not available for " +
                                                profile.job + " " + profile.media);
                }
                index = static_cast<std::size_t>(it - profile.output_exts.begin());
            }
            req.primary_output_ext = profile.output_exts[index];
            if (index < profile.secondary_exts.size()) {
                req.secondary_output_ext = profile.secondary_exts[index];
            }
        } else if (!format.empty()) {
            throw std::invalid_argument(profile.job + " " + profile.media + " produces no output file");
        }
        return req;
    }

} // namespace convoy
