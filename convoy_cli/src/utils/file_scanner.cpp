#include "file_scanner.hpp"
#include "../../../libconvoy/include/disc_descriptor.hpp"
#include "../../../libconvoy/include/logger.hpp"
#include "../../../libconvoy/include/media_profiles.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace fs = std::filesystem;

static bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::ranges::transform(name, name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name == ".ds_store" || name == "desktop.ini" || name == "thumbs.db";
}

namespace {

bool in_temp_dir(const fs::path& p) {
    return std::ranges::any_of(p, [](const fs::path& part) { return part == "_processing_temps_"; });
}

void add_if_accepted(const fs::path& p, const convoy::MediaProfile& profile,
                     std::vector<fs::path>& out, std::size_t& skipped) {
    if (is_junk(p) || in_temp_dir(p)) return;
    if (!convoy::profile_accepts(profile, p)) {
        ++skipped;
        Logger::log(LogLevel::Debug, "Skipping unsupported file: " + p.string(), "scanner");
        return;
    }
    out.push_back(p);
}

} // namespace

std::vector<fs::path>
collect_input_files(const std::vector<fs::path>& inputs,
                    const convoy::MediaProfile& profile,
                    const bool recursive) {
    std::vector<fs::path> result;
    std::size_t skipped = 0;

    for (const auto& in : inputs) {
        std::error_code ec;
        if (!fs::exists(in, ec)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        if (fs::is_directory(in, ec)) {
            std::vector<fs::path> found;
            if (recursive) {
                for (auto it = fs::recursive_directory_iterator(in, fs::directory_options::skip_permission_denied, ec);
                     !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                    if (it->is_regular_file(ec)) found.push_back(it->path());
                }
            } else {
                for (auto it = fs::directory_iterator(in, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
                    if (it->is_regular_file(ec)) found.push_back(it->path());
                }
            }
            if (ec) {
                Logger::log(LogLevel::Warning, "Error scanning " + in.string() + ": " + ec.message(), "scanner");
            }
            std::ranges::sort(found);
            for (const auto& p : found) add_if_accepted(p, profile, result, skipped);
        } else if (fs::is_regular_file(in, ec)) {
            add_if_accepted(in, profile, result, skipped);
        }
    }

    // a track listed by a collected descriptor is converted through it
    std::set<fs::path> tracks;
    for (const auto& p : result) {
        if (!convoy::is_disc_descriptor(p)) continue;
        for (const auto& dep : convoy::descriptor_dependencies(p).value_or(std::vector<fs::path>{})) {
            tracks.insert((p.parent_path() / dep).lexically_normal());
        }
    }
    std::erase_if(result, [&](const fs::path& p) { return tracks.contains(p.lexically_normal()); });

    // the same file named twice on the command line
    std::set<fs::path> seen;
    std::erase_if(result, [&](const fs::path& p) {
        std::error_code ec;
        auto key = fs::weakly_canonical(p, ec);
        if (ec) key = p.lexically_normal();
        return !seen.insert(key).second;
    });

    if (skipped > 0) {
        Logger::log(LogLevel::Info, "Skipped " + std::to_string(skipped) + " unsupported file(s)", "scanner");
    }
    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}
