#include "../../include/output_placement.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace convoy {

    namespace fs = std::filesystem;

    namespace {

        enum class Claim { Placed, Taken, Failed };

        bool is_cross_device(const int err) {
            return err == EXDEV || err == EPERM || err == ENOTSUP || err == EMLINK;
        }

        /// Moves a tree across devices: copy, then remove the original.
        bool copy_tree_then_remove(const fs::path& src, const fs::path& dst, std::string& error) {
            std::error_code ec;
            fs::copy(src, dst, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
            if (ec) {
                error = "copy failed: " + ec.message();
                return false;
            }
            fs::remove_all(src, ec);
            if (ec) {
                Logger::log(LogLevel::Warning, "Copied " + src.string() + " but could not remove it (" +
                            ec.message() + ")", "output_placement");
            }
            return true;
        }

        Claim claim_file(const fs::path& src, const fs::path& candidate, std::string& error) {
            if (::link(src.c_str(), candidate.c_str()) == 0) {
                if (::unlink(src.c_str()) != 0) {
                    Logger::log(LogLevel::Warning, "Placed " + candidate.string() + " but could not unlink " +
                                src.string() + " (" + std::strerror(errno) + ")", "output_placement");
                }
                return Claim::Placed;
            }
            const int err = errno;
            if (err == EEXIST) return Claim::Taken;
            if (!is_cross_device(err)) {
                error = std::strerror(err);
                return Claim::Failed;
            }

            // copy_file without overwrite opens the target exclusively
            std::error_code ec;
            fs::copy_file(src, candidate, fs::copy_options::none, ec);
            if (ec == std::errc::file_exists) return Claim::Taken;
            if (ec) {
                error = ec.message();
                return Claim::Failed;
            }
            fs::remove(src, ec);
            return Claim::Placed;
        }

        Claim claim_directory(const fs::path& src, const fs::path& candidate, std::string& error) {
            std::error_code ec;
            // mkdir is the atomic claim; the empty directory is then replaced
            if (!fs::create_directory(candidate, ec)) {
                if (ec) {
                    error = ec.message();
                    return Claim::Failed;
                }
                return Claim::Taken;
            }
            fs::rename(src, candidate, ec);
            if (!ec) return Claim::Placed;
            if (ec == std::errc::cross_device_link) {
                return copy_tree_then_remove(src, candidate, error) ? Claim::Placed : Claim::Failed;
            }
            error = ec.message();
            fs::remove(candidate, ec);
            return Claim::Failed;
        }

        PlacementResult replace_existing(const fs::path& source, const fs::path& destination) {
            PlacementResult result;
            std::error_code ec;
            const bool src_is_dir = fs::is_directory(source, ec);
            if (fs::is_directory(destination, ec) || (src_is_dir && fs::exists(destination, ec))) {
                fs::remove_all(destination, ec);
                if (ec) {
                    result.error = "cannot remove existing " + destination.string() + ": " + ec.message();
                    return result;
                }
                Logger::log(LogLevel::Warning, "Overwriting " + destination.string(), "output_placement");
            }

            fs::rename(source, destination, ec);
            if (!ec) {
                result.ok = true;
                result.destination = destination;
                return result;
            }
            if (ec != std::errc::cross_device_link) {
                result.error = ec.message();
                return result;
            }

            if (src_is_dir) {
                if (!copy_tree_then_remove(source, destination, result.error)) return result;
            } else {
                // copy beside the destination, then swap it in atomically
                const fs::path tmp = destination.parent_path() / ("." + destination.filename().string() + ".partial");
                fs::copy_file(source, tmp, fs::copy_options::overwrite_existing, ec);
                if (!ec) fs::rename(tmp, destination, ec);
                if (ec) {
                    std::error_code ignored;
                    fs::remove(tmp, ignored);
                    result.error = ec.message();
                    return result;
                }
                fs::remove(source, ec);
            }
            result.ok = true;
            result.destination = destination;
            return result;
        }

    } // namespace

    fs::path suffixed_path(const fs::path& path, const int n) {
        return path.parent_path() / (path.stem().string() + "_" + std::to_string(n) + path.extension().string());
    }

    PlacementResult place_output(const fs::path& source, const fs::path& destination, const bool overwrite) {
        PlacementResult result;
        std::error_code ec;
        if (!fs::exists(source, ec)) {
            result.error = "source does not exist: " + source.string();
            return result;
        }
        if (!destination.parent_path().empty()) {
            fs::create_directories(destination.parent_path(), ec);
            if (ec) {
                result.error = "cannot create " + destination.parent_path().string() + ": " + ec.message();
                return result;
            }
        }

        if (overwrite) {
            return replace_existing(source, destination);
        }

        const bool is_dir = fs::is_directory(source, ec);
        for (int n = 0; n <= kMaxSuffixAttempts; ++n) {
            const fs::path candidate = n == 0 ? destination : suffixed_path(destination, n);
            const Claim claim = is_dir ? claim_directory(source, candidate, result.error)
                                       : claim_file(source, candidate, result.error);
            if (claim == Claim::Placed) {
                if (n > 0) {
                    Logger::log(LogLevel::Info, destination.filename().string() + " exists, renamed output to " +
                                candidate.filename().string(), "output_placement");
                }
                result.ok = true;
                result.destination = candidate;
                return result;
            }
            if (claim == Claim::Failed) {
                result.error = "cannot move to " + candidate.string() + ": " + result.error;
                return result;
            }
        }
        result.error = "no free name for " + destination.string() + " after " +
                       std::to_string(kMaxSuffixAttempts) + " attempts";
        return result;
    }

    std::vector<fs::path> find_outputs(const fs::path& dir, const std::string& ext) {
        std::vector<fs::path> found;
        if (ext.empty()) return found;
        const auto lower = [](std::string s) {
            std::ranges::transform(s, s.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        };
        const std::string wanted = "." + lower(ext);

        std::error_code ec;
        fs::recursive_directory_iterator it(dir, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code type_ec;
            if (it->is_regular_file(type_ec) && lower(it->path().extension().string()) == wanted) {
                found.push_back(it->path());
            }
        }
        std::sort(found.begin(), found.end());
        return found;
    }

} // namespace convoy
