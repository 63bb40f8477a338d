#include "../../include/disc_descriptor.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <string>

namespace convoy {

    namespace {

        std::string lower_ext(const std::filesystem::path& p) {
            std::string ext = p.extension().string();
            std::ranges::transform(ext, ext.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return ext;
        }

        std::string trim(const std::string& s) {
            const auto first = s.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) return {};
            const auto last = s.find_last_not_of(" \t\r\n");
            return s.substr(first, last - first + 1);
        }

        std::filesystem::path resolve(const std::filesystem::path& dir, const std::string& name) {
            return (dir / name).lexically_normal();
        }

    } // namespace

    std::optional<std::vector<std::filesystem::path>>
    cue_dependencies(const std::filesystem::path& cue_path) {
        std::ifstream in(cue_path);
        if (!in) {
            Logger::log(LogLevel::Error, "Could not read CUE file: " + cue_path.string(), "disc_descriptor");
            return std::nullopt;
        }
        static const std::regex file_line(R"re(FILE\s+"?([^"]+)"?\s+\w+)re");
        const auto dir = cue_path.parent_path();
        std::vector<std::filesystem::path> deps;
        std::string raw;
        while (std::getline(in, raw)) {
            const std::string line = trim(raw);
            if (!line.starts_with("FILE")) continue;

            std::smatch m;
            if (std::regex_search(line, m, file_line)) {
                deps.push_back(resolve(dir, m[1].str()));
                continue;
            }
            // unquoted name without a type token
            const auto sep = line.find_first_of(" \t");
            if (sep == std::string::npos) {
                Logger::log(LogLevel::Warning, "Could not parse FILE line in CUE: " + line, "disc_descriptor");
                continue;
            }
            std::string name = trim(line.substr(sep));
            if (const auto next = name.find_first_of(" \t"); next != std::string::npos && name.front() != '"') {
                name = name.substr(0, next);
            }
            name.erase(std::remove(name.begin(), name.end(), '"'), name.end());
            if (!name.empty()) deps.push_back(resolve(dir, name));
        }
        return deps;
    }

    std::optional<std::vector<std::filesystem::path>>
    gdi_dependencies(const std::filesystem::path& gdi_path) {
        std::ifstream in(gdi_path);
        if (!in) {
            Logger::log(LogLevel::Error, "Could not read GDI file: " + gdi_path.string(), "disc_descriptor");
            return std::nullopt;
        }
        // track, lba, type, sector size, file name (quoted or bare), offset
        static const std::regex track_line(R"re(^\s*(\d+)\s+\S+\s+\S+\s+\S+\s+("([^"]+)"|([^\s"]+))(?:\s+.*)?$)re");
        const auto dir = gdi_path.parent_path();
        std::vector<std::filesystem::path> deps;
        std::string raw;
        while (std::getline(in, raw)) {
            const std::string line = trim(raw);
            std::smatch m;
            if (!std::regex_match(line, m, track_line)) continue;
            const std::string name = trim(m[3].matched ? m[3].str() : m[4].str());
            if (name.empty()) {
                Logger::log(LogLevel::Warning, "Empty file name in GDI line: " + line, "disc_descriptor");
                continue;
            }
            deps.push_back(resolve(dir, name));
        }
        return deps;
    }

    bool is_disc_descriptor(const std::filesystem::path& path) {
        const auto ext = lower_ext(path);
        return ext == ".cue" || ext == ".gdi";
    }

    std::optional<std::vector<std::filesystem::path>>
    descriptor_dependencies(const std::filesystem::path& path) {
        const auto ext = lower_ext(path);
        if (ext == ".cue") return cue_dependencies(path);
        if (ext == ".gdi") return gdi_dependencies(path);
        return std::vector<std::filesystem::path>{};
    }

    std::vector<std::filesystem::path> companion_files(const std::filesystem::path& input) {
        std::vector<std::filesystem::path> out;
        const auto self = input.lexically_normal();
        const auto add = [&](const std::filesystem::path& p) {
            std::error_code ec;
            const auto n = p.lexically_normal();
            if (n == self || !std::filesystem::is_regular_file(n, ec)) return;
            if (std::find(out.begin(), out.end(), n) == out.end()) out.push_back(n);
        };

        if (const auto deps = descriptor_dependencies(input)) {
            for (const auto& d : *deps) add(d);
        }

        if (lower_ext(input) == ".cue") {
            const std::string stem = input.stem().string();
            std::error_code ec;
            std::filesystem::directory_iterator it(input.parent_path().empty() ? "." : input.parent_path(), ec);
            for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
                const auto& p = it->path();
                if (lower_ext(p) == ".bin" && p.filename().string().starts_with(stem)) {
                    add(input.parent_path() / p.filename());
                }
            }
        }
        return out;
    }

} // namespace convoy
