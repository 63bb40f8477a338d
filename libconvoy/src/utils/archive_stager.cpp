#include "../../include/archive_stager.hpp"
#include "../../include/logger.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

namespace convoy {

namespace fs = std::filesystem;

static const char* stager_tag() {
    return "archive_stager";
}

static std::string lower_ext(const fs::path& p) {
    std::string ext = p.extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    std::ranges::transform(ext, ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool sanitize_archive_entry_path(const std::string_view entry_name, const fs::path& dest_dir, fs::path& out_path) {
    if (entry_name.empty()) return false;
    if (entry_name.find('\0') != std::string_view::npos) return false;

    std::string s(entry_name);
    for (auto& c : s) { if (c == '\\') c = '/'; }
    while (!s.empty() && s.front() == '/') s.erase(s.begin());
    if (s.empty()) return false;

    const auto base = dest_dir.lexically_normal();
    const auto normalized = (base / fs::path(s).relative_path()).lexically_normal();

    // component-wise prefix check, "dest" must not match "dest2"
    auto b = base.begin();
    auto n = normalized.begin();
    for (; b != base.end(); ++b, ++n) {
        if (b->empty()) continue; // trailing separator
        if (n == normalized.end() || *n != *b) return false;
    }
    if (normalized == base) return false;

    out_path = normalized;
    return true;
}

bool LibArchiveStager::extract(const fs::path& archive_path, const fs::path& dest_dir) {
    struct archive* a = archive_read_new();
    struct archive_entry* entry = nullptr;

    archive_read_support_filter_all(a);
    archive_read_support_format_all(a);
    archive_read_set_options(a, "hdrcharset=UTF-8");

    int r = archive_read_open_filename(a, archive_path.string().c_str(), 10240);
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
        const char* err = archive_error_string(a);
        Logger::log(LogLevel::Error, "Cannot open " + archive_path.filename().string() + ": " +
                    (err ? err : "unknown error"), stager_tag());
        archive_read_free(a);
        return false;
    }

    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    std::vector<char> buffer(64 * 1024);
    std::size_t files = 0;

    while ((r = archive_read_next_header(a, &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        const char* current = archive_entry_pathname(entry);
        fs::path out_path;
        if (!current || !sanitize_archive_entry_path(current, dest_dir, out_path)) {
            Logger::log(LogLevel::Warning, "Skipping suspicious archive entry: " +
                        std::string(current ? current : "<unnamed>"), stager_tag());
            archive_read_data_skip(a);
            continue;
        }

        const auto type = archive_entry_filetype(entry);
        if (type == AE_IFDIR) {
            fs::create_directories(out_path, ec);
            archive_read_data_skip(a);
            continue;
        }
        if (type != AE_IFREG) {
            Logger::log(LogLevel::Debug, "Skipping non-regular entry: " + std::string(current), stager_tag());
            archive_read_data_skip(a);
            continue;
        }

        fs::create_directories(out_path.parent_path(), ec);
        std::ofstream ofs(out_path, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            Logger::log(LogLevel::Error, "Can't open file in write mode: " + out_path.string(), stager_tag());
            archive_read_free(a);
            return false;
        }

        la_ssize_t size_read = 0;
        while ((size_read = archive_read_data(a, buffer.data(), buffer.size())) > 0) {
            ofs.write(buffer.data(), static_cast<std::streamsize>(size_read));
        }
        ofs.close();

        if (size_read < 0 || !ofs) {
            const char* err = archive_error_string(a);
            Logger::log(LogLevel::Error, "Error extracting " + out_path.filename().string() + ": " +
                        (err ? err : "write failed"), stager_tag());
            archive_read_free(a);
            return false;
        }
        ++files;
    }

    if (r != ARCHIVE_EOF) {
        const char* err = archive_error_string(a);
        Logger::log(LogLevel::Error, "Error during iteration: " + std::string(err ? err : "unknown error"), stager_tag());
        archive_read_free(a);
        return false;
    }

    archive_read_close(a);
    archive_read_free(a);
    Logger::log(LogLevel::Debug, "Extracted " + std::to_string(files) + " files from " +
                archive_path.filename().string(), stager_tag());
    return true;
}

std::optional<fs::path> find_media_file(const fs::path& dir, const std::vector<std::string>& exts) {
    std::vector<std::string> wanted;
    for (auto e : exts) {
        if (!e.empty() && e.front() == '.') e.erase(0, 1);
        std::ranges::transform(e, e.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        wanted.push_back(e);
    }

    std::vector<fs::path> top;
    std::vector<fs::path> nested;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        (it.depth() == 0 ? top : nested).push_back(it->path());
    }
    std::sort(top.begin(), top.end());
    std::sort(nested.begin(), nested.end());

    for (const auto* level : {&top, &nested}) {
        for (const auto& ext : wanted) {
            const auto hit = std::find_if(level->begin(), level->end(),
                [&](const fs::path& p) { return lower_ext(p) == ext; });
            if (hit != level->end()) return *hit;
        }
    }
    return std::nullopt;
}

} // namespace convoy
