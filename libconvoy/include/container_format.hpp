/**
 * @file container_format.hpp
 * @brief Archive formats that can wrap a media image, and their detection.
 *
 * Disc images themselves (iso, bin, chd...) are never containers here,
 * even when libmagic reports an ISO-9660 file system.
 */

#ifndef CONVOY_CONTAINER_FORMAT_HPP
#define CONVOY_CONTAINER_FORMAT_HPP

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace convoy {

    enum class ContainerFormat {
        Zip,
        SevenZip,
        Rar,
        Tar,
        GZip,
        BZip2,
        Xz,
        Zstd,
        Unknown
    };

    ///< Map linking MIME type strings to their corresponding ContainerFormat.
    inline const std::unordered_map<std::string, ContainerFormat> mime_to_format = {
        { "application/zip",              ContainerFormat::Zip },
        { "application/x-zip-compressed", ContainerFormat::Zip },
        { "application/x-7z-compressed",  ContainerFormat::SevenZip },
        { "application/vnd.rar",          ContainerFormat::Rar },
        { "application/x-rar",            ContainerFormat::Rar },
        { "application/x-rar-compressed", ContainerFormat::Rar },
        { "application/x-tar",            ContainerFormat::Tar },
        { "application/gzip",             ContainerFormat::GZip },
        { "application/x-gzip",           ContainerFormat::GZip },
        { "application/x-bzip2",          ContainerFormat::BZip2 },
        { "application/x-xz",             ContainerFormat::Xz },
        { "application/zstd",             ContainerFormat::Zstd },
        { "application/x-zstd",           ContainerFormat::Zstd },
    };

    inline std::string container_format_to_string(const ContainerFormat fmt) {
        switch (fmt) {
            case ContainerFormat::Zip:      return "zip";
            case ContainerFormat::SevenZip: return "7z";
            case ContainerFormat::Rar:      return "rar";
            case ContainerFormat::Tar:      return "tar";
            case ContainerFormat::GZip:     return "gz";
            case ContainerFormat::BZip2:    return "bz2";
            case ContainerFormat::Xz:       return "xz";
            case ContainerFormat::Zstd:     return "zst";
            default:                        return "unknown";
        }
    }

    /**
     * @brief Parses a file extension (with or without dot, any case).
     * @return The format, or std::nullopt for anything that is not an archive.
     */
    inline std::optional<ContainerFormat> parse_container_format(const std::string& str) {
        std::string s = str;
        if (!s.empty() && s.front() == '.') s.erase(0, 1);
        std::ranges::transform(s, s.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (s == "zip")                return ContainerFormat::Zip;
        if (s == "7z")                 return ContainerFormat::SevenZip;
        if (s == "rar")                return ContainerFormat::Rar;
        if (s == "tar")                return ContainerFormat::Tar;
        if (s == "gz" || s == "tgz")   return ContainerFormat::GZip;
        if (s == "bz2" || s == "tbz2") return ContainerFormat::BZip2;
        if (s == "xz" || s == "txz")   return ContainerFormat::Xz;
        if (s == "zst" || s == "zstd") return ContainerFormat::Zstd;
        return std::nullopt;
    }

    /**
     * @brief Classifies a file as an archive, first by content, then by extension.
     * @return ContainerFormat::Unknown for non-archives and unreadable files.
     */
    ContainerFormat detect_container_format(const std::filesystem::path& path);

} // namespace convoy

#endif // CONVOY_CONTAINER_FORMAT_HPP
