#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/container_format.hpp"
#include "../../include/logger.hpp"

std::string convoy::MimeDetector::detect(const std::filesystem::path& path)
{
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0)
    {
        Logger::log(LogLevel::Warning, std::string("Cannot load magic database: ") +
                    (magic_error(magic) ? magic_error(magic) : "unknown error"), "libmagic");
        magic_close(magic);
        return {};
    }
    const char* mime = magic_file(magic, path.string().c_str());
    std::string result = mime ? mime : "";
    magic_close(magic);
    return result;
}

convoy::ContainerFormat convoy::detect_container_format(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return ContainerFormat::Unknown;

    const std::string mime = MimeDetector::detect(path);
    if (const auto it = mime_to_format.find(mime); it != mime_to_format.end())
    {
        return it->second;
    }
    // libmagic knows nothing useful: fall back on the extension
    if (mime.empty() || mime == "application/octet-stream")
    {
        if (const auto fmt = parse_container_format(path.extension().string()))
        {
            return *fmt;
        }
    }
    return ContainerFormat::Unknown;
}
