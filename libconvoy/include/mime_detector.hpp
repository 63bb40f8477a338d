#ifndef CONVOY_MIME_DETECTOR_HPP
#define CONVOY_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace convoy {

    /**
     * @brief Content-based file type detection backed by libmagic.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         *
         * @param path The filesystem path to the file.
         * @return The MIME type (e.g., "application/zip"), or an empty
         * string if libmagic cannot be loaded or the file cannot be read.
         */
        static std::string detect(const std::filesystem::path& path);
    };

} // namespace convoy

#endif // CONVOY_MIME_DETECTOR_HPP
