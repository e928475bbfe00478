//
// Created on 19/10/26.
//

#ifndef UNMARK_MIME_DETECTOR_HPP
#define UNMARK_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace unmark {

    /**
     * @brief Content-signature sniffing backed by libmagic.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file from its content.
         * @param path File to inspect.
         * @return MIME type such as "image/jpeg", or an empty string when
         *         libmagic is unavailable or cannot read the file.
         */
        static std::string detect(const std::filesystem::path& path);
    };

} // namespace unmark

#endif // UNMARK_MIME_DETECTOR_HPP
