//
// Created on 19/10/26.
//

#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <magic.h>
#include <memory>

namespace {

struct MagicCloser {
    void operator()(magic_set* m) const { if (m) magic_close(m); }
};
using unique_magic = std::unique_ptr<magic_set, MagicCloser>;

} // namespace

std::string unmark::MimeDetector::detect(const std::filesystem::path& path)
{
    const unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) {
        Logger::log(LogLevel::Warning, "magic_open failed", "libmagic");
        return {};
    }
    if (magic_load(magic.get(), nullptr) != 0) {
        const char* err = magic_error(magic.get());
        Logger::log(LogLevel::Warning, std::string("magic_load failed: ") + (err ? err : "unknown error"), "libmagic");
        return {};
    }
    const char* mime = magic_file(magic.get(), path.string().c_str());
    if (!mime) {
        Logger::log(LogLevel::Debug, "magic_file returned no type for " + path.string(), "libmagic");
        return {};
    }
    return mime;
}
