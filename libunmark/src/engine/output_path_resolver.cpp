//
// Created on 23/10/26.
//

#include "../../include/output_path_resolver.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <system_error>

namespace unmark {

static const char* resolver_tag() {
    return "OutputPathResolver";
}

ResolvedPath OutputPathResolver::resolve(const std::filesystem::path& input, const ProcessOptions& options) {
    const std::string stem = input.stem().string();
    const std::string ext = input.extension().string();

    ResolvedPath resolved;
    if (options.overwrite_source) {
        const std::filesystem::path dir = input.parent_path();
        resolved.output_path = dir / ("." + stem + options.copy_suffix + "_tmp" + ext);
        if (options.backup_original) {
            resolved.backup_path = dir / (stem + ".orig" + ext);
        }
        return resolved;
    }

    if (options.output_dir.empty()) {
        throw ConfigError("output directory is required");
    }

    std::error_code ec;
    std::filesystem::create_directories(options.output_dir, ec);
    if (ec) {
        Logger::log(LogLevel::Error, "Cannot create " + options.output_dir.string() + ": " + ec.message(),
                    resolver_tag());
        throw IoError("cannot create output directory " + options.output_dir.string() + ": " + ec.message());
    }

    resolved.output_path = options.output_dir / (stem + options.copy_suffix + ext);
    return resolved;
}

} // namespace unmark
