//
// Created on 23/10/26.
//

#ifndef UNMARK_OUTPUT_PATH_RESOLVER_HPP
#define UNMARK_OUTPUT_PATH_RESOLVER_HPP

#include "process_types.hpp"

namespace unmark {

/**
 * @brief Computes where a sanitized item is written.
 */
class OutputPathResolver {
public:
    /**
     * @brief Resolve the destination (and optional backup) of @p input.
     *
     * - Overwrite mode: a hidden temporary sibling
     *   `dir/.<stem><suffix>_tmp<ext>`, later renamed over the input; with
     *   backup_original the backup is `dir/<stem>.orig<ext>`.
     * - Otherwise `output_dir/<stem><suffix><ext>`; output_dir is created
     *   (recursively) when missing.
     *
     * @throws ConfigError if neither mode is usable (no output directory).
     * @throws IoError if the output directory cannot be created.
     */
    static ResolvedPath resolve(const std::filesystem::path& input, const ProcessOptions& options);
};

} // namespace unmark

#endif // UNMARK_OUTPUT_PATH_RESOLVER_HPP
