//
// Created on 24/10/26.
//

#ifndef UNMARK_CLI_PARSER_HPP
#define UNMARK_CLI_PARSER_HPP

#include "../../../libunmark/include/process_types.hpp"
#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool overwrite = false;
    bool backup = false;
    bool inspect = false;
    bool quiet = false;

    std::string suffix = "-clean";
    std::string log_level = "ERROR";
    std::filesystem::path output_path;
    std::filesystem::path log_file;
    std::filesystem::path report_path;

    std::vector<std::filesystem::path> inputs;

    /// @return Batch options equivalent to the parsed flags.
    [[nodiscard]] unmark::ProcessOptions to_process_options() const {
        unmark::ProcessOptions options;
        options.output_dir = output_path;
        options.copy_suffix = suffix;
        options.overwrite_source = overwrite;
        options.backup_original = backup;
        return options;
    }
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // UNMARK_CLI_PARSER_HPP
