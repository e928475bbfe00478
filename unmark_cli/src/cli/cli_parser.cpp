//
// Created on 24/10/26.
//

#include "cli_parser.hpp"
#include <CLI/CLI.hpp>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Flags (booleans) ---
    auto* overwrite = app.add_flag("--overwrite", settings.overwrite,
                                   "Replace each input in place (through a temporary sibling).");

    app.add_flag("--backup", settings.backup,
                 "With --overwrite, keep a copy of each original as <name>.orig<ext>.")
        ->needs(overwrite);

    app.add_flag("--inspect", settings.inspect,
                 "Only list the metadata found in each input; nothing is written.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (per-file results, summary).");

    // --- Options ---
    app.add_option("-o,--output", settings.output_path,
                   "Write sanitized copies to directory PATH (created if missing).")
        ->excludes(overwrite);

    app.add_option("--suffix", settings.suffix,
                   "Suffix appended to the stem of each sanitized copy.")
        ->default_val("-clean");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
        ->take_last();

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
        ->default_val("ERROR")
        ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Also write logs (all levels) to this file.");

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One or more files to sanitize.")
        ->required()
        ->check(CLI::ExistingFile);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (!settings.inspect && !settings.overwrite && settings.output_path.empty()) {
            throw CLI::ValidationError("Either -o, --output or --overwrite is required.");
        }
        if (settings.inspect && (settings.overwrite || !settings.output_path.empty())) {
            throw CLI::ValidationError("--inspect cannot be combined with -o, --output or --overwrite.");
        }
    });
}
