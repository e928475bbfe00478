//
// Created on 24/10/26.
//

#ifndef UNMARK_REPORT_GENERATOR_HPP
#define UNMARK_REPORT_GENERATOR_HPP

#include "../../../libunmark/include/metadata_inspector.hpp"
#include "../../../libunmark/include/process_types.hpp"
#include <filesystem>
#include <vector>

/// @return Width of the attached terminal, 80 when unknown.
unsigned get_terminal_width();

/**
 * @brief Print one row per result, then the batch totals, to stderr.
 */
void print_console_report(const std::vector<unmark::ProcessResult>& results, double total_seconds);

/**
 * @brief Print what inspecting a file found, to stdout.
 */
void print_inspection(const unmark::FileDetails& details);

/**
 * @brief Write the results as CSV.
 * @return False (after logging) if the file cannot be written.
 */
bool export_csv_report(const std::vector<unmark::ProcessResult>& results,
                       const std::filesystem::path& output_path,
                       double total_seconds);

#endif // UNMARK_REPORT_GENERATOR_HPP
