//
// Created on 24/10/26.
//

#include "report_generator.hpp"
#include "../../../libunmark/include/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>

using unmark::ProcessResult;
using unmark::ProcessStatus;

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string join_removed(const std::vector<std::string>& removed, const std::string_view sep) {
    std::string out;
    for (const auto& r : removed) {
        if (!out.empty()) out += sep;
        out += r;
    }
    return out;
}

static std::string outcome_of(const ProcessResult& r, const bool use_colors) {
    switch (r.status) {
        case ProcessStatus::Success: return use_colors ? "\033[1;32mOK\033[0m" : "OK";
        case ProcessStatus::Skipped: return use_colors ? "\033[1;33mSKIPPED\033[0m" : "SKIPPED";
        case ProcessStatus::Error:   return use_colors ? "\033[1;31mFAIL\033[0m" : "FAIL";
    }
    return "FAIL";
}

void print_console_report(const std::vector<ProcessResult>& results, const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    constexpr std::size_t type_width = 8;
    constexpr std::size_t result_width = 9;
    const std::size_t file_col_width = std::clamp<std::size_t>(term_width / 3, 16, 48);

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(file_col_width)) << "File"
              << std::setw(type_width) << "Type"
              << std::setw(result_width) << "Result"
              << "Removed / Error"
              << "\n";

    std::size_t ok = 0, failed = 0, skipped = 0, removed_total = 0;
    for (const auto& r : results) {
        switch (r.status) {
            case ProcessStatus::Success: ++ok; break;
            case ProcessStatus::Skipped: ++skipped; break;
            case ProcessStatus::Error:   ++failed; break;
        }
        removed_total += r.removed.size();

        // colored cells carry invisible escape bytes, pad on the visible text
        const std::string outcome = outcome_of(r, use_colors);
        const std::size_t visible = outcome_of(r, false).size();
        const std::string detail = r.ok() ? join_removed(r.removed, "; ") : r.message.value_or("");

        std::cerr << std::left << std::setw(static_cast<int>(file_col_width))
                  << truncate(r.input_path.filename().string(), file_col_width - 1)
                  << std::setw(type_width) << r.type.value_or("-")
                  << outcome << std::string(result_width > visible ? result_width - visible : 1, ' ')
                  << (detail.empty() && r.ok() ? "(nothing found)" : detail)
                  << "\n";
    }

    std::cerr << "\nSanitized: " << ok << ", failed: " << failed << ", skipped: " << skipped
              << ", items removed: " << removed_total << "\n";
    std::cerr << "Total time: " << std::fixed << std::setprecision(2) << total_seconds << " s\n";
}

void print_inspection(const unmark::FileDetails& details) {
    std::cout << details.name;
    if (details.exists) {
        std::cout << " (" << unmark::to_string(details.category) << ", " << details.size << " bytes)";
    }
    std::cout << "\n";
    for (const auto& [key, value] : details.metadata) {
        std::cout << "  " << key << ": " << value << "\n";
    }
}

bool export_csv_report(const std::vector<ProcessResult>& results,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) {
        Logger::log(LogLevel::Error, "Cannot write report to " + output_path.string(), "report");
        return false;
    }

    out << "File,Output,Type,Result,Removed,Error\n";
    for (const auto& r : results) {
        out << csv_escape(r.input_path.string()) << ","
            << csv_escape(r.output_path ? r.output_path->string() : "") << ","
            << csv_escape(r.type.value_or("")) << ","
            << unmark::to_string(r.status) << ","
            << csv_escape(join_removed(r.removed, "; ")) << ","
            << csv_escape(r.message.value_or("")) << "\n";
    }

    out << "\n\nTotal amount of time\n";
    out << std::fixed << std::setprecision(2) << total_seconds << " seconds\n";

    out.flush();
    if (!out) {
        Logger::log(LogLevel::Error, "Write error on report " + output_path.string(), "report");
        return false;
    }
    return true;
}
