//
// Created on 24/10/26.
//

#include <CLI/CLI.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <clocale>
#include <iostream>
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libunmark/include/batch_orchestrator.hpp"
#include "../../libunmark/include/dispatcher.hpp"
#include "../../libunmark/include/event_bus.hpp"
#include "../../libunmark/include/events.hpp"
#include "../../libunmark/include/logger.hpp"
#include "../../libunmark/include/metadata_inspector.hpp"

using namespace unmark;

static std::atomic<bool> interrupted{false};
static BatchOrchestrator* g_orchestrator = nullptr;

// handle ctrl+c: finish the current file, skip the rest
void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        if (g_orchestrator) {
            g_orchestrator->request_stop();
        }
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char* cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return;
    }

    constexpr const char* fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb : fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

static int run_inspect(const Settings& settings) {
    NativeImageCodec images;
    LibarchiveCodec archives;
    QpdfEngine pdfs;
    FfmpegRemuxer media;
    const MetadataInspector inspector(images, archives, pdfs, media);

    int rc = 0;
    for (const auto& input : settings.inputs) {
        const FileDetails details = inspector.inspect(input);
        print_inspection(details);
        if (!details.value("error").empty()) {
            rc = 1;
        }
    }
    return rc;
}

int main(int argc, char* argv[]) {

    CLI::App app{"unmark: strip embedded metadata from documents, images, archives and media."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp& e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion& e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError& e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file);
        if (!file_sink->is_open()) {
            std::cerr << RED << "Cannot open log file " << settings.log_file.string() << RESET << std::endl;
            return 1;
        }
        Logger::add_sink(std::move(file_sink));
    }
    if (const auto level = Logger::string_to_level(settings.log_level)) {
        Logger::add_sink(std::make_unique<ConsoleLogSink>(*level));
    }

    init_utf8_locale();

    if (settings.inspect) {
        return run_inspect(settings);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Dispatcher dispatcher;
    EventBus bus;
    BatchOrchestrator orchestrator(dispatcher, bus);

    if (!settings.quiet) {
        bus.subscribe<ItemStartEvent>([](const ItemStartEvent& e) {
            std::cerr << CYAN << "[" << (e.index + 1) << "/" << e.total << "] "
                      << e.path.filename().string() << RESET << std::endl;
        });
        bus.subscribe<ItemCompleteEvent>([](const ItemCompleteEvent& e) {
            std::cerr << GREEN << "[DONE] " << e.path.filename().string() << " -> " << e.output_path.string()
                      << " (" << e.removed.size() << " removed, " << e.duration.count() << " ms)"
                      << RESET << std::endl;
        });
        bus.subscribe<ItemSkippedEvent>([](const ItemSkippedEvent& e) {
            std::cerr << YELLOW << "[SKIP] " << e.path.filename().string() << " (" << e.reason << ")"
                      << RESET << std::endl;
        });
    }
    bus.subscribe<ItemErrorEvent>([&settings](const ItemErrorEvent& e) {
        if (!settings.quiet) {
            std::cerr << RED << "[FAIL] " << e.path.filename().string() << ": " << e.error_message
                      << RESET << std::endl;
        }
    });

    std::vector<ProcessItem> items;
    items.reserve(settings.inputs.size());
    for (const auto& input : settings.inputs) {
        items.push_back(ProcessItem{input});
    }

    const auto start_total = std::chrono::steady_clock::now();
    g_orchestrator = &orchestrator;
    const std::vector<ProcessResult> results = orchestrator.run(items, settings.to_process_options());
    g_orchestrator = nullptr;
    const double total_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();

    if (!settings.quiet) {
        print_console_report(results, total_seconds);
    }

    bool report_ok = true;
    if (!settings.report_path.empty()) {
        report_ok = export_csv_report(results, settings.report_path, total_seconds);
    }

    if (interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }
    const bool all_ok = std::ranges::all_of(results, [](const ProcessResult& r) { return r.ok(); });
    return all_ok && report_ok ? 0 : 1;
}
