//
// Created on 23/10/26.
//

#include "../../include/batch_orchestrator.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/output_path_resolver.hpp"
#include <chrono>
#include <system_error>

namespace unmark {

static const char* orchestrator_tag() {
    return "BatchOrchestrator";
}

static ProcessResult error_result(const std::filesystem::path& input, std::string message) {
    ProcessResult r;
    r.input_path = input;
    r.status = ProcessStatus::Error;
    r.message = std::move(message);
    return r;
}

BatchOrchestrator::BatchOrchestrator(Dispatcher& dispatcher, EventBus& bus)
    : dispatcher_(dispatcher), event_bus_(bus) {}

void BatchOrchestrator::request_stop() noexcept {
    stop_flag_.store(true, std::memory_order_relaxed);
}

std::vector<ProcessResult> BatchOrchestrator::run(const std::vector<ProcessItem>& items,
                                                  const ProcessOptions& options) {
    const auto batch_start = std::chrono::steady_clock::now();
    Logger::log(LogLevel::Info, "Starting batch of " + std::to_string(items.size()) + " item(s)" +
                (options.overwrite_source ? " (overwrite)" : " -> " + options.output_dir.string()),
                orchestrator_tag());

    std::vector<ProcessResult> results;
    results.reserve(items.size());
    std::size_t succeeded = 0, failed = 0, skipped = 0;

    for (std::size_t i = 0; i < items.size(); ++i) {
        const ProcessItem& item = items[i];

        if (is_stopped()) {
            ProcessResult r;
            r.input_path = item.path;
            r.status = ProcessStatus::Skipped;
            r.message = "cancelled";
            event_bus_.publish(ItemSkippedEvent{item.path, "cancelled"});
            results.push_back(std::move(r));
            ++skipped;
            continue;
        }

        event_bus_.publish(ItemStartEvent{item.path, i, items.size()});
        const auto item_start = std::chrono::steady_clock::now();

        ProcessResult r = process_item(item, options);

        if (r.ok()) {
            const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - item_start);
            event_bus_.publish(ItemCompleteEvent{
                item.path, r.output_path.value_or(std::filesystem::path{}), r.type.value_or(""), r.removed, duration});
            ++succeeded;
        } else {
            event_bus_.publish(ItemErrorEvent{item.path, r.message.value_or("processing failed")});
            ++failed;
        }
        results.push_back(std::move(r));
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - batch_start);
    Logger::log(LogLevel::Info, "Batch done: " + std::to_string(succeeded) + " ok, " + std::to_string(failed) +
                " failed, " + std::to_string(skipped) + " skipped", orchestrator_tag());
    event_bus_.publish(BatchCompleteEvent{succeeded, failed, skipped, duration});
    return results;
}

ProcessResult BatchOrchestrator::process_item(const ProcessItem& item, const ProcessOptions& options) {
    if (item.path.empty()) {
        Logger::log(LogLevel::Error, "Empty input path", orchestrator_tag());
        return error_result(item.path, "invalid file path");
    }

    ResolvedPath resolved;
    const auto discard_temp = [&] {
        if (options.overwrite_source && !resolved.output_path.empty()) {
            remove_if_exists(resolved.output_path, orchestrator_tag());
        }
    };

    try {
        resolved = OutputPathResolver::resolve(item.path, options);

        if (resolved.backup_path) {
            std::error_code ec;
            std::filesystem::copy_file(item.path, *resolved.backup_path,
                                       std::filesystem::copy_options::overwrite_existing, ec);
            if (ec) {
                throw IoError("cannot create backup " + resolved.backup_path->string() + ": " + ec.message());
            }
            Logger::log(LogLevel::Debug, "Backup written to " + resolved.backup_path->string(), orchestrator_tag());
        }

        ProcessResult result = dispatcher_.process(item.path, resolved.output_path);
        if (!result.ok()) {
            discard_temp();
            if (options.overwrite_source) {
                result.output_path.reset();
            }
            return result;
        }

        copy_file_times(item.path, resolved.output_path);

        if (options.overwrite_source) {
            if (const std::error_code ec = rename_with_retry(resolved.output_path, item.path, orchestrator_tag())) {
                throw IoError("cannot replace " + item.path.string() + ": " + ec.message());
            }
            result.output_path = item.path;
        }
        return result;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, item.path.string() + ": " + e.what(), orchestrator_tag());
        discard_temp();
        return error_result(item.path, e.what());
    } catch (...) {
        Logger::log(LogLevel::Error, item.path.string() + ": unknown failure", orchestrator_tag());
        discard_temp();
        return error_result(item.path, "processing failed");
    }
}

} // namespace unmark
