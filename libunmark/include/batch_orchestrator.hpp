//
// Created on 23/10/26.
//

/**
 * @file batch_orchestrator.hpp
 * @brief Drives a batch of items through resolve, backup, sanitize and finalize.
 */

#ifndef UNMARK_BATCH_ORCHESTRATOR_HPP
#define UNMARK_BATCH_ORCHESTRATOR_HPP

#include "dispatcher.hpp"
#include "event_bus.hpp"
#include "process_types.hpp"
#include <atomic>
#include <vector>

namespace unmark {

/**
 * @brief Runs a batch sequentially, one ProcessResult per item.
 *
 * @details For each item, in input order:
 * - resolve its destination with OutputPathResolver;
 * - copy the original to the backup path, when one was requested;
 * - sanitize it through the Dispatcher;
 * - copy the original's access/modification times onto the output;
 * - in overwrite mode, rename the temporary output over the original.
 *
 * A failing item never stops the batch: its temporary output is removed
 * (overwrite mode) and an error result is recorded. Progress is published
 * on the EventBus (see events.hpp).
 */
class BatchOrchestrator {
public:
    BatchOrchestrator(Dispatcher& dispatcher, EventBus& bus);

    /**
     * @brief Process @p items with @p options.
     * @return One result per item, in the same order. Never throws.
     */
    std::vector<ProcessResult> run(const std::vector<ProcessItem>& items, const ProcessOptions& options);

    /**
     * @brief Ask the running batch to stop before its next item.
     *
     * Safe to call from a signal handler or another thread. Items not yet
     * started are reported as skipped with message "cancelled". The request
     * stays in effect for later run() calls.
     */
    void request_stop() noexcept;

    [[nodiscard]] bool is_stopped() const noexcept {
        return stop_flag_.load(std::memory_order_relaxed);
    }

private:
    ProcessResult process_item(const ProcessItem& item, const ProcessOptions& options);

    Dispatcher& dispatcher_;
    EventBus& event_bus_;
    std::atomic<bool> stop_flag_{false};
};

} // namespace unmark

#endif // UNMARK_BATCH_ORCHESTRATOR_HPP
