//
// Created on 23/10/26.
//

/**
 * @file dispatcher.hpp
 * @brief Routes one item to the sanitizer of its category.
 */

#ifndef UNMARK_DISPATCHER_HPP
#define UNMARK_DISPATCHER_HPP

#include "process_types.hpp"
#include "sanitizer_registry.hpp"
#include "type_classifier.hpp"

namespace unmark {

/**
 * @brief Classifies an item, runs its sanitizer and normalizes the outcome.
 *
 * @details Owns the SanitizerRegistry. Every exception raised by the
 * classifier or a sanitizer becomes an error ProcessResult whose message is
 * the exception's what(); a partially written destination is removed.
 */
class Dispatcher {
public:
    explicit Dispatcher(TypeClassifier classifier = TypeClassifier());

    /**
     * @brief Sanitize @p input into @p destination.
     * @return A success result carrying the removed-items report, or an
     *         error result. Never throws.
     */
    ProcessResult process(const std::filesystem::path& input,
                          const std::filesystem::path& destination) noexcept;

    [[nodiscard]] SanitizerRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] const TypeClassifier& classifier() const noexcept { return classifier_; }

private:
    TypeClassifier classifier_;
    SanitizerRegistry registry_;
};

} // namespace unmark

#endif // UNMARK_DISPATCHER_HPP
