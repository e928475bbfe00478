//
// Created on 23/10/26.
//

#include "../../include/dispatcher.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

namespace unmark {

static const char* dispatcher_tag() {
    return "Dispatcher";
}

// hidden sibling keeping the extension, which some writers pick their format from
static std::filesystem::path staging_path_for(const std::filesystem::path& destination) {
    return destination.parent_path() /
           ("." + destination.stem().string() + "_tmp" + destination.extension().string());
}

Dispatcher::Dispatcher(TypeClassifier classifier) : classifier_(std::move(classifier)) {}

ProcessResult Dispatcher::process(const std::filesystem::path& input,
                                  const std::filesystem::path& destination) noexcept {
    ProcessResult result;
    result.input_path = input;
    result.output_path = destination;

    // a file already at the destination is only replaced once sanitizing succeeded
    std::error_code exists_ec;
    const bool replace_existing = destination != input && std::filesystem::exists(destination, exists_ec);
    const std::filesystem::path written = replace_existing ? staging_path_for(destination) : destination;

    const auto fail = [&](const std::string& message) {
        Logger::log(LogLevel::Error, input.string() + ": " + message, dispatcher_tag());
        if (written != input) {
            remove_if_exists(written, dispatcher_tag());
        }
        result.status = ProcessStatus::Error;
        result.message = message;
        return result;
    };

    try {
        const FileCategory category = classifier_.classify(input);
        ISanitizer* sanitizer = category == FileCategory::Other ? nullptr : registry_.find(category);
        if (!sanitizer) {
            // nothing was written, keep whatever sits at the destination
            const std::string message = UnsupportedTypeError().what();
            Logger::log(LogLevel::Warning, input.string() + ": " + message + " (" +
                        std::string(to_string(category)) + ")", dispatcher_tag());
            result.status = ProcessStatus::Error;
            result.message = message;
            return result;
        }

        Logger::log(LogLevel::Debug, input.string() + " -> " + std::string(sanitizer->get_name()), dispatcher_tag());
        SanitizeReport report = sanitizer->sanitize(input, written);
        if (replace_existing) {
            if (const std::error_code ec = rename_with_retry(written, destination, dispatcher_tag())) {
                throw IoError("cannot replace " + destination.string() + ": " + ec.message());
            }
        }

        result.status = ProcessStatus::Success;
        result.removed = std::move(report.removed);
        result.type = std::move(report.type);
        return result;
    } catch (const std::exception& e) {
        return fail(e.what());
    } catch (...) {
        return fail("processing failed");
    }
}

} // namespace unmark
