#include "services/formatter_dispatcher.h"
#include "utils/text.h"

std::optional<FormatterTool> tool_for_language(const std::string& language) {
    if (language == "javascript" || language == "typescript" ||
        language == "js" || language == "ts") {
        return FormatterTool::Prettier;
    }
    if (language == "rust") return FormatterTool::Rustfmt;
    return std::nullopt;
}

std::optional<FormatterTool> tool_for_hint(const std::string& hint) {
    if (hint == formatter_label(FormatterTool::Prettier)) return FormatterTool::Prettier;
    if (hint == formatter_label(FormatterTool::Rustfmt)) return FormatterTool::Rustfmt;
    return std::nullopt;
}

FormatResult FormatterDispatcher::dispatch(const std::string& code,
                                           const std::string& language,
                                           const std::optional<std::string>& formatter_hint) const {
    auto tool = tool_for_language(language);
    if (!tool) {
        return FormatResult::failure(FormatErrorKind::UnsupportedLanguage,
                                     "Language '" + language + "' is not supported yet");
    }
    // A known hint must name the language's own tool; unknown hints are ignored.
    if (formatter_hint) {
        const auto hinted = tool_for_hint(*formatter_hint);
        if (hinted && *hinted != *tool) {
            return FormatResult::failure(FormatErrorKind::UnsupportedFormatter,
                                         "Formatter '" + *formatter_hint +
                                         "' does not support language '" + language + "'");
        }
    }

    const std::string label = formatter_label(*tool);
    try {
        FormatterRun run = provider_.run(*tool, code);
        if (!run.exited_ok) {
            return FormatResult::failure(FormatErrorKind::FormatterRejection, lossy_utf8(run.error));
        }
        return FormatResult::success(lossy_utf8(run.output), label);
    } catch (const FormatterProcessError& e) {
        switch (e.stage()) {
            case FormatterProcessError::Stage::Spawn:
                return FormatResult::failure(FormatErrorKind::ProcessSpawnFailure,
                                             "Failed to spawn " + label + ": " + e.what());
            case FormatterProcessError::Stage::Write:
                return FormatResult::failure(FormatErrorKind::ProcessIOFailure,
                                             "Failed to write to " + label + " stdin: " + e.what());
            case FormatterProcessError::Stage::Read:
                return FormatResult::failure(FormatErrorKind::ProcessIOFailure,
                                             "Failed to read " + label + " output: " + e.what());
            case FormatterProcessError::Stage::Wait:
                return FormatResult::failure(FormatErrorKind::ProcessIOFailure,
                                             label + " failed: " + e.what());
            case FormatterProcessError::Stage::Timeout:
                return FormatResult::failure(FormatErrorKind::Timeout,
                                             label + " did not finish: " + e.what());
        }
        return FormatResult::failure(FormatErrorKind::ProcessIOFailure, label + " failed: " + e.what());
    }
}
