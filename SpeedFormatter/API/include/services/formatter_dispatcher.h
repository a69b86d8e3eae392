#pragma once
#include <optional>
#include <string>
#include <utility>

#include "dto/format_request.h"
#include "services/formatter_provider.h"

enum class FormatErrorKind {
    None,
    UnsupportedLanguage,
    UnsupportedFormatter,
    ProcessSpawnFailure,
    ProcessIOFailure,
    FormatterRejection,
    Timeout
};

struct FormatResult {
    bool ok = false;
    std::string formatted_code;
    std::string formatter_used;

    // If ok==false
    FormatErrorKind error_kind = FormatErrorKind::None;
    std::string message;

    static FormatResult success(std::string code, std::string formatter) {
        FormatResult r;
        r.ok = true;
        r.formatted_code = std::move(code);
        r.formatter_used = std::move(formatter);
        return r;
    }

    static FormatResult failure(FormatErrorKind kind, std::string message) {
        FormatResult r;
        r.error_kind = kind;
        r.message = std::move(message);
        return r;
    }
};

// Maps a language token ("javascript", "ts", "rust", ...) to its tool.
std::optional<FormatterTool> tool_for_language(const std::string& language);

// Maps an explicit hint ("prettier", "rustfmt") to its tool.
std::optional<FormatterTool> tool_for_hint(const std::string& hint);

class FormatterDispatcher {
public:
    explicit FormatterDispatcher(const FormatterProvider& provider) : provider_(provider) {}

    FormatResult dispatch(const std::string& code,
                          const std::string& language,
                          const std::optional<std::string>& formatter_hint = std::nullopt) const;

    FormatResult dispatch(const FormatRequest& req) const {
        return dispatch(req.code, req.language, req.formatter);
    }

private:
    const FormatterProvider& provider_;
};
