#include "services/formatter_provider.h"
#include "services/subprocess.h"

const char* formatter_label(FormatterTool tool) noexcept {
    switch (tool) {
        case FormatterTool::Prettier: return "prettier";
        case FormatterTool::Rustfmt:  return "rustfmt";
    }
    return "unknown";
}

namespace {
FormatterProcessError::Stage to_stage(SubprocessError::Stage stage) {
    switch (stage) {
        case SubprocessError::Stage::Spawn:   return FormatterProcessError::Stage::Spawn;
        case SubprocessError::Stage::Write:   return FormatterProcessError::Stage::Write;
        case SubprocessError::Stage::Read:    return FormatterProcessError::Stage::Read;
        case SubprocessError::Stage::Wait:    return FormatterProcessError::Stage::Wait;
        case SubprocessError::Stage::Timeout: return FormatterProcessError::Stage::Timeout;
    }
    return FormatterProcessError::Stage::Wait;
}
} // namespace

const std::vector<std::string>& ProcessFormatterProvider::command_for(FormatterTool tool) const noexcept {
    return tool == FormatterTool::Rustfmt ? commands_.rustfmt : commands_.prettier;
}

FormatterRun ProcessFormatterProvider::run(FormatterTool tool, const std::string& input) const {
    try {
        SubprocessResult r = run_subprocess(command_for(tool), input, timeout_);
        FormatterRun out;
        out.exited_ok = r.exited_ok();
        out.output = std::move(r.stdout_data);
        out.error = std::move(r.stderr_data);
        if (!out.exited_ok && out.error.empty() && r.term_signal != 0) {
            out.error = "terminated by signal " + std::to_string(r.term_signal);
        }
        return out;
    } catch (const SubprocessError& e) {
        throw FormatterProcessError(to_stage(e.stage()), e.what());
    }
}
