#pragma once
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "services/formatter_provider.h"

// Records every call; answers with `behavior` (default: an idempotent
// "formatter" that trims trailing whitespace and ends with one newline).
class FakeFormatterProvider : public FormatterProvider {
public:
    struct Call {
        FormatterTool tool;
        std::string input;
    };

    std::function<FormatterRun(FormatterTool, const std::string&)> behavior;

    FormatterRun run(FormatterTool tool, const std::string& input) const override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(Call{tool, input});
        }
        if (behavior) return behavior(tool, input);

        FormatterRun r;
        r.exited_ok = true;
        r.output = input;
        while (!r.output.empty() && (r.output.back() == '\n' || r.output.back() == ' ')) r.output.pop_back();
        r.output += '\n';
        return r;
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    mutable std::vector<Call> calls_;
};
