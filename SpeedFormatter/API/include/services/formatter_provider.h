#pragma once
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

enum class FormatterTool { Prettier, Rustfmt };

// Label reported back to clients as "formatter_used".
const char* formatter_label(FormatterTool tool) noexcept;

struct FormatterRun {
    std::string output;   // raw stdout bytes
    std::string error;    // raw stderr bytes
    bool exited_ok = false;
};

// Thrown when a formatter could not produce a verdict at all.
class FormatterProcessError : public std::runtime_error {
public:
    enum class Stage { Spawn, Write, Read, Wait, Timeout };

    FormatterProcessError(Stage stage, std::string message)
        : std::runtime_error(std::move(message)), stage_(stage) {}

    Stage stage() const noexcept { return stage_; }

private:
    Stage stage_;
};

class FormatterProvider {
public:
    virtual ~FormatterProvider() = default;

    // Feeds `input` to the tool and returns what it produced.
    // Throws FormatterProcessError.
    virtual FormatterRun run(FormatterTool tool, const std::string& input) const = 0;
};

struct FormatterCommands {
    std::vector<std::string> prettier{"npx", "prettier", "--stdin-filepath", "file.js", "--parser", "babel"};
    std::vector<std::string> rustfmt{"rustfmt", "--emit", "stdout"};
};

// Runs the real formatter binaries as child processes.
class ProcessFormatterProvider : public FormatterProvider {
public:
    explicit ProcessFormatterProvider(FormatterCommands commands = FormatterCommands{},
                                      std::chrono::milliseconds timeout = std::chrono::milliseconds(0))
        : commands_(std::move(commands)), timeout_(timeout) {}

    FormatterRun run(FormatterTool tool, const std::string& input) const override;

    const std::vector<std::string>& command_for(FormatterTool tool) const noexcept;
    std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    FormatterCommands commands_;
    std::chrono::milliseconds timeout_;
};
