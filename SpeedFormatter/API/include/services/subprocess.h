#pragma once
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class SubprocessError : public std::runtime_error {
public:
    enum class Stage { Spawn, Write, Read, Wait, Timeout };

    SubprocessError(Stage stage, std::string message)
        : std::runtime_error(std::move(message)), stage_(stage) {}

    Stage stage() const noexcept { return stage_; }

private:
    Stage stage_;
};

struct SubprocessResult {
    int exit_code = -1;     // valid when term_signal == 0
    int term_signal = 0;
    std::string stdout_data;
    std::string stderr_data;

    bool exited_ok() const noexcept { return term_signal == 0 && exit_code == 0; }
};

// Runs argv (argv[0] looked up on PATH) with `input` on its stdin and
// collects stdout/stderr until the child exits. A zero timeout waits forever;
// otherwise the child and every process it started in its group are killed
// when the deadline passes.
// Throws SubprocessError; the child is always reaped before returning.
SubprocessResult run_subprocess(const std::vector<std::string>& argv,
                                const std::string& input,
                                std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
