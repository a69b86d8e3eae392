#include "services/subprocess.h"

#include <cerrno>
#include <future>
#include <mutex>
#include <system_error>
#include <thread>

#include <signal.h>
#include <sys/wait.h>

#include <boost/asio.hpp>
#include <boost/process.hpp>
#include <boost/process/extend.hpp>

namespace bp = boost::process;

namespace {
using Clock = std::chrono::steady_clock;

// Writes to a child that already closed its stdin must come back as EPIPE
// instead of terminating the server.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction sa {};
        sa.sa_handler = SIG_IGN;
        sigemptyset(&sa.sa_mask);
        ::sigaction(SIGPIPE, &sa, nullptr);
    });
}

boost::filesystem::path resolve_executable(const std::string& name) {
    if (name.find('/') != std::string::npos) return boost::filesystem::path(name);
    return bp::search_path(name);
}
} // namespace

SubprocessResult run_subprocess(const std::vector<std::string>& argv,
                                const std::string& input,
                                std::chrono::milliseconds timeout) {
    if (argv.empty() || argv.front().empty()) {
        throw SubprocessError(SubprocessError::Stage::Spawn, "empty command line");
    }
    ignore_sigpipe();

    const boost::filesystem::path exe = resolve_executable(argv.front());
    if (exe.empty()) {
        throw SubprocessError(SubprocessError::Stage::Spawn, std::system_category().message(ENOENT));
    }
    const std::vector<std::string> args(argv.begin() + 1, argv.end());

    const bool has_deadline = timeout.count() > 0;
    const Clock::time_point deadline = Clock::now() + timeout;

    boost::asio::io_context ios;
    bp::async_pipe in_pipe(ios);
    std::future<std::string> out_data;
    std::future<std::string> err_data;
    // The formatter may be a launcher (npx); its descendants share this group.
    bp::group group;
    bp::child child;
    try {
        child = bp::child(bp::exe = exe, bp::args = args,
                          bp::std_in < in_pipe,
                          bp::std_out > out_data,
                          bp::std_err > err_data,
                          ios, group,
                          bp::extend::on_exec_setup = [](auto&) { ::signal(SIGPIPE, SIG_DFL); });
    } catch (const bp::process_error& e) {
        throw SubprocessError(SubprocessError::Stage::Spawn, e.code().message());
    }

    boost::system::error_code write_error;
    boost::asio::async_write(in_pipe, boost::asio::buffer(input),
        [&](const boost::system::error_code& ec, std::size_t) {
            // A child that stops reading early is judged by its exit status.
            if (ec && ec != boost::asio::error::broken_pipe) write_error = ec;
            in_pipe.async_close();
        });

    auto timed_out = [&]() {
        std::error_code ignored;
        group.terminate(ignored);
        child.wait(ignored);
        return SubprocessError(SubprocessError::Stage::Timeout,
                               "timed out after " + std::to_string(timeout.count()) + " ms");
    };

    if (has_deadline) {
        ios.run_until(deadline);
        if (!ios.stopped()) throw timed_out();

        // The pipes are closed but the child may still be running.
        for (;;) {
            std::error_code ec;
            const bool running = child.running(ec);
            if (ec) throw SubprocessError(SubprocessError::Stage::Wait, ec.message());
            if (!running) break;
            if (Clock::now() >= deadline) throw timed_out();
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    } else {
        ios.run();
        std::error_code ec;
        child.wait(ec);
        if (ec) throw SubprocessError(SubprocessError::Stage::Wait, ec.message());
    }

    if (write_error) {
        throw SubprocessError(SubprocessError::Stage::Write, write_error.message());
    }

    SubprocessResult result;
    try {
        result.stdout_data = out_data.get();
        result.stderr_data = err_data.get();
    } catch (const std::exception& e) {
        throw SubprocessError(SubprocessError::Stage::Read, e.what());
    }

    const int status = child.native_exit_code();
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }
    return result;
}
