#include <catch2/catch.hpp>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>
#include <thread>

#include <signal.h>
#include <sys/types.h>

#include "services/subprocess.h"

TEST_CASE("run_subprocess pipes stdin to stdout", "[subprocess]")
{
    const SubprocessResult r = run_subprocess({"cat"}, "const x=1\n");
    CHECK(r.exited_ok());
    CHECK(r.exit_code == 0);
    CHECK(r.stdout_data == "const x=1\n");
    CHECK(r.stderr_data.empty());
}

TEST_CASE("run_subprocess accepts empty input", "[subprocess]")
{
    const SubprocessResult r = run_subprocess({"cat"}, "");
    CHECK(r.exited_ok());
    CHECK(r.stdout_data.empty());
}

TEST_CASE("run_subprocess moves several megabytes both ways", "[subprocess]")
{
    std::string input;
    input.reserve(6 * 1024 * 1024);
    while (input.size() < 6 * 1024 * 1024) {
        input += "let value_" + std::to_string(input.size()) + " = 42;\n";
    }

    const SubprocessResult r = run_subprocess({"cat"}, input);
    REQUIRE(r.exited_ok());
    CHECK(r.stdout_data.size() == input.size());
    CHECK(r.stdout_data == input);
}

TEST_CASE("run_subprocess captures stderr and exit status", "[subprocess]")
{
    const SubprocessResult r = run_subprocess(
        {"/bin/sh", "-c", "cat >/dev/null; printf 'error: expected item\\n' >&2; exit 3"}, "fn main(");
    CHECK_FALSE(r.exited_ok());
    CHECK(r.exit_code == 3);
    CHECK(r.term_signal == 0);
    CHECK(r.stdout_data.empty());
    CHECK(r.stderr_data == "error: expected item\n");
}

TEST_CASE("run_subprocess reports a child that never reads stdin", "[subprocess]")
{
    const std::string input(4 * 1024 * 1024, 'x');
    const SubprocessResult r = run_subprocess({"/bin/sh", "-c", "exit 0"}, input);
    CHECK(r.exited_ok());
}

TEST_CASE("run_subprocess reports a missing binary as a spawn failure", "[subprocess]")
{
    try {
        run_subprocess({"speed-formatter-no-such-binary"}, "x");
        FAIL("expected SubprocessError");
    } catch (const SubprocessError& e) {
        CHECK(e.stage() == SubprocessError::Stage::Spawn);
        CHECK(std::string(e.what()).find("No such file") != std::string::npos);
    }

    CHECK_THROWS_AS(run_subprocess({}, "x"), SubprocessError);
}

TEST_CASE("run_subprocess kills a child that exceeds its deadline", "[subprocess]")
{
    const auto start = std::chrono::steady_clock::now();
    try {
        run_subprocess({"sleep", "10"}, "", std::chrono::milliseconds(200));
        FAIL("expected SubprocessError");
    } catch (const SubprocessError& e) {
        CHECK(e.stage() == SubprocessError::Stage::Timeout);
        CHECK(std::string(e.what()) == "timed out after 200 ms");
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;
    CHECK(elapsed < std::chrono::seconds(5));
}

namespace {
// Gone or a zombie waiting for its new parent to reap it.
bool process_gone(pid_t pid) {
    if (::kill(pid, 0) != 0 && errno == ESRCH) return true;
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string pid_field, comm, state;
    if (!(stat >> pid_field >> comm >> state)) return true;
    return state == "Z";
}
} // namespace

TEST_CASE("run_subprocess deadline kills processes the child started", "[subprocess]")
{
    const std::string pidfile = "speed_formatter_test_grandchild.pid";
    std::remove(pidfile.c_str());

    try {
        run_subprocess({"/bin/sh", "-c", "sleep 30 & echo $! > " + pidfile + "; wait"}, "x",
                       std::chrono::milliseconds(300));
        FAIL("expected SubprocessError");
    } catch (const SubprocessError& e) {
        CHECK(e.stage() == SubprocessError::Stage::Timeout);
    }

    pid_t grandchild = 0;
    {
        std::ifstream in(pidfile);
        REQUIRE(in >> grandchild);
    }
    std::remove(pidfile.c_str());
    REQUIRE(grandchild > 0);

    bool gone = false;
    for (int i = 0; i < 200 && !gone; ++i) {
        gone = process_gone(grandchild);
        if (!gone) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    CHECK(gone);
}

TEST_CASE("run_subprocess deadline also covers a child that closed its pipes", "[subprocess]")
{
    try {
        run_subprocess({"/bin/sh", "-c", "exec >/dev/null 2>&1 </dev/null; sleep 10"}, "",
                       std::chrono::milliseconds(200));
        FAIL("expected SubprocessError");
    } catch (const SubprocessError& e) {
        CHECK(e.stage() == SubprocessError::Stage::Timeout);
    }
}

TEST_CASE("run_subprocess reports death by signal", "[subprocess]")
{
    const SubprocessResult r = run_subprocess({"/bin/sh", "-c", "kill -9 $$"}, "");
    CHECK_FALSE(r.exited_ok());
    CHECK(r.term_signal == 9);
}
