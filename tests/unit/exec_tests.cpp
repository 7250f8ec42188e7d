#include <doctest/doctest.h>
#include <ctxstage/exec.hpp>
#include <ctxstage/interrupt.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>

using namespace ctxstage;

namespace {

std::vector<std::string> collect(const exec::Command& cmd, exec::ExecResult& result) {
    std::vector<std::string> lines;
    result = exec::run_streaming(cmd, [&](const std::string& line) { lines.push_back(line); });
    return lines;
}

} // namespace

TEST_CASE("format_command_line joins arguments") {
    CHECK(exec::format_command_line({"docker", "build", "--tag", "x"}) == "docker build --tag x");
    CHECK(exec::format_command_line({}) == "");
}

TEST_CASE("build_environment merges overrides into the parent environment") {
    setenv("CTXSTAGE_EXEC_TEST", "parent", 1);

    exec::Command cmd;
    cmd.environment["CTXSTAGE_EXEC_TEST"] = "child";
    cmd.environment["DOCKER_BUILDKIT"] = "1";

    auto env = exec::build_environment(cmd);
    CHECK(std::is_sorted(env.begin(), env.end()));
    CHECK(std::find(env.begin(), env.end(), "CTXSTAGE_EXEC_TEST=child") != env.end());
    CHECK(std::find(env.begin(), env.end(), "CTXSTAGE_EXEC_TEST=parent") == env.end());
    CHECK(std::find(env.begin(), env.end(), "DOCKER_BUILDKIT=1") != env.end());

    unsetenv("CTXSTAGE_EXEC_TEST");
}

TEST_CASE("run_streaming delivers lines in order") {
    exec::Command cmd;
    cmd.argv = {"/bin/sh", "-c", "printf 'a\\nb\\nc\\n'"};

    exec::ExecResult result;
    auto lines = collect(cmd, result);
    REQUIRE(result.ok);
    CHECK(result.exit_code == 0);
    CHECK(lines == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("run_streaming merges stderr into the stream") {
    exec::Command cmd;
    cmd.argv = {"/bin/sh", "-c", "echo out; echo err 1>&2; echo done"};

    exec::ExecResult result;
    auto lines = collect(cmd, result);
    REQUIRE(result.ok);
    CHECK(lines == std::vector<std::string>{"out", "err", "done"});
}

TEST_CASE("run_streaming delivers a final partial line") {
    exec::Command cmd;
    cmd.argv = {"/bin/sh", "-c", "printf 'first\\nlast'"};

    exec::ExecResult result;
    auto lines = collect(cmd, result);
    REQUIRE(result.ok);
    CHECK(lines == std::vector<std::string>{"first", "last"});
}

TEST_CASE("run_streaming reports the exit code") {
    exec::Command cmd;
    cmd.argv = {"/bin/sh", "-c", "exit 7"};

    exec::ExecResult result;
    auto lines = collect(cmd, result);
    REQUIRE(result.ok);
    CHECK(result.exit_code == 7);
    CHECK(lines.empty());
}

TEST_CASE("run_streaming reports death by signal as 128 + signal") {
    exec::Command cmd;
    cmd.argv = {"/bin/sh", "-c", "kill -TERM $$"};

    exec::ExecResult result;
    collect(cmd, result);
    REQUIRE(result.ok);
    CHECK(result.exit_code == 128 + 15);
}

TEST_CASE("run_streaming fails for a missing executable") {
    exec::Command cmd;
    cmd.argv = {"/nonexistent/ctxstage-engine", "build"};

    exec::ExecResult result;
    auto lines = collect(cmd, result);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("failed to execute '/nonexistent/ctxstage-engine'") == 0);
    CHECK(lines.empty());
}

TEST_CASE("run_streaming honors the working directory") {
    exec::Command cmd;
    cmd.argv = {"/bin/sh", "-c", "pwd"};
    cmd.cwd = "/";

    exec::ExecResult result;
    auto lines = collect(cmd, result);
    REQUIRE(result.ok);
    CHECK(lines == std::vector<std::string>{"/"});
}

TEST_CASE("run_streaming rejects an empty command") {
    exec::ExecResult result;
    collect(exec::Command{}, result);
    CHECK_FALSE(result.ok);
    CHECK(result.error == "empty command");
}

TEST_CASE("run_streaming stops a child started after an interrupt") {
    exec::Command cmd;
    cmd.argv = {"sleep", "5"};

    request_interrupt();
    auto start = std::chrono::steady_clock::now();
    exec::ExecResult result;
    collect(cmd, result);
    auto elapsed = std::chrono::steady_clock::now() - start;
    clear_interrupt();

    REQUIRE(result.ok);
    CHECK(result.interrupted);
    CHECK(result.exit_code == 130);
    CHECK(elapsed < std::chrono::seconds(3));
}

TEST_CASE("run_streaming forwards an interrupt raised while a line is handled") {
    exec::Command cmd;
    cmd.argv = {"/bin/sh", "-c", "echo first; exec sleep 5"};

    auto start = std::chrono::steady_clock::now();
    std::vector<std::string> lines;
    auto result = exec::run_streaming(cmd, [&](const std::string& line) {
        lines.push_back(line);
        request_interrupt();
    });
    auto elapsed = std::chrono::steady_clock::now() - start;
    clear_interrupt();

    REQUIRE(result.ok);
    CHECK(result.interrupted);
    CHECK(result.exit_code == 130);
    CHECK(lines == std::vector<std::string>{"first"});
    CHECK(elapsed < std::chrono::seconds(3));
}

TEST_CASE("run_quiet discards output and returns the status") {
    exec::Command cmd;
    cmd.argv = {"/bin/sh", "-c", "echo noise; exit 2"};

    auto result = exec::run_quiet(cmd);
    REQUIRE(result.ok);
    CHECK(result.exit_code == 2);
}
