#include <chrono>
#include <csignal>
#include <gtest/gtest.h>
#include <sandtool/language_suite/python.hh>
#include <sys/wait.h>

using namespace std::chrono_literals;
using sandtool::language_suite::Python;
using sandtool::sandbox::Si;

namespace {

Python::RunOptions run_options(std::string stdin_data = {}) {
    return {
        .stdin_data = std::move(stdin_data),
        .time_limit = 10s,
        .cpu_time_limit = 10s,
        .kill_grace_period = 1s,
        .memory_limit_in_bytes = 256 << 20,
        .max_stack_size_in_bytes = 8 << 20,
        .output_size_limit_in_bytes = 1 << 16,
        .working_directory = "/tmp",
    };
}

} // namespace

// NOLINTNEXTLINE
TEST(language_suite, python) {
    auto suite = Python{"/usr/bin/python3"};
    if (not suite.is_supported()) {
        GTEST_SKIP() << "python3 is not available";
    }
    suite.async_run("import sys\nprint(int(input()) * 2)\nsys.exit(3)", run_options("21\n"));
    auto res = suite.await_result();
    EXPECT_EQ(res.si, (Si{.code = CLD_EXITED, .status = 3}));
    EXPECT_EQ(res.stdout_data, "42\n");

    // The suite is reusable once the result was awaited
    suite.async_run("print('again')", run_options());
    EXPECT_EQ(suite.await_result().stdout_data, "again\n");
}

// NOLINTNEXTLINE
TEST(language_suite, python_isolated_mode) {
    auto suite = Python{"/usr/bin/python3"};
    if (not suite.is_supported()) {
        GTEST_SKIP() << "python3 is not available";
    }
    suite.async_run("import sys\nprint(sys.flags.isolated, sys.flags.no_site)", run_options());
    auto res = suite.await_result();
    EXPECT_TRUE(res.si.exited_successfully()) << res.stderr_data;
    EXPECT_EQ(res.stdout_data, "1 1\n");
}

// NOLINTNEXTLINE
TEST(language_suite, python_unsupported_interpreter) {
    EXPECT_FALSE(Python{"/nonexistent/python3"}.is_supported());
}

// NOLINTNEXTLINE
TEST(language_suite, python_async_run_twice_throws) {
    auto suite = Python{"/usr/bin/python3"};
    if (not suite.is_supported()) {
        GTEST_SKIP() << "python3 is not available";
    }
    suite.async_run("pass", run_options());
    EXPECT_THROW(suite.async_run("pass", run_options()), std::runtime_error);
    EXPECT_TRUE(suite.await_result().si.exited_successfully());
}

// NOLINTNEXTLINE
TEST(language_suite, python_memory_exhaustion) {
    auto suite = Python{"/usr/bin/python3"};
    sandtool::sandbox::Result res;
    // A failed allocation, as reported by the runner
    res.si = {.code = CLD_EXITED, .status = 111};
    res.stderr_data = "Traceback (most recent call last):\n  File \"<code>\", line 1\nMemoryError\n";
    EXPECT_TRUE(suite.is_memory_exhaustion(res));
    res.stderr_data = "Traceback (most recent call last):\nValueError: MemoryError\n";
    EXPECT_FALSE(suite.is_memory_exhaustion(res));
    // Raised by the source itself
    res.si = {.code = CLD_EXITED, .status = 1};
    res.stderr_data = "Traceback (most recent call last):\n  File \"<code>\", line 1\nMemoryError\n";
    EXPECT_FALSE(suite.is_memory_exhaustion(res));
    res.si = {.code = CLD_KILLED, .status = SIGABRT};
    res.stderr_data = "Fatal Python error: _PyMem_RawMalloc: out of memory\n";
    EXPECT_TRUE(suite.is_memory_exhaustion(res));
    res.si = {.code = CLD_EXITED, .status = 0};
    res.stderr_data = "MemoryError\n";
    EXPECT_FALSE(suite.is_memory_exhaustion(res));
}

// NOLINTNEXTLINE
TEST(language_suite, python_memory_error_origin) {
    auto suite = Python{"/usr/bin/python3"};
    if (not suite.is_supported()) {
        GTEST_SKIP() << "python3 is not available";
    }
    suite.async_run("x = bytearray(1 << 40)", run_options());
    auto res = suite.await_result();
    EXPECT_TRUE(suite.is_memory_exhaustion(res)) << res.si.description() << res.stderr_data;

    suite.async_run("raise MemoryError", run_options());
    res = suite.await_result();
    EXPECT_EQ(res.si, (Si{.code = CLD_EXITED, .status = 1})) << res.stderr_data;
    EXPECT_FALSE(suite.is_memory_exhaustion(res));
}

// NOLINTNEXTLINE
TEST(language_suite, python_input_data) {
    auto suite = Python{"/usr/bin/python3"};
    if (not suite.is_supported()) {
        GTEST_SKIP() << "python3 is not available";
    }
    // Available both as a variable and on stdin
    suite.async_run("print(repr(input_data))\nprint(input())", run_options("7 8\nnext\n"));
    auto res = suite.await_result();
    EXPECT_TRUE(res.si.exited_successfully()) << res.stderr_data;
    EXPECT_EQ(res.stdout_data, "'7 8\\nnext\\n'\n7 8\n");
    EXPECT_EQ(res.result_data, "");
}

// NOLINTNEXTLINE
TEST(language_suite, python_expression_value) {
    auto suite = Python{"/usr/bin/python3"};
    if (not suite.is_supported()) {
        GTEST_SKIP() << "python3 is not available";
    }
    suite.async_run("2 + 3 * 4", run_options());
    auto res = suite.await_result();
    EXPECT_TRUE(res.si.exited_successfully()) << res.stderr_data;
    EXPECT_EQ(res.result_data, "14");
    EXPECT_EQ(res.stdout_data, "");

    suite.async_run("'ab' * 2", run_options());
    EXPECT_EQ(suite.await_result().result_data, "'abab'");

    // Errors in the expression are reported like in scripts
    suite.async_run("1 / 0", run_options());
    res = suite.await_result();
    EXPECT_EQ(res.si, (Si{.code = CLD_EXITED, .status = 1}));
    EXPECT_EQ(res.result_data, "");
    EXPECT_NE(res.stderr_data.find("ZeroDivisionError"), std::string::npos) << res.stderr_data;
    // Frames of the runner are not shown
    EXPECT_EQ(res.stderr_data.find("<string>"), std::string::npos) << res.stderr_data;
}
