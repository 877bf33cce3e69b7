#include <signal.h>
#include <sstream>
#include <stdexcept>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace executor;

TEST(UtilsTest, RunProcess) {
    auto result = run_process({"sh", "-c", "echo out; echo err >&2; exit 3"});
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.out, "out\n");
    EXPECT_EQ(result.err, "err\n");
}

TEST(UtilsTest, RunProcessWithInput) {
    string input(1 << 20, 'a');
    auto result = run_process({"wc", "-c"}, input);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(stol(result.out), 1 << 20);
}

TEST(UtilsTest, OutputLimit) {
    auto result = run_process({"sh", "-c", "yes | head -c 100000"}, "", 10);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out.size(), 10u);
}

TEST(UtilsTest, MissingExecutable) {
    auto result = run_process({"/nonexistent/program"});
    EXPECT_EQ(result.exit_code, 127);
}

TEST(UtilsTest, KillSubprocess) {
    subprocess proc({"sleep", "10"});
    proc.close_stdin();
    proc.kill(SIGKILL);
    string out, err;
    proc.drain(out, err, 1024);
    EXPECT_EQ(proc.wait(), -1);
}

TEST(UtilsTest, ChildClosesStdinEarly) {
    subprocess proc({"true"});
    proc.write_stdin(string(1 << 20, 'a'));
    proc.close_stdin();
    string out, err;
    proc.drain(out, err, 1024);
    EXPECT_EQ(proc.wait(), 0);
}

TEST(UtilsTest, DeferRunsOnScopeExit) {
    vector<int> order;
    {
        defer { order.push_back(1); };
        defer { order.push_back(2); };
        order.push_back(0);
    }
    EXPECT_EQ(order, (vector<int>{0, 2, 1}));
}

TEST(UtilsTest, DeferSwallowsCleanupFailure) {
    bool after = false;
    EXPECT_NO_THROW({
        defer { after = true; };
        defer { throw runtime_error("cleanup failed"); };
    });
    EXPECT_TRUE(after);
}

TEST(UtilsTest, DeferSwallowsExecutorException) {
    bool after = false;
    EXPECT_NO_THROW({
        defer { after = true; };
        defer { throw internal_error("failed to remove container"); };
    });
    EXPECT_TRUE(after);
}

static void throw_internal_error() {
    throw internal_error("container runtime unavailable");
}

TEST(UtilsTest, ExceptionPrintsStacktrace) {
    try {
        throw_internal_error();
        FAIL() << "internal_error should be thrown";
    } catch (executor_exception &e) {
        EXPECT_STREQ(e.what(), "container runtime unavailable");
        stringstream ss;
        ss << e;
        string text = ss.str();
        EXPECT_NE(text.find("container runtime unavailable"), string::npos);
        // boost::stacktrace 按 "序号# 函数" 的格式输出每一帧
        EXPECT_NE(text.find("0# "), string::npos) << text;
    }
}

TEST(UtilsTest, GetEnv) {
    setenv("EXECUTOR_TEST_ENV", "value", 1);
    EXPECT_EQ(get_env("EXECUTOR_TEST_ENV", "default"), "value");
    unsetenv("EXECUTOR_TEST_ENV");
    EXPECT_EQ(get_env("EXECUTOR_TEST_ENV", "default"), "default");
}
