#include <unistd.h>
#include <filesystem>
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "judge/verdict.hpp"
#include "sandbox/docker.hpp"
#include "sandbox/runner.hpp"

using namespace std;
using namespace executor;
using namespace executor::sandbox;

TEST(DockerTest, ParseMemoryUsage) {
    EXPECT_EQ(parse_memory_usage("12.5MiB / 128MiB"), optional<int64_t>(13107200));
    EXPECT_EQ(parse_memory_usage("512KiB / 1GiB\n"), optional<int64_t>(512 * 1024));
    EXPECT_EQ(parse_memory_usage("1.5GiB / 2GiB"), optional<int64_t>(1536LL * 1024 * 1024));
    EXPECT_EQ(parse_memory_usage("100B / 64MiB"), optional<int64_t>(100));
    EXPECT_EQ(parse_memory_usage("3MB / 64MB"), optional<int64_t>(3000000));
    EXPECT_EQ(parse_memory_usage("2kB / 64MB"), optional<int64_t>(2000));
    EXPECT_EQ(parse_memory_usage("-- / --"), nullopt);
    EXPECT_EQ(parse_memory_usage(""), nullopt);
}

class DockerCgroupTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = filesystem::temp_directory_path() / ("cgroup-test-" + std::to_string(getpid()));
        filesystem::create_directories(root);
    }

    void TearDown() override {
        filesystem::remove_all(root);
    }

    void write(const filesystem::path &file, const string &content) {
        filesystem::create_directories(file.parent_path());
        write_file_content(file, content);
    }

    filesystem::path root;
};

TEST_F(DockerCgroupTest, CgroupV2Systemd) {
    write(root / "system.slice" / "docker-abc.scope" / "memory.current", "1048576\n");
    docker_runtime runtime("false", root);
    EXPECT_EQ(runtime.memory_usage("abc"), optional<int64_t>(1048576));
}

TEST_F(DockerCgroupTest, CgroupV2Cgroupfs) {
    write(root / "docker" / "abc" / "memory.current", "4096");
    docker_runtime runtime("false", root);
    EXPECT_EQ(runtime.memory_usage("abc"), optional<int64_t>(4096));
}

TEST_F(DockerCgroupTest, CgroupV1) {
    write(root / "memory" / "docker" / "abc" / "memory.usage_in_bytes", "8192\n");
    docker_runtime runtime("false", root);
    EXPECT_EQ(runtime.memory_usage("abc"), optional<int64_t>(8192));
}

TEST_F(DockerCgroupTest, FollowsChangingUsage) {
    auto file = root / "docker" / "abc" / "memory.current";
    write(file, "100");
    docker_runtime runtime("false", root);
    EXPECT_EQ(runtime.memory_usage("abc"), optional<int64_t>(100));
    write_file_content(file, "200");
    EXPECT_EQ(runtime.memory_usage("abc"), optional<int64_t>(200));

    // 容器退出后 cgroup 被删除
    filesystem::remove(file);
    EXPECT_EQ(runtime.memory_usage("abc"), nullopt);
}

TEST_F(DockerCgroupTest, FallsBackToStats) {
    // 找不到 cgroup 文件时使用 docker stats，这里的 docker 命令总是失败
    docker_runtime runtime("false", root);
    EXPECT_EQ(runtime.memory_usage("abc"), nullopt);
}

TEST(DockerRuntimeTest, UnavailableBinary) {
    docker_runtime runtime("/nonexistent/docker");
    EXPECT_FALSE(runtime.available());
}

/**
 * 需要本机可以连接 docker daemon，并且可以拉取 python:3.9-slim 镜像
 */
class DockerIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!runtime.available()) GTEST_SKIP() << "Docker daemon is not reachable";

        options.run_dir = filesystem::temp_directory_path() / ("docker-test-" + std::to_string(getpid()));
        filesystem::create_directories(options.run_dir);
    }

    void TearDown() override {
        if (!options.run_dir.empty()) filesystem::remove_all(options.run_dir);
    }

    execution_outcome run(const string &code, const string &input, double time_limit) {
        sandbox_runner runner(runtime, languages, options);
        return runner.run(1, "PYTHON", code, input, time_limit, 128 << 20);
    }

    docker_runtime runtime;
    language_registry languages;
    runner_options options;
};

TEST_F(DockerIntegrationTest, HelloWorld) {
    auto outcome = run("print(\"Hello, World!\")", "", 2.0);
    EXPECT_EQ(outcome.stat, status::ACCEPTED);
    EXPECT_TRUE(filesystem::is_empty(options.run_dir));

    auto verdict = judge::summarize(1, {judge::make_test_case_verdict("1", outcome, "Hello, World!\n")});
    EXPECT_EQ(verdict.stat, status::PASSED);
    EXPECT_GT(verdict.time_taken, 0);
    EXPECT_GT(verdict.memory_used, 0);
}

TEST_F(DockerIntegrationTest, EchoInput) {
    auto outcome = run("a, b = map(int, input().split())\nprint(a + b)", "1 2\n", 5);
    EXPECT_EQ(outcome.stat, status::ACCEPTED);
    EXPECT_EQ(outcome.output, "3");
}

TEST_F(DockerIntegrationTest, InfiniteLoop) {
    auto outcome = run("while True: pass", "", 0.5);
    EXPECT_EQ(outcome.stat, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(outcome.time_ms, 500);
}

TEST_F(DockerIntegrationTest, RuntimeError) {
    auto outcome = run("print(1 / 0)", "", 5);
    EXPECT_EQ(outcome.stat, status::RUNTIME_ERROR);
    EXPECT_NE(outcome.output.find("ZeroDivisionError"), string::npos);
}
