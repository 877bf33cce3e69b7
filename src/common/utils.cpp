#include "common/utils.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <cerrno>
#include <cstdlib>
#include <mutex>
#include <system_error>
#include <thread>

namespace executor {
using namespace std;

static void close_fd(int &fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

static system_error errno_error(const char *what) {
    return system_error(errno, generic_category(), what);
}

subprocess::subprocess(const vector<string> &argv) {
    // 子进程退出后继续写入 stdin 会收到 SIGPIPE，这里统一改为返回 EPIPE
    static once_flag ignore_sigpipe;
    call_once(ignore_sigpipe, [] { signal(SIGPIPE, SIG_IGN); });

    if (argv.empty()) throw invalid_argument("subprocess requires a command");

    // fork 之后子进程只能调用 async-signal-safe 的函数，因此先准备好 argv
    vector<char *> args;
    for (auto &arg : argv) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    // 使用 O_CLOEXEC 防止其他线程同时创建的子进程继承这些管道，否则管道永远无法读到 EOF
    int in[2], out[2], err[2];
    if (pipe2(in, O_CLOEXEC) < 0) throw errno_error("pipe2");
    if (pipe2(out, O_CLOEXEC) < 0) {
        ::close(in[0]), ::close(in[1]);
        throw errno_error("pipe2");
    }
    if (pipe2(err, O_CLOEXEC) < 0) {
        ::close(in[0]), ::close(in[1]), ::close(out[0]), ::close(out[1]);
        throw errno_error("pipe2");
    }

    DLOG(INFO) << "Executing " << boost::algorithm::join(argv, " ");

    switch (pid = fork()) {
        case -1:  // fork 失败
            for (int fd : {in[0], in[1], out[0], out[1], err[0], err[1]}) ::close(fd);
            throw errno_error("fork");
        case 0:  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            signal(SIGPIPE, SIG_DFL);
            if (dup2(in[0], STDIN_FILENO) < 0 || dup2(out[1], STDOUT_FILENO) < 0 || dup2(err[1], STDERR_FILENO) < 0)
                _exit(127);
            execvp(args[0], args.data());
            _exit(127);
        default:  // 父进程
            ::close(in[0]);
            ::close(out[1]);
            ::close(err[1]);
            stdin_fd = in[1];
            stdout_fd = out[0];
            stderr_fd = err[0];
    }
}

subprocess::~subprocess() {
    close_fd(stdin_fd);
    close_fd(stdout_fd);
    close_fd(stderr_fd);
    if (!reaped) {
        ::kill(pid, SIGKILL);
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
            ;
    }
}

void subprocess::write_stdin(const string &data) {
    if (stdin_fd < 0) throw logic_error("stdin of subprocess has been closed");
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(stdin_fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EPIPE) {
                DLOG(INFO) << "Process " << pid << " closed its stdin, " << data.size() - written << " bytes discarded";
                return;
            }
            throw errno_error("write");
        }
        written += n;
    }
}

void subprocess::close_stdin() {
    close_fd(stdin_fd);
}

void subprocess::drain(string &out, string &err, size_t limit) {
    char buffer[4096];
    while (stdout_fd >= 0 || stderr_fd >= 0) {
        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_fd >= 0) fds[nfds++] = {stdout_fd, POLLIN, 0};
        if (stderr_fd >= 0) fds[nfds++] = {stderr_fd, POLLIN, 0};

        if (poll(fds, nfds, -1) < 0) {
            if (errno == EINTR) continue;
            throw errno_error("poll");
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!fds[i].revents) continue;
            bool is_stdout = fds[i].fd == stdout_fd;
            string &target = is_stdout ? out : err;
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                throw errno_error("read");
            }
            if (n == 0) {
                close_fd(is_stdout ? stdout_fd : stderr_fd);
                continue;
            }
            if (target.size() < limit)
                target.append(buffer, min((size_t)n, limit - target.size()));
        }
    }
}

int subprocess::wait() {
    if (reaped) return exit_code;
    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw errno_error("waitpid");
    }
    reaped = true;
    exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return exit_code;
}

void subprocess::kill(int sig) {
    if (!reaped) ::kill(pid, sig);
}

process_result run_process(const vector<string> &argv, const string &input, size_t limit) {
    subprocess proc(argv);
    process_result result;
    if (input.empty()) {
        proc.close_stdin();
        proc.drain(result.out, result.err, limit);
    } else {
        // 输入与输出必须并发处理，否则双方都可能因为管道写满而阻塞
        thread writer([&] {
            try {
                proc.write_stdin(input);
            } catch (system_error &e) {
                LOG(WARNING) << "Failed to write stdin of " << argv[0] << ": " << e.what();
            }
            proc.close_stdin();
        });
        try {
            proc.drain(result.out, result.err, limit);
        } catch (...) {
            proc.kill(SIGKILL);
            writer.join();
            throw;
        }
        writer.join();
    }
    result.exit_code = proc.wait();
    return result;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result || !*result ? def_value : string(result);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace executor
