#include "common/utils.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <system_error>
#include <thread>
#include "common/defer.hpp"

namespace codejudge {
using namespace std;

static const struct timespec killdelay = {0, 100000000L};  // 0.1s

/**
 * @brief 先尝试 SIGTERM 终止进程组，再使用 SIGKILL 强制杀死
 * 已经结束的进程组不视为错误
 */
static void kill_process_group(pid_t pid) {
    LOG(WARNING) << "sending SIGTERM to process group " << pid;
    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to send SIGTERM to process group " << pid << ": " << strerror(errno);

    nanosleep(&killdelay, nullptr);

    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
}

static void append_limited(string &target, const char *data, size_t length, size_t limit, bool &truncated) {
    size_t keep = target.size() >= limit ? 0 : min(length, limit - target.size());
    target.append(data, keep);
    if (keep < length) truncated = true;
}

process_result capture_program(const vector<string> &args, chrono::milliseconds timeout, size_t capture_limit) {
    if (args.empty())
        throw invalid_argument("no program to execute");

    int out_pipe[2], err_pipe[2], exec_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "unable to create stdout pipe");
    defer {
        for (int fd : out_pipe)
            if (fd >= 0) close(fd);
    };
    if (pipe2(err_pipe, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "unable to create stderr pipe");
    defer {
        for (int fd : err_pipe)
            if (fd >= 0) close(fd);
    };
    // 子进程 exec 成功后该管道会因为 O_CLOEXEC 自动关闭，失败时通过该管道传回 errno
    if (pipe2(exec_pipe, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "unable to create exec status pipe");
    defer {
        for (int fd : exec_pipe)
            if (fd >= 0) close(fd);
    };

    // fork 之后子进程只能调用异步信号安全的函数，因此在 fork 之前准备好 argv
    vector<char *> argv;
    for (auto &arg : args)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "fork");
        case 0: {  // 子进程
            // 独立的进程组使得我们可以一次杀死外部命令派生出的所有进程
            setpgid(0, 0);
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) dup2(devnull, STDIN_FILENO);
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            execvp(argv[0], argv.data());
            int err = errno;
            if (write(exec_pipe[1], &err, sizeof(err)) < 0) _exit(127);
            _exit(127);
        }
        default:
            break;
    }

    setpgid(pid, pid);
    close(out_pipe[1]), out_pipe[1] = -1;
    close(err_pipe[1]), err_pipe[1] = -1;
    close(exec_pipe[1]), exec_pipe[1] = -1;

    // 出现异常时不能留下无人回收的子进程
    scoped_guard reaper([pid] {
        kill(-pid, SIGKILL);
        waitpid(pid, nullptr, 0);
    });

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == sizeof(exec_errno))
        throw system_error(exec_errno, system_category(), "unable to execute " + args[0]);

    process_result result;
    auto deadline = chrono::steady_clock::now() + timeout;
    bool killed = false;

    struct pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    string *targets[2] = {&result.output, &result.error};
    int open_count = 2;
    char buffer[1 << 16];
    while (open_count > 0) {
        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            if (killed) {
                // 进程组已经被杀死，但仍有进程持有管道，放弃剩余输出
                LOG(WARNING) << "pipes of " << args[0] << " are still open after kill, giving up";
                break;
            }
            LOG(WARNING) << args[0] << " exceeded watchdog time limit " << timeout.count() << "ms";
            kill_process_group(pid);
            killed = result.timed_out = true;
            deadline = chrono::steady_clock::now() + chrono::seconds(1);
            continue;
        }

        int wait_ms = (int)max<long long>(0, chrono::duration_cast<chrono::milliseconds>(deadline - now).count());
        int ret = poll(fds, 2, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "poll");
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
                continue;
            ssize_t count = read(fds[i].fd, buffer, sizeof(buffer));
            if (count > 0) {
                append_limited(*targets[i], buffer, count, capture_limit, result.truncated);
            } else if (count == 0 || (errno != EINTR && errno != EAGAIN)) {
                fds[i].fd = -1;
                --open_count;
            }
        }
    }

    int status = 0;
    while (true) {
        pid_t waited = waitpid(pid, &status, killed ? 0 : WNOHANG);
        if (waited == pid) break;
        if (waited < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "waitpid");
        }
        if (chrono::steady_clock::now() >= deadline) {
            LOG(WARNING) << args[0] << " closed its output but did not exit before the watchdog time limit";
            kill_process_group(pid);
            killed = result.timed_out = true;
            continue;
        }
        this_thread::sleep_for(chrono::milliseconds(10));
    }
    reaper.dismiss();

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    return result;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace codejudge
