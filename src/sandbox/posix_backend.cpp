#include "evalbox/sandbox/posix_backend.hpp"
#include <errno.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <math.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <system_error>
#include "evalbox/common/defer.hpp"
#include "evalbox/common/exceptions.hpp"
#include "evalbox/common/utils.hpp"

namespace evalbox {
using namespace std;
namespace fs = std::filesystem;

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

// 每轮等待管道数据的最长时间，之后重新检查子进程是否已经退出
const int POLL_INTERVAL_MS = 10;

// 子进程退出后，继续读取管道中剩余数据的最长时间
const double KILL_DELAY = 0.1;

// 子进程在 exec 之前失败时通过 error pipe 回传的信息
struct child_failure {
    int stage;
    int err;
};

enum child_stage {
    STAGE_REDIRECT = 0,
    STAGE_SIGNALS = 1,
    STAGE_SETSID = 2,
    STAGE_RLIMIT = 3,
    STAGE_CHDIR = 4,
    STAGE_EXEC = 5
};

static const char *stage_names[] = {
    "redirecting standard streams",
    "resetting signal handlers",
    "creating process group",
    "setting resource limits",
    "changing working directory",
    "executing command"};

template <typename... Args>
[[noreturn]] static void error(int err, fmt::format_string<Args...> format, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(format, std::forward<Args>(args)...));
}

static void close_fd(int &fd) {
    if (fd < 0) return;
    if (close(fd) != 0 && errno != EINTR)
        LOG(WARNING) << "unable to close fd " << fd << ": " << strerror(errno);
    fd = -1;
}

static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1) error(errno, "fcntl, getting flags of fd {}", fd);
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) error(errno, "fcntl, setting flags of fd {}", fd);
}

/**
 * @brief 在 PATH 中查找可执行文件
 * 在 fork 之前完成查找，子进程只需要调用 execve。
 * @return 可执行文件的路径，找不到时返回空路径
 */
static fs::path resolve_executable(const string &name) {
    if (name.find('/') != string::npos)
        return access(name.c_str(), X_OK) == 0 ? fs::path(name) : fs::path();
    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    size_t begin = 0;
    while (begin <= path.size()) {
        size_t end = path.find(':', begin);
        if (end == string::npos) end = path.size();
        fs::path dir = end == begin ? fs::path(".") : fs::path(path.substr(begin, end - begin));
        fs::path candidate = dir / name;
        if (access(candidate.c_str(), X_OK) == 0 && !fs::is_directory(candidate))
            return candidate;
        begin = end + 1;
    }
    return fs::path();
}

// 以下函数在 fork 出的子进程中调用，只能使用 async-signal-safe 的系统调用

[[noreturn]] static void child_fail(int errfd, int stage) {
    child_failure failure = {stage, errno};
    ssize_t ignored = write(errfd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

static bool child_redirect(int from, int to) {
    if (from == to) {
        // dup2 不会清除同一个 fd 上的 FD_CLOEXEC
        int flags = fcntl(to, F_GETFD);
        return flags != -1 && fcntl(to, F_SETFD, flags & ~FD_CLOEXEC) != -1;
    }
    return dup2(from, to) >= 0;
}

static bool child_set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    return setrlimit(resource, &lim) == 0;
}

[[noreturn]] static void run_child(const launch_request &request, const char *exe, char *const *argv, char *const *envp,
                                   rlim_t cputime_limit, int stdin_fd, int stdout_fd, int stderr_fd, int errfd) {
    if (!child_redirect(stdin_fd, STDIN_FILENO) ||
        !child_redirect(stdout_fd, STDOUT_FILENO) ||
        !child_redirect(stderr_fd, STDERR_FILENO))
        child_fail(errfd, STAGE_REDIRECT);

    {
        // 评测系统忽略了 SIGPIPE，而被忽略的信号会在 exec 之后保留
        struct sigaction sigact;
        memset(&sigact, 0, sizeof(sigact));
        sigact.sa_handler = SIG_DFL;
        if (sigemptyset(&sigact.sa_mask) != 0 ||
            sigaction(SIGPIPE, &sigact, nullptr) != 0 ||
            sigaction(SIGINT, &sigact, nullptr) != 0 ||
            sigaction(SIGTERM, &sigact, nullptr) != 0)
            child_fail(errfd, STAGE_SIGNALS);

        sigset_t emptymask;
        if (sigemptyset(&emptymask) != 0 || sigprocmask(SIG_SETMASK, &emptymask, nullptr) != 0)
            child_fail(errfd, STAGE_SIGNALS);
    }

    // run the command in a separate process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1) child_fail(errfd, STAGE_SETSID);

    if (request.address_space_limit > 0) {
        rlim_t as = (rlim_t)request.address_space_limit;
        if (!child_set_rlimit(RLIMIT_AS, as, as)) child_fail(errfd, STAGE_RLIMIT);
    }

    if (cputime_limit > 0) {
        // 到达软限制时内核发送 SIGXCPU，到达硬限制时发送 SIGKILL
        if (!child_set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1)) child_fail(errfd, STAGE_RLIMIT);
    }

    if (!child_set_rlimit(RLIMIT_CORE, 0, 0)) child_fail(errfd, STAGE_RLIMIT);

    if (!request.work_dir.empty() && chdir(request.work_dir.c_str()) != 0)
        child_fail(errfd, STAGE_CHDIR);

    execve(exe, argv, envp);
    child_fail(errfd, STAGE_EXEC);
}

posix_backend::posix_backend() {
    static once_flag sigpipe_once;
    call_once(sigpipe_once, [] {
        // 选手程序提前关闭标准输入时，向管道写入会产生 SIGPIPE，
        // 我们需要得到 EPIPE 而不是被这个信号杀死
        if (signal(SIGPIPE, SIG_IGN) == SIG_ERR)
            LOG(ERROR) << "unable to ignore SIGPIPE: " << strerror(errno);
    });
}

/**
 * @brief 从管道中读取数据
 * @return false 若读到 EOF
 */
static bool pump_output(int fd, string &buffer, int64_t stream_size, bool &truncated) {
    char buf[BUF_SIZE];
    while (true) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread == -1) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            error(errno, "copying data from fd {}", fd);
        }
        if (nread == 0) return false;

        size_t keep = nread;
        if (stream_size >= 0) {
            size_t room = buffer.size() < (size_t)stream_size ? (size_t)stream_size - buffer.size() : 0;
            if (room < keep) {
                keep = room;
                truncated = true;
            }
        }
        buffer.append(buf, keep);
    }
}

/**
 * @brief 向管道写入尚未写入的数据
 * @return false 若数据已经全部写入，或者子进程关闭了标准输入
 */
static bool pump_input(int fd, const string &data, size_t &written) {
    while (written < data.size()) {
        size_t to_write = min((size_t)BUF_SIZE, data.size() - written);
        ssize_t nwritten = write(fd, data.data() + written, to_write);
        if (nwritten == -1) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            if (errno == EPIPE) {
                LOG(INFO) << "child closed its standard input after " << written << " bytes";
                return false;
            }
            error(errno, "writing standard input to fd {}", fd);
        }
        written += nwritten;
    }
    return false;
}

/**
 * @brief 读取 /proc/<pid>/status 中以 KB 为单位的一项，比如 VmHWM、VmRSS
 * @return 该项的值，进程已退出或无法读取时返回 -1
 */
static int64_t read_status_kb(pid_t pid, const string &field) {
    ifstream fin(fmt::format("/proc/{}/status", pid));
    string line;
    while (getline(fin, line)) {
        if (line.size() > field.size() + 2 && line.compare(0, field.size(), field) == 0) {
            try {
                return boost::lexical_cast<int64_t>(boost::algorithm::trim_copy(line.substr(field.size(), line.size() - field.size() - 2)));
            } catch (boost::bad_lexical_cast &) {
                return -1;
            }
        }
    }
    return -1;
}

/**
 * @brief 统计进程组内所有进程当前常驻内存（VmRSS）之和，单位为 KB
 * 选手程序通过 sh、bash 启动的子进程也在同一个进程组内。
 */
static int64_t read_group_rss_kb(pid_t pgid) {
    int64_t total = 0;
    error_code ec;
    for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
        string name = it->path().filename().string();
        if (!all_of(name.begin(), name.end(), [](char c) { return isdigit((unsigned char)c); })) continue;
        pid_t pid = (pid_t)atol(name.c_str());
        if (getpgid(pid) != pgid) continue;
        total += max<int64_t>(0, read_status_kb(pid, "VmRSS:"));
    }
    return total;
}

/**
 * @brief 采样峰值内存，单位为 KB
 * 取子进程自身的 VmHWM 与进程组当前常驻内存之和中的较大者。
 * exec 会创建新的地址空间，因此这里不包含 fork 时从评测系统继承的内存，
 * 而 wait4 得到的 ru_maxrss 会包含。
 */
static int64_t sample_peak_kb(pid_t pid) {
    return max(read_status_kb(pid, "VmHWM:"), read_group_rss_kb(pid));
}

static void kill_group(pid_t pid) {
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
}

static raw_outcome run_checked(const launch_request &request) {
    raw_outcome outcome;

    if (request.command.empty()) {
        outcome.spawn_error = "empty command";
        return outcome;
    }

    fs::path exe = resolve_executable(request.command[0]);
    if (exe.empty()) {
        outcome.spawn_error = fmt::format("command not found: {}", request.command[0]);
        return outcome;
    }

    // argv 和 envp 必须在 fork 之前准备好，子进程中不能分配内存
    vector<string> envs;
    envs.push_back("PATH=" + get_env("PATH", "/usr/local/bin:/usr/bin:/bin"));
    for (auto &entry : request.env) envs.push_back(entry);
    vector<char *> envp;
    for (auto &entry : envs) envp.push_back(entry.data());
    envp.push_back(nullptr);

    vector<string> cmd(request.command);
    vector<char *> argv;
    for (auto &arg : cmd) argv.push_back(arg.data());
    argv.push_back(nullptr);
    string exe_path = exe.string();

    /* CPU 时间限制只是 watchdog 失效时的后备。多线程程序的 CPU 时间可以达到
       时钟时间乘以 CPU 核数，因此按核数放大，避免在时钟时间限制内被误杀。 */
    rlim_t cputime_limit = 0;
    if (request.wall_limit_seconds > 0) {
        long cpus = max(1L, sysconf(_SC_NPROCESSORS_ONLN));
        cputime_limit = (rlim_t)ceil(request.wall_limit_seconds * cpus) + 1;
    }

    int stdin_pipe[2] = {-1, -1}, stdout_pipe[2] = {-1, -1}, stderr_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1};
    defer {
        for (int *p : {stdin_pipe, stdout_pipe, stderr_pipe, err_pipe}) {
            close_fd(p[PIPE_OUT]);
            close_fd(p[PIPE_IN]);
        }
    };

    // 使用 O_CLOEXEC 避免并发启动的其他子进程继承这些管道
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for stdin");
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for stdout");
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for stderr");
    if (pipe2(err_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for exec errors");

    elapsed_time timer;
    pid_t child_pid = fork();
    switch (child_pid) {
        case -1:
            error(errno, "unable to fork");
        case 0:
            run_child(request, exe_path.c_str(), argv.data(), envp.data(), cputime_limit,
                      stdin_pipe[PIPE_OUT], stdout_pipe[PIPE_IN], stderr_pipe[PIPE_IN], err_pipe[PIPE_IN]);
        default:
            break;
    }

    bool exited = false;
    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    defer {
        // 发生内部错误时也不能让子进程留驻系统
        if (exited) return;
        kill_group(child_pid);
        kill(child_pid, SIGKILL);
        while (waitpid(child_pid, nullptr, 0) == -1 && errno == EINTR)
            ;
    };

    close_fd(stdin_pipe[PIPE_OUT]);
    close_fd(stdout_pipe[PIPE_IN]);
    close_fd(stderr_pipe[PIPE_IN]);
    close_fd(err_pipe[PIPE_IN]);

    {
        // exec 成功时 err_pipe 被 close-on-exec 关闭，read 返回 0
        child_failure failure;
        ssize_t nread;
        do {
            nread = read(err_pipe[PIPE_OUT], &failure, sizeof(failure));
        } while (nread == -1 && errno == EINTR);

        if (nread == (ssize_t)sizeof(failure)) {
            while (wait4(child_pid, &status, 0, &usage) == -1 && errno == EINTR)
                ;
            exited = true;
            int stage = failure.stage >= STAGE_REDIRECT && failure.stage <= STAGE_EXEC ? failure.stage : STAGE_EXEC;
            outcome.spawn_error = fmt::format("{} failed when {}: {}", request.command[0], stage_names[stage], strerror(failure.err));
            outcome.elapsed_seconds = timer.seconds();
            return outcome;
        }
    }
    outcome.spawned = true;

    set_nonblock(stdin_pipe[PIPE_IN]);
    set_nonblock(stdout_pipe[PIPE_OUT]);
    set_nonblock(stderr_pipe[PIPE_OUT]);

    size_t written = 0;
    if (request.stdin_data.empty()) close_fd(stdin_pipe[PIPE_IN]);

    int64_t peak_kb = 0;
    double drain_deadline = 0;
    while (true) {
        if (!exited) {
            // 必须在 wait4 之前采样，僵尸进程已经没有地址空间
            peak_kb = max(peak_kb, sample_peak_kb(child_pid));
            pid_t pid = wait4(child_pid, &status, WNOHANG, &usage);
            if (pid == child_pid) {
                exited = true;
                outcome.elapsed_seconds = timer.seconds();
                drain_deadline = outcome.elapsed_seconds + KILL_DELAY;
                // 杀死进程组内残留的进程，它们可能仍然持有输出管道
                kill_group(child_pid);
            } else if (pid == -1 && errno != EINTR) {
                error(errno, "waiting on child {}", child_pid);
            }
        }

        if (!exited && request.memory_limit > 0 && peak_kb * 1024 > request.memory_limit) {
            LOG(WARNING) << fmt::format("memory limit exceeded ({} kB > {} kB): aborting command {}", peak_kb, request.memory_limit / 1024, request.command[0]);
            outcome.memory_exceeded = true;
            kill_group(child_pid);
            if (kill(child_pid, SIGKILL) != 0 && errno != ESRCH)
                LOG(WARNING) << "unable to send SIGKILL to " << child_pid << ": " << strerror(errno);
            while (wait4(child_pid, &status, 0, &usage) == -1) {
                if (errno != EINTR) error(errno, "waiting on killed child {}", child_pid);
            }
            exited = true;
            outcome.elapsed_seconds = timer.seconds();
            drain_deadline = outcome.elapsed_seconds + KILL_DELAY;
        }

        if (!exited && request.wall_limit_seconds > 0 && timer.seconds() >= request.wall_limit_seconds) {
            LOG(WARNING) << fmt::format("timelimit exceeded (hard wall time {:.3f}s): aborting command {}", request.wall_limit_seconds, request.command[0]);
            outcome.timed_out = true;
            kill_group(child_pid);
            if (kill(child_pid, SIGKILL) != 0 && errno != ESRCH)
                LOG(WARNING) << "unable to send SIGKILL to " << child_pid << ": " << strerror(errno);
            while (wait4(child_pid, &status, 0, &usage) == -1) {
                if (errno != EINTR) error(errno, "waiting on killed child {}", child_pid);
            }
            exited = true;
            outcome.elapsed_seconds = timer.seconds();
            drain_deadline = outcome.elapsed_seconds + KILL_DELAY;
        }

        if (exited && stdout_pipe[PIPE_OUT] < 0 && stderr_pipe[PIPE_OUT] < 0) break;
        if (exited && timer.seconds() >= drain_deadline) {
            LOG(WARNING) << "output pipes of " << request.command[0] << " are still open after the command exited, discarding";
            break;
        }

        struct pollfd fds[3];
        int nfds = 0;
        int stdin_idx = -1, stdout_idx = -1, stderr_idx = -1;
        if (stdin_pipe[PIPE_IN] >= 0) {
            stdin_idx = nfds;
            fds[nfds++] = {stdin_pipe[PIPE_IN], POLLOUT, 0};
        }
        if (stdout_pipe[PIPE_OUT] >= 0) {
            stdout_idx = nfds;
            fds[nfds++] = {stdout_pipe[PIPE_OUT], POLLIN, 0};
        }
        if (stderr_pipe[PIPE_OUT] >= 0) {
            stderr_idx = nfds;
            fds[nfds++] = {stderr_pipe[PIPE_OUT], POLLIN, 0};
        }

        double remaining = exited ? drain_deadline - timer.seconds()
                                  : (request.wall_limit_seconds > 0 ? request.wall_limit_seconds - timer.seconds() : 1.0);
        int timeout = max(0, min(POLL_INTERVAL_MS, (int)ceil(remaining * 1000)));
        int r = poll(fds, nfds, timeout);
        if (r == -1) {
            if (errno == EINTR) continue;
            error(errno, "waiting for child data");
        }
        if (r == 0) continue;

        if (stdin_idx >= 0 && fds[stdin_idx].revents) {
            if ((fds[stdin_idx].revents & (POLLERR | POLLHUP)) || !pump_input(stdin_pipe[PIPE_IN], request.stdin_data, written))
                close_fd(stdin_pipe[PIPE_IN]);
        }
        if (stdout_idx >= 0 && fds[stdout_idx].revents) {
            if (!pump_output(stdout_pipe[PIPE_OUT], outcome.stdout_data, request.stream_size, outcome.output_truncated))
                close_fd(stdout_pipe[PIPE_OUT]);
        }
        if (stderr_idx >= 0 && fds[stderr_idx].revents) {
            if (!pump_output(stderr_pipe[PIPE_OUT], outcome.stderr_data, request.stream_size, outcome.output_truncated))
                close_fd(stderr_pipe[PIPE_OUT]);
        }
    }

    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.term_signal = WTERMSIG(status);
        outcome.exit_code = outcome.term_signal + 128;
        if (!outcome.timed_out)
            LOG(WARNING) << "Command terminated with signal (" << outcome.term_signal << ", " << strsignal(outcome.term_signal) << ")";
    }

    outcome.peak_memory_mb = peak_kb / 1024.0;

    LOG(INFO) << fmt::format("run time: real {:.3f}, memory {:.1f}MB, exitcode {}", outcome.elapsed_seconds, outcome.peak_memory_mb, outcome.exit_code);
    return outcome;
}

raw_outcome posix_backend::run(const launch_request &request) {
    try {
        return run_checked(request);
    } catch (system_error &ex) {
        throw internal_error(ex.what());
    }
}

}  // namespace evalbox
