#include "common/utils.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <system_error>
#include "common/defer.hpp"

namespace grader {
using namespace std;

static void append_bounded(string &buffer, const char *data, size_t len, size_t max_output) {
    if (buffer.size() >= max_output) return;
    buffer.append(data, min(len, max_output - buffer.size()));
}

process_result exec_program(const vector<string> &args, const process_options &options) {
    int in_fd = open(options.stdin_file.empty() ? "/dev/null" : options.stdin_file.c_str(), O_RDONLY | O_CLOEXEC);
    if (in_fd < 0)
        throw system_error(errno, system_category(), "unable to open stdin " + options.stdin_file.string());
    defer { close(in_fd); };

    int out_pipe[2], err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "pipe");
    defer { close(out_pipe[0]); };
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(out_pipe[1]);
        throw system_error(err, system_category(), "pipe");
    }
    defer { close(err_pipe[0]); };

    // exec 成功后 status_pipe 随 CLOEXEC 关闭，失败时子进程写入 errno
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(out_pipe[1]);
        close(err_pipe[1]);
        throw system_error(err, system_category(), "pipe");
    }
    defer { close(status_pipe[0]); };

    vector<const char *> argv;
    for (auto &arg : args) argv.push_back(arg.c_str());
    argv.push_back(nullptr);

    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1: {  // fork 失败
            int err = errno;
            close(out_pipe[1]);
            close(err_pipe[1]);
            close(status_pipe[1]);
            throw system_error(err, system_category(), "fork");
        }
        case 0:  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            dup2(in_fd, STDIN_FILENO);
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            for (auto &[key, value] : options.env)
                set_env(key, value);
            execvp(argv[0], (char **)argv.data());
            {
                int err = errno;
                ssize_t written = write(status_pipe[1], &err, sizeof(err));
                (void)written;
            }
            _exit(127);
        default:
            break;
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    close(status_pipe[1]);

    int exec_errno = 0;
    ssize_t status_bytes;
    while ((status_bytes = read(status_pipe[0], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR)
        ;
    if (status_bytes == (ssize_t)sizeof(exec_errno)) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
            ;
        throw system_error(exec_errno, system_category(), "unable to execute " + args[0]);
    }

    process_result result;
    pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    string *buffers[2] = {&result.out, &result.err};
    int open_fds = 2;
    char buf[65536];
    while (open_fds > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                append_bounded(*buffers[i], buf, n, options.max_output);
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;  // poll 会忽略负数的 fd
                --open_fds;
            }
        }
    }

    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), "waitpid");
    }
    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    else
        result.exit_code = -1;
    return result;
}

string shell_quote(const string &arg) {
    if (arg.empty()) return "''";
    bool safe = all_of(arg.begin(), arg.end(), [](char c) {
        return isalnum((unsigned char)c) || string("@%+=:,./-_").find(c) != string::npos;
    });
    if (safe) return arg;

    string quoted = "'";
    for (char c : arg) {
        if (c == '\'')
            quoted += "'\"'\"'";
        else
            quoted += c;
    }
    return quoted + "'";
}

string shell_join(const vector<string> &args) {
    string result;
    for (auto &arg : args) {
        if (!result.empty()) result += ' ';
        result += shell_quote(arg);
    }
    return result;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

}  // namespace grader
