#include "reviser/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <limits>

#ifndef _WIN32
  #include <unistd.h>
  #include <fcntl.h>
  #include <sys/stat.h>
  #include <sys/types.h>
  #include <sys/wait.h>
  #include <poll.h>
  #ifdef __linux__
    #include <sys/prctl.h>
  #endif
#endif

namespace reviser {

int proc_timeout_ms(int seconds) {
    if (seconds <= 0) return 0;
    long long ms = (long long)seconds * 1000;
    return (int)std::min<long long>(ms, std::numeric_limits<int>::max());
}

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;
    bool have_token = false; // "" is a real (empty) argument

    auto flush = [&]() {
        if (have_token) {
            out.push_back(cur);
            cur.clear();
            have_token = false;
        }
    };

    for (size_t i = 0; i < cmd.size(); i++) {
        char c = cmd[i];
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            have_token = true;
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else { // DQ
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

#ifndef _WIN32
namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

bool make_pipe(int p[2]) {
#ifdef __linux__
    return pipe2(p, O_CLOEXEC) == 0;
#else
    if (pipe(p) != 0) return false;
    (void)fcntl(p[0], F_SETFD, FD_CLOEXEC);
    (void)fcntl(p[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

// Shared output budget across stdout and stderr.
struct Capture {
    std::string out;
    std::string err;
    size_t max_bytes{0};
    bool truncated{false};

    void append(std::string& dst, const char* buf, size_t n) {
        size_t used = out.size() + err.size();
        size_t can = max_bytes > used ? max_bytes - used : 0;
        if (n > can) {
            truncated = true;
            n = can;
        }
        dst.append(buf, n);
    }
};

// Read everything currently available. Closes `fd` on EOF or hard error.
void drain(int& fd, std::string& dst, Capture& cap) {
    char buf[4096];
    while (fd >= 0) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            cap.append(dst, buf, (size_t)n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        close_fd(fd);
    }
}

// Child side after fork(). Never returns. On any failure before exec the
// errno is reported through `status_fd` (close-on-exec, so a successful
// exec leaves the parent reading EOF).
[[noreturn]] void exec_child(const std::vector<std::string>& argv,
                             const std::string& cwd,
                             int stdin_fd,
                             int out_fd,
                             int err_fd,
                             int status_fd) {
    auto fail = [status_fd](int e) {
        ssize_t w = ::write(status_fd, &e, sizeof(e));
        (void)w;
        _exit(127);
    };

    if (stdin_fd < 0) {
        stdin_fd = ::open("/dev/null", O_RDONLY);
        if (stdin_fd < 0) fail(errno);
    }
    if (dup2(stdin_fd, STDIN_FILENO) < 0) fail(errno);
    if (dup2(out_fd, STDOUT_FILENO) < 0) fail(errno);
    if (dup2(err_fd, STDERR_FILENO) < 0) fail(errno);

    // own process group so a timeout can kill the whole subtree
    (void)setpgid(0, 0);

    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    for (int fd = 3; fd < maxfd; fd++) {
        if (fd != status_fd) (void)::close(fd);
    }

    if (!cwd.empty() && chdir(cwd.c_str()) != 0) fail(errno);

    unsetenv("LD_PRELOAD");
    unsetenv("LD_LIBRARY_PATH");

#ifdef __linux__
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    execvp(cargv[0], cargv.data());
    fail(errno);
    _exit(127);
}

bool run_capture(const std::vector<std::string>& argv,
                 const std::string& cwd,
                 const std::string* stdin_data,
                 const ProcLimits& lim,
                 ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    const bool feed_stdin = stdin_data && !stdin_data->empty();
    if (feed_stdin) {
        // a child that exits without reading must give EPIPE, not kill us
        ::signal(SIGPIPE, SIG_IGN);
    }

    int out_p[2] = {-1, -1};
    int err_p[2] = {-1, -1};
    int st_p[2] = {-1, -1};
    int in_p[2] = {-1, -1};
    auto close_all = [&]() {
        close_fd(out_p[0]); close_fd(out_p[1]);
        close_fd(err_p[0]); close_fd(err_p[1]);
        close_fd(st_p[0]); close_fd(st_p[1]);
        close_fd(in_p[0]); close_fd(in_p[1]);
    };

    if (!make_pipe(out_p) || !make_pipe(err_p) || !make_pipe(st_p) ||
        (feed_stdin && !make_pipe(in_p))) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        close_all();
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        close_all();
        return false;
    }
    if (pid == 0) {
        exec_child(argv, cwd, in_p[0], out_p[1], err_p[1], st_p[1]);
    }

    // parent
    (void)setpgid(pid, pid);
    close_fd(out_p[1]);
    close_fd(err_p[1]);
    close_fd(st_p[1]);
    close_fd(in_p[0]);

    // EOF here means exec succeeded; an int means it did not.
    int child_errno = 0;
    ssize_t sn;
    do {
        sn = ::read(st_p[0], &child_errno, sizeof(child_errno));
    } while (sn < 0 && errno == EINTR);
    close_fd(st_p[0]);
    if (sn == (ssize_t)sizeof(child_errno)) {
        int status = 0;
        (void)waitpid(pid, &status, 0);
        close_all();
        res->error = "cannot execute '" + argv[0] + "': " + std::strerror(child_errno);
        return false;
    }

    int out_fd = out_p[0];
    int err_fd = err_p[0];
    int in_fd = in_p[1];
    out_p[0] = err_p[0] = in_p[1] = -1;
    set_nonblock(out_fd);
    set_nonblock(err_fd);
    if (in_fd >= 0) set_nonblock(in_fd);

    Capture cap;
    cap.max_bytes = lim.output_max_bytes;
    size_t write_off = 0;

    auto start = std::chrono::steady_clock::now();
    int status = 0;

    while (true) {
        struct pollfd fds[3];
        nfds_t nfds = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_fd >= 0) { in_idx = (int)nfds; fds[nfds].fd = in_fd; fds[nfds].events = POLLOUT; fds[nfds].revents = 0; nfds++; }
        if (out_fd >= 0) { out_idx = (int)nfds; fds[nfds].fd = out_fd; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++; }
        if (err_fd >= 0) { err_idx = (int)nfds; fds[nfds].fd = err_fd; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++; }

        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        int slice = 50;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining <= 0) {
                res->timed_out = true;
                (void)kill(-pid, SIGKILL);
                (void)kill(pid, SIGKILL);
                (void)waitpid(pid, &status, 0);
                break;
            }
            slice = std::max(1, std::min(slice, remaining));
        }

        int pr = poll(nfds ? fds : nullptr, nfds, slice);
        if (pr < 0 && errno == EINTR) continue;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data->size()) {
                ssize_t n = ::write(in_fd, stdin_data->data() + write_off, stdin_data->size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n < 0 && errno == EINTR) continue;
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data->size(); // EPIPE or similar: stop feeding
                break;
            }
            if (write_off >= stdin_data->size()) close_fd(in_fd);
        }
        if (out_idx >= 0 && fds[out_idx].revents) drain(out_fd, cap.out, cap);
        if (err_idx >= 0 && fds[err_idx].revents) drain(err_fd, cap.err, cap);

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
    }

    close_fd(in_fd);
    // whatever the child left in the pipes; grandchildren holding the write
    // end open only yield EAGAIN here, never a hang
    drain(out_fd, cap.out, cap);
    drain(err_fd, cap.err, cap);
    close_fd(out_fd);
    close_fd(err_fd);

    res->stdout_bytes = cap.out.size();
    res->output = std::move(cap.out);
    res->output += cap.err;
    res->output_truncated = cap.truncated;

    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;

    if (res->timed_out) {
        res->error = "timed out after " + std::to_string(lim.timeout_ms) + " ms";
    }
    return true;
}

} // namespace
#endif

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res) {
#ifdef _WIN32
    (void)argv; (void)cwd; (void)lim;
    if (res) { *res = ProcResult{}; res->error = "proc_run_capture: not supported on Windows"; }
    return false;
#else
    return run_capture(argv, cwd, nullptr, lim, res);
#endif
}

bool proc_run_capture_stdin(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const std::string& stdin_data,
                            const ProcLimits& lim,
                            ProcResult* res) {
#ifdef _WIN32
    (void)argv; (void)cwd; (void)stdin_data; (void)lim;
    if (res) { *res = ProcResult{}; res->error = "proc_run_capture_stdin: not supported on Windows"; }
    return false;
#else
    return run_capture(argv, cwd, &stdin_data, lim, res);
#endif
}

} // namespace reviser
