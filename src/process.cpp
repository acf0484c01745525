// ============================================================================
// process.cpp — implementation for process.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "netroster/process.hpp"

#include <algorithm>
#include <cerrno>          // errno for EINTR/EAGAIN handling
#include <cstdlib>         // getenv for PATH
#include <cstring>         // strerror for human-readable errno
#include <thread>

#include <fcntl.h>         // O_CLOEXEC, O_NONBLOCK, fcntl
#include <poll.h>          // poll(2) for the timeout-bounded read loop
#include <signal.h>        // kill, SIGTERM, SIGKILL
#include <sys/stat.h>      // stat for executable checks
#include <sys/wait.h>      // waitpid and status macros
#include <unistd.h>        // fork, execvp, pipe2, dup2, access

namespace netroster {

// ---------------------------------------------------------------------------
// Timing constants.
// - POLL_SLICE_MS: how often the read loop re-checks the ScanContext.
// - KILL_GRACE_MS: time between SIGTERM and SIGKILL during teardown.
// ---------------------------------------------------------------------------
static constexpr int POLL_SLICE_MS = 100;
static constexpr int KILL_GRACE_MS = 500;


// -------- helpers --------

static bool is_executable_file(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return ::access(path.c_str(), X_OK) == 0;
}

/*
 * decode_status()
 * ---------------
 * Map a waitpid() status onto a shell-style exit code: the exit status for a
 * normal exit, 128+signo for a signal death.
 */
static int decode_status(int status) {
    if (WIFEXITED(status))   return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

/*
 * kill_group()
 * ------------
 * SIGTERM the child's process group, give it KILL_GRACE_MS to exit, then
 * SIGKILL and reap. Always reaps so no zombie is left behind.
 */
static void kill_group(pid_t pid) {
    ::kill(-pid, SIGTERM);
    const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(KILL_GRACE_MS);
    int status = 0;
    while (std::chrono::steady_clock::now() < until) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno == ECHILD)) {
            ::kill(-pid, SIGKILL);          // stragglers in the group
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ::kill(-pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

// Drain whatever is readable on fd into out. Returns false once the fd hit EOF.
static bool drain(int fd, std::string& out) {
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) { out.append(buf, static_cast<size_t>(n)); continue; }
        if (n == 0) return false;                               // EOF
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;                                           // treat read errors as EOF
    }
}

static int poll_timeout_ms(const ScanContext& ctx) {
    auto left = ctx.remaining().count();
    return static_cast<int>(std::min<long long>(left, POLL_SLICE_MS));
}


// -------- public API --------

std::string find_executable(const std::string& name) {
    if (name.empty()) return {};
    if (name.find('/') != std::string::npos)
        return is_executable_file(name) ? name : std::string();

    const char* env = std::getenv("PATH");
    const std::string path = (env && *env) ? env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";                             // POSIX: empty entry = cwd
        std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate)) return candidate;
        start = end + 1;
    }
    return {};
}

/*
 * run_process()
 * -------------
 * Phases:
 *   1) pipes for stdout/stderr (close-on-exec so siblings don't inherit them),
 *   2) fork; the child joins its own process group, wires the pipes, execs,
 *   3) parent polls both pipes in POLL_SLICE_MS slices until EOF on both,
 *      checking the context between slices,
 *   4) reap the child (still bounded by the context).
 * Expiry at any point in 3) or 4) tears the group down and returns false.
 */
bool run_process(const std::vector<std::string>& argv,
                 const ScanContext& ctx,
                 ProcessResult& result,
                 std::string& err) {
    result = ProcessResult{};
    if (argv.empty()) { err = "empty command"; return false; }
    if (ctx.expired()) { err = ctx.reason(); return false; }

    int out_pipe[2], err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        err = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        err = std::string("pipe failed: ") + std::strerror(errno);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        return false;
    }

    // Build argv before fork: no allocation in the child.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        err = std::string("fork failed: ") + std::strerror(errno);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        ::close(err_pipe[0]); ::close(err_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // child
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(cargv[0], cargv.data());
        ::_exit(127);                                           // exec failed
    }

    // parent
    ::setpgid(pid, pid);                                        // close the race with the child's own call
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    bool out_open = true, err_open = true;
    bool expired = false;

    while (out_open || err_open) {
        if (ctx.expired()) { expired = true; break; }

        fds[0].fd = out_open ? out_pipe[0] : -1;                // negative fds are ignored by poll
        fds[1].fd = err_open ? err_pipe[0] : -1;
        int pr = ::poll(fds, 2, poll_timeout_ms(ctx));
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;                                              // fall through to reap
        }
        if (pr == 0) continue;                                  // slice elapsed; re-check ctx

        if (out_open && (fds[0].revents & (POLLIN | POLLHUP | POLLERR)))
            out_open = drain(out_pipe[0], result.output);
        if (err_open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)))
            err_open = drain(err_pipe[0], result.err_output);
    }

    ::close(out_pipe[0]);
    ::close(err_pipe[0]);

    if (!expired) {
        // Pipes are closed, but the child may still be alive (e.g. it closed
        // stdout early). Keep honouring the context while waiting for it.
        int status = 0;
        while (true) {
            pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid) { result.exit_code = decode_status(status); return true; }
            if (r < 0 && errno != EINTR) {
                err = std::string("waitpid failed: ") + std::strerror(errno);
                return false;
            }
            if (ctx.expired()) { expired = true; break; }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    kill_group(pid);
    err = ctx.reason();
    return false;
}

} // namespace netroster
