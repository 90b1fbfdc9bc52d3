#include "subprocess.hpp"
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <thread>
extern char **environ;

using Clock = std::chrono::steady_clock;

static int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

static void kill_group(pid_t pid) {
    // The child called setpgid(0, 0); fall back to the pid alone if that raced.
    if (kill(-pid, SIGKILL) == -1) kill(pid, SIGKILL);
}

// Reaps pid if it exits before the deadline. Waits on a pidfd where the kernel
// has one, otherwise polls waitpid with a growing sleep.
static bool wait_until(pid_t pid, int& status, Clock::time_point deadline) {
    pid_t w;
    while ((w = waitpid(pid, &status, WNOHANG)) == -1 && errno == EINTR) {}
    if (w == pid) return true;
    if (w == -1) return false;

#ifdef SYS_pidfd_open
    int pidfd = static_cast<int>(syscall(SYS_pidfd_open, pid, 0));
    if (pidfd >= 0) {
        pollfd pfd{pidfd, POLLIN, 0};
        int n;
        while ((n = poll(&pfd, 1, remaining_ms(deadline))) == -1 && errno == EINTR) {}
        close(pidfd);
        if (n <= 0) return false;
        while ((w = waitpid(pid, &status, 0)) == -1 && errno == EINTR) {}
        return w == pid;
    }
#endif

    auto nap = std::chrono::milliseconds(1);
    while (remaining_ms(deadline) > 0) {
        std::this_thread::sleep_for(std::min(nap, std::chrono::milliseconds(remaining_ms(deadline))));
        while ((w = waitpid(pid, &status, WNOHANG)) == -1 && errno == EINTR) {}
        if (w == pid) return true;
        if (w == -1) return false;
        if (nap < std::chrono::milliseconds(50)) nap *= 2;
    }
    return false;
}

ProcessResult run_process(const std::vector<std::string>& args, int timeout_ms) {
    if (args.empty()) throw std::runtime_error("run_process: empty argv");

    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    int outpipe[2], errpipe[2];
    if (pipe(outpipe) == -1) throw std::runtime_error(std::string("failed to create pipes: ") + std::strerror(errno));
    if (pipe(errpipe) == -1) {
        int saved = errno;
        close(outpipe[0]); close(outpipe[1]);
        throw std::runtime_error(std::string("failed to create pipes: ") + std::strerror(saved));
    }

    ProcessResult r;
    const auto t0 = Clock::now();
    const auto deadline = t0 + std::chrono::milliseconds(timeout_ms);

    pid_t pid = fork();
    if (pid == 0) {
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) { dup2(devnull, STDIN_FILENO); close(devnull); }
        dup2(outpipe[1], STDOUT_FILENO);
        dup2(errpipe[1], STDERR_FILENO);
        close(outpipe[0]); close(outpipe[1]);
        close(errpipe[0]); close(errpipe[1]);
        execve(argv[0], argv.data(), environ);
        std::perror("execve");
        _exit(127);
    } else if (pid < 0) {
        int saved = errno;
        close(outpipe[0]); close(outpipe[1]);
        close(errpipe[0]); close(errpipe[1]);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(saved));
    }

    close(outpipe[1]); close(errpipe[1]);

    pollfd fds[2] = {{outpipe[0], POLLIN, 0}, {errpipe[0], POLLIN, 0}};
    std::string* sinks[2] = {&r.out, &r.err};
    int open_fds = 2;
    char buf[4096];

    while (open_fds > 0) {
        int wait = remaining_ms(deadline);
        if (wait == 0) { r.timed_out = true; break; }
        int n = poll(fds, 2, wait);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) { r.timed_out = true; break; }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t got = read(fds[i].fd, buf, sizeof(buf));
            if (got > 0) {
                sinks[i]->append(buf, static_cast<size_t>(got));
            } else if (got == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }
    for (auto& f : fds) {
        if (f.fd >= 0) close(f.fd);
    }

    // Pipes are closed; the child may still be running if it closed them early.
    int status = 0;
    bool reaped = false;
    if (!r.timed_out) {
        reaped = wait_until(pid, status, deadline);
        if (!reaped && remaining_ms(deadline) == 0) r.timed_out = true;
    }
    if (r.timed_out) {
        kill_group(pid);
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
    }

    r.ms = std::chrono::duration<double, std::milli>(Clock::now() - t0).count();

    if (!r.timed_out && reaped) {
        if (WIFEXITED(status)) {
            r.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            r.signal = WTERMSIG(status);
        }
    }
    return r;
}
