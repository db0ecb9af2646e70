#include "pool/PtyProcess.h"

#include <fcntl.h>
#include <pty.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <thread>

extern char** environ;

namespace termrelay::pool {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void throw_errno(int err, const std::string& what) {
    throw std::system_error(err, std::generic_category(), what);
}

// Child side only: report errno through the status pipe and exit.
[[noreturn]] void child_fail(int fd, int err) {
    ssize_t n = ::write(fd, &err, sizeof err);
    (void)n;
    ::_exit(127);
}

// Highest descriptor open in this process, from /proc/self/fd when readable.
int highest_open_fd() {
    int highest = -1;
    std::error_code ec;
    fs::directory_iterator it("/proc/self/fd", ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const std::string name = it->path().filename().string();
        char* end = nullptr;
        const long fd = std::strtol(name.c_str(), &end, 10);
        if (end != name.c_str() && *end == '\0' && fd > highest) highest = static_cast<int>(fd);
    }
    if (!ec && highest >= 0) return highest;

    const long max = ::sysconf(_SC_OPEN_MAX);
    return max > 0 ? static_cast<int>(max) - 1 : 1023;
}

std::vector<std::string> build_environment(const PtyProcess::Options& options) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        const auto eq = entry.find('=');
        const std::string_view key = entry.substr(0, eq);

        bool overridden = false;
        for (const auto& [k, v] : options.env) {
            if (k == key) {
                overridden = true;
                break;
            }
        }
        if (!overridden) out.emplace_back(entry);
    }
    for (const auto& [k, v] : options.env) out.push_back(k + "=" + v);
    return out;
}

} // namespace

PtyProcess PtyProcess::spawn(const Options& options) {
    std::error_code fs_ec;
    const fs::path script = fs::absolute(options.script, fs_ec);
    if (fs_ec) throw std::system_error(fs_ec, "script " + options.script);
    if (::access(script.c_str(), R_OK) != 0) throw_errno(errno, "script " + script.string());

    // Everything the child needs is built before fork().
    const std::string dir = script.parent_path().string();
    const std::string script_path = script.string();
    std::vector<char*> argv{const_cast<char*>(options.interpreter.c_str()),
                            const_cast<char*>(script_path.c_str()),
                            nullptr};

    std::vector<std::string> env = build_environment(options);
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& entry : env) envp.push_back(entry.data());
    envp.push_back(nullptr);

    int status_pipe[2];
    if (::pipe2(status_pipe, O_CLOEXEC) != 0) throw_errno(errno, "pipe2");
    const int highest_fd = highest_open_fd();

    struct winsize ws{};
    ws.ws_row = options.rows;
    ws.ws_col = options.cols;

    int master = -1;
    const pid_t pid = ::forkpty(&master, nullptr, nullptr, &ws);
    if (pid < 0) {
        const int err = errno;
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        throw_errno(err, "forkpty");
    }

    if (pid == 0) {
        ::close(status_pipe[0]);

        // Sockets and other pool descriptors stay out of the simulator.
        // EBADF for gaps in the range is expected.
        for (int fd = STDERR_FILENO + 1; fd <= highest_fd; ++fd) ::fcntl(fd, F_SETFD, FD_CLOEXEC);

        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        if (!dir.empty() && ::chdir(dir.c_str()) != 0) child_fail(status_pipe[1], errno);
        ::execve(argv[0], argv.data(), envp.data());
        child_fail(status_pipe[1], errno);
    }

    ::close(status_pipe[1]);

    // EOF means exec succeeded (the write end was close-on-exec).
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof child_errno);
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n > 0) {
        ::waitpid(pid, nullptr, 0);
        ::close(master);
        throw_errno(child_errno, "exec " + options.interpreter);
    }

    // Keep this master out of sessions spawned later.
    ::fcntl(master, F_SETFD, FD_CLOEXEC);
    return PtyProcess(pid, master);
}

PtyProcess::PtyProcess(PtyProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      master_(std::exchange(other.master_, -1)),
      status_(std::exchange(other.status_, std::nullopt)) {}

PtyProcess& PtyProcess::operator=(PtyProcess&& other) noexcept {
    if (this != &other) {
        reset();
        pid_ = std::exchange(other.pid_, -1);
        master_ = std::exchange(other.master_, -1);
        status_ = std::exchange(other.status_, std::nullopt);
    }
    return *this;
}

PtyProcess::~PtyProcess() {
    reset();
}

void PtyProcess::reset() noexcept {
    if (master_ >= 0) {
        ::close(master_);
        master_ = -1;
    }
    if (pid_ > 0 && running()) {
        spdlog::warn("pid {} still running at teardown, killing", pid_);
        ::killpg(pid_, SIGKILL);
        // Bounded reap; a child stuck in the kernel is left behind.
        int st = 0;
        for (int attempt = 0; attempt < kReapAttempts && !status_; ++attempt) {
            if (::waitpid(pid_, &st, WNOHANG) == pid_) {
                status_ = st;
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
        if (!status_) spdlog::warn("pid {} not reaped, abandoning it", pid_);
    }
    pid_ = -1;
}

int PtyProcess::release_master() noexcept {
    return std::exchange(master_, -1);
}

bool PtyProcess::running() {
    if (pid_ <= 0 || status_) return false;

    int st = 0;
    const pid_t r = ::waitpid(pid_, &st, WNOHANG);
    if (r == 0) return true;
    if (r == pid_) {
        status_ = st;
        return false;
    }
    // ECHILD: reaped elsewhere; either way it is not ours to wait for.
    status_ = -1;
    return false;
}

bool PtyProcess::signal_group(int sig) noexcept {
    if (pid_ <= 0) return false;
    return ::killpg(pid_, sig) == 0;
}

void PtyProcess::resize(int master_fd, unsigned short cols, unsigned short rows) {
    struct winsize ws{};
    ws.ws_row = rows;
    ws.ws_col = cols;
    if (::ioctl(master_fd, TIOCSWINSZ, &ws) != 0) throw_errno(errno, "TIOCSWINSZ");
}

} // namespace termrelay::pool
