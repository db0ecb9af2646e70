#pragma once

#include <sys/types.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace termrelay::pool {

// A child process whose stdin/stdout/stderr is the slave side of a fresh
// pseudo-terminal. The child is a session leader, so its pid doubles as the
// process group id and the whole tree can be signalled at once.
class PtyProcess {
public:
    struct Options {
        std::string interpreter = "/bin/bash";
        std::string script;
        // Added to (or overriding) the parent environment.
        std::vector<std::pair<std::string, std::string>> env;
        unsigned short cols = 80;
        unsigned short rows = 24;
    };

    // Runs `interpreter script` with the script's directory as working
    // directory. Throws std::system_error if the script is unreadable, the
    // pty cannot be allocated, or exec fails in the child.
    static PtyProcess spawn(const Options& options);

    PtyProcess() = default;
    PtyProcess(PtyProcess&& other) noexcept;
    PtyProcess& operator=(PtyProcess&& other) noexcept;
    ~PtyProcess();

    PtyProcess(const PtyProcess&) = delete;
    PtyProcess& operator=(const PtyProcess&) = delete;

    pid_t pid() const noexcept { return pid_; }
    int master_fd() const noexcept { return master_; }

    // Hands the master descriptor to the caller, who then owns closing it.
    int release_master() noexcept;

    // Polls (and reaps) the child without blocking.
    bool running();
    std::optional<int> wait_status() const noexcept { return status_; }

    // killpg(); false if the group is already gone or the call failed.
    bool signal_group(int sig) noexcept;

    // TIOCSWINSZ on a pty master. Throws std::system_error.
    static void resize(int master_fd, unsigned short cols, unsigned short rows);

private:
    static constexpr int kReapAttempts = 20;  // 10ms apart

    PtyProcess(pid_t pid, int master) noexcept : pid_(pid), master_(master) {}
    void reset() noexcept;

    pid_t pid_ = -1;
    int master_ = -1;
    std::optional<int> status_;
};

} // namespace termrelay::pool
