#include "process/subprocess.hpp"
#include "detect/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace noisedet {

namespace {

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    void reset() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_{-1};
};

struct Pipe {
    UniqueFd read;
    UniqueFd write;
};

void openPipe(Pipe& p) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        throw ExecutionError(std::string("pipe() failed: ") + std::strerror(errno));
    }
    p.read = UniqueFd(fds[0]);
    p.write = UniqueFd(fds[1]);
}

std::string errnoText(int err) {
    return std::strerror(err);
}

// Waits for the child, giving up at `deadline` when one is given.
bool reap(pid_t pid, int& status,
          std::optional<std::chrono::steady_clock::time_point> deadline) {
    for (;;) {
        pid_t r = ::waitpid(pid, &status, deadline ? WNOHANG : 0);
        if (r == pid) return true;
        if (r < 0 && errno != EINTR) {
            throw ExecutionError("waitpid() failed: " + errnoText(errno));
        }
        if (deadline && std::chrono::steady_clock::now() >= *deadline) return false;
        if (deadline) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

void killAndReap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

} // namespace

std::string describeCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        if (arg.find(' ') != std::string::npos) out += "'" + arg + "'";
        else out += arg;
    }
    return out;
}

ProcessResult runProcess(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout) {
    if (argv.empty() || argv.front().empty()) {
        throw ExecutionError("no program to run");
    }
    const std::string& program = argv.front();

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    Pipe out, err, execStatus;
    openPipe(out);
    openPipe(err);
    openPipe(execStatus);

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    pid_t pid = ::fork();
    if (pid < 0) {
        throw ExecutionError("fork() failed: " + errnoText(errno));
    }
    if (pid == 0) {
        // Child. Only async-signal-safe calls from here on.
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out.write.get(), STDOUT_FILENO);
        ::dup2(err.write.get(), STDERR_FILENO);
        ::execvp(program.c_str(), cargv.data());
        int code = errno;
        ssize_t ignored = ::write(execStatus.write.get(), &code, sizeof(code));
        (void)ignored;
        _exit(127);
    }

    // Parent.
    out.write.reset();
    err.write.reset();
    execStatus.write.reset();

    // EOF here means exec succeeded and the close-on-exec fd went away.
    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(execStatus.read.get(), &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        int status = 0;
        reap(pid, status, std::nullopt);
        throw ExecutionError("failed to launch " + program + ": " + errnoText(execErrno));
    }

    ProcessResult result;
    pollfd fds[2] = {
        {out.read.get(), POLLIN, 0},
        {err.read.get(), POLLIN, 0},
    };
    std::string* sinks[2] = {&result.stdoutText, &result.stderrText};
    int openStreams = 2;
    char buf[4096];

    while (openStreams > 0) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            killAndReap(pid);
            throw ExecutionError(program + " timed out after " +
                                 std::to_string(timeout.count()) + " ms");
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int ready = ::poll(fds, 2, static_cast<int>(remaining.count()) + 1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            int e = errno;
            killAndReap(pid);
            throw ExecutionError("poll() failed: " + errnoText(e));
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t got = ::read(fds[i].fd, buf, sizeof(buf));
            if (got > 0) {
                sinks[i]->append(buf, static_cast<std::size_t>(got));
            } else if (got == 0 || errno != EINTR) {
                fds[i].fd = -1;  // poll ignores negative descriptors
                --openStreams;
            }
        }
    }

    int status = 0;
    if (!reap(pid, status, deadline)) {
        killAndReap(pid);
        throw ExecutionError(program + " timed out after " +
                             std::to_string(timeout.count()) + " ms");
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.termSignal = WTERMSIG(status);
    }
    return result;
}

} // namespace noisedet
