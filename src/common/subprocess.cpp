#include "common/subprocess.h"
#include "common/logger.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ocrlayer {

// ==================== Errors ====================

SubprocessError::SubprocessError(const std::string& program, int errnum)
    : Error(fmt::format("cannot execute {}: {}", program, std::strerror(errnum))),
      program_(program), errnum_(errnum) {}

CalledProcessError::CalledProcessError(const std::string& program, int status,
                                       const std::string& stderrText)
    : Error(fmt::format("{} failed with exit code {}{}{}", program, status,
                        stderrText.empty() ? "" : ": ", stderrText)),
      program_(program), status_(status), stderrText_(stderrText) {}

CalledProcessInterrupted::CalledProcessInterrupted(const std::string& program, int signal)
    : Error(fmt::format("{} was interrupted by signal {} ({})", program, signal, strsignal(signal))),
      program_(program), signal_(signal) {}

bool CalledProcessInterrupted::byUser() const {
    return signal_ == SIGINT || signal_ == SIGTERM || signal_ == SIGHUP;
}

// ==================== RunSubprocess ====================

namespace {

class Pipe {
public:
    Pipe() {
        if (pipe2(fds_, O_CLOEXEC) != 0) {
            throw SubprocessError("pipe", errno);
        }
    }
    ~Pipe() {
        CloseRead();
        CloseWrite();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read() const { return fds_[0]; }
    int write() const { return fds_[1]; }
    void CloseRead() {
        if (fds_[0] >= 0) { ::close(fds_[0]); fds_[0] = -1; }
    }
    void CloseWrite() {
        if (fds_[1] >= 0) { ::close(fds_[1]); fds_[1] = -1; }
    }

private:
    int fds_[2] = {-1, -1};
};

// Drain stdout and stderr together so that neither pipe can fill up and
// block the child.
void ReadOutputs(int outFd, int errFd, std::string& out, std::string& err) {
    struct pollfd fds[2] = {{outFd, POLLIN, 0}, {errFd, POLLIN, 0}};
    std::string* sinks[2] = {&out, &err};
    int open = 2;
    char buffer[8192];

    while (open > 0) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw SubprocessError("poll", errno);
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open;
            }
        }
    }
}

} // namespace

SubprocessResult RunSubprocess(const std::vector<std::string>& argv, bool checkStatus) {
    if (argv.empty()) {
        throw std::invalid_argument("RunSubprocess: empty argv");
    }
    const std::string& program = argv[0];

    // Everything the child touches is prepared before fork(): only
    // async-signal-safe calls are allowed after it in a threaded process.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    Pipe outPipe, errPipe, execPipe;
    sigset_t emptyMask;
    sigemptyset(&emptyMask);

    LOG_TRACE("Running {}", fmt::join(argv, " "));

    pid_t pid = ::fork();
    if (pid < 0) {
        throw SubprocessError(program, errno);
    }

    if (pid == 0) {
        ::dup2(outPipe.write(), STDOUT_FILENO);
        ::dup2(errPipe.write(), STDERR_FILENO);
        ::sigprocmask(SIG_SETMASK, &emptyMask, nullptr);
        ::execvp(cargv[0], cargv.data());
        int err = errno;
        ssize_t ignored = ::write(execPipe.write(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    outPipe.CloseWrite();
    errPipe.CloseWrite();
    execPipe.CloseWrite();

    SubprocessResult result;
    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(execPipe.read(), &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);

    if (n != sizeof(execErrno)) {
        execErrno = 0;
        ReadOutputs(outPipe.read(), errPipe.read(), result.stdoutText, result.stderrText);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw SubprocessError(program, errno);
        }
    }

    if (execErrno != 0) {
        throw SubprocessError(program, execErrno);
    }
    if (WIFSIGNALED(status)) {
        throw CalledProcessInterrupted(program, WTERMSIG(status));
    }

    result.exitStatus = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (checkStatus && result.exitStatus != 0) {
        std::string tail = result.stderrText.size() > 512
            ? result.stderrText.substr(result.stderrText.size() - 512)
            : result.stderrText;
        while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r')) {
            tail.pop_back();
        }
        throw CalledProcessError(program, result.exitStatus, tail);
    }
    return result;
}

} // namespace ocrlayer
