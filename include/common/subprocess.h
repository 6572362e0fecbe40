#pragma once

#include "common/errors.h"
#include <string>
#include <vector>

namespace ocrlayer {

/**
 * @brief The child could not be started (executable missing, fork failure)
 */
class SubprocessError : public Error {
public:
    SubprocessError(const std::string& program, int errnum);

    const std::string& program() const { return program_; }
    int errnum() const { return errnum_; }

private:
    std::string program_;
    int errnum_;
};

/**
 * @brief The child exited with a non-zero status
 */
class CalledProcessError : public Error {
public:
    CalledProcessError(const std::string& program, int status, const std::string& stderrText);

    const std::string& program() const { return program_; }
    int status() const { return status_; }
    const std::string& stderrText() const { return stderrText_; }

private:
    std::string program_;
    int status_;
    std::string stderrText_;
};

/**
 * @brief The child was killed by a signal
 *
 * byUser() is true for SIGINT/SIGTERM/SIGHUP, i.e. an interrupt that also hit
 * the parent's process group.
 */
class CalledProcessInterrupted : public Error {
public:
    CalledProcessInterrupted(const std::string& program, int signal);

    const std::string& program() const { return program_; }
    int signal() const { return signal_; }
    bool byUser() const;

private:
    std::string program_;
    int signal_;
};

struct SubprocessResult {
    int exitStatus = 0;
    std::string stdoutText;
    std::string stderrText;
};

/**
 * @brief Run an external program and wait for it
 *
 * Uses fork/execvp with stdout and stderr captured through pipes. Signals
 * blocked in the calling thread are unblocked in the child, so a terminal
 * interrupt reaches it even if the parent handles signals in a dedicated
 * thread. Safe to call from several threads at once.
 *
 * @param argv program and arguments; argv[0] is looked up in PATH
 * @param checkStatus throw CalledProcessError on non-zero exit
 * @throws SubprocessError, CalledProcessError, CalledProcessInterrupted
 */
SubprocessResult RunSubprocess(const std::vector<std::string>& argv, bool checkStatus = true);

} // namespace ocrlayer
