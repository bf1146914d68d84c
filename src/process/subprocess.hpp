#ifndef MFNF_SUBPROCESS_HPP
#define MFNF_SUBPROCESS_HPP

#include <string>
#include <vector>
#include <stdexcept>

namespace mfnf {

// Exception thrown when a child process cannot be started
class ProcessLaunchError : public std::runtime_error {
public:
    explicit ProcessLaunchError(const std::string& msg) : std::runtime_error(msg) {}
};

// Exception thrown when the output of a child process cannot be read
class ProcessReadError : public std::runtime_error {
public:
    explicit ProcessReadError(const std::string& msg) : std::runtime_error(msg) {}
};

// Captured result of a finished child process
struct ProcessOutput {
    std::string stdout_bytes;  // Raw bytes written to stdout
    int exit_status;           // Exit code, or signal number if signaled
    bool signaled;             // True if the process was killed by a signal

    ProcessOutput() : exit_status(0), signaled(false) {}
};

// Runs program with args and waits for it to finish.
//
// The program is searched on PATH unless it contains a '/'. Arguments are
// handed to the child verbatim (no shell is involved), stdin is /dev/null and
// stderr is inherited. There is no timeout: a child that never exits blocks
// the caller.
//
// Throws: ProcessLaunchError if the pipe or fork fails, or the program
// cannot be executed (missing, not executable, bad interpreter).
// ProcessReadError if reading stdout fails; the child is still reaped.
ProcessOutput run_process(const std::string& program, const std::vector<std::string>& args);

// Reads fd until EOF, retrying on EINTR. Throws ProcessReadError on any
// other read error.
std::string read_until_eof(int fd);

} // namespace mfnf

#endif // MFNF_SUBPROCESS_HPP
