#include "process/subprocess.hpp"
#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mfnf {

namespace {

void close_fd(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

int wait_for(pid_t pid, bool& signaled) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            signaled = false;
            return -1;
        }
    }

    if (WIFSIGNALED(status)) {
        signaled = true;
        return WTERMSIG(status);
    }
    signaled = false;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace

std::string read_until_eof(int fd) {
    std::string out;
    std::array<char, 4096> buffer;

    while (true) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            out.append(buffer.data(), static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            throw ProcessReadError("Failed to read process output: " +
                std::string(std::strerror(errno)));
        }
    }

    return out;
}

ProcessOutput run_process(const std::string& program, const std::vector<std::string>& args) {
    // argv must be built before fork, the child may only touch prepared memory
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int out_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        throw ProcessLaunchError("Failed to create stdout pipe for " + program + ": " +
            std::strerror(errno));
    }

    // Reports exec failures from the child; closed automatically on successful exec
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        throw ProcessLaunchError("Failed to create status pipe for " + program + ": " +
            std::strerror(saved));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        throw ProcessLaunchError("Failed to fork for " + program + ": " + std::strerror(saved));
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::execvp(program.c_str(), argv.data());

        int exec_errno = errno;
        ssize_t ignored = ::write(err_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        close_fd(out_pipe[0]);
        bool signaled = false;
        wait_for(pid, signaled);
        throw ProcessLaunchError("Failed to execute " + program + ": " + std::strerror(exec_errno));
    }

    ProcessOutput output;
    try {
        output.stdout_bytes = read_until_eof(out_pipe[0]);
    } catch (const ProcessReadError& e) {
        close_fd(out_pipe[0]);
        bool signaled = false;
        wait_for(pid, signaled);
        throw ProcessReadError(std::string(e.what()) + " (" + program + ")");
    }
    close_fd(out_pipe[0]);
    output.exit_status = wait_for(pid, output.signaled);

    return output;
}

} // namespace mfnf
