#include "supervisor/managed_process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

ManagedProcess::ManagedProcess(Token, pid_t pid, int output_fd)
    : pid_(pid), output_fd_(output_fd), started_at_(std::chrono::steady_clock::now()) {}

ManagedProcess::~ManagedProcess() {
    if (!terminated_) {
        terminate(ProcessTerminator("Process " + std::to_string(pid_)));
    }
    if (output_fd_ >= 0) {
        close(output_fd_);
        output_fd_ = -1;
    }
}

ManagedProcess::SpawnResult ManagedProcess::spawn(const std::string& command) {
    SpawnResult result;

    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) < 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    // Closed by a successful exec; carries errno back otherwise
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    const char* cmd = command.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls until exec
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);

        // Ignored dispositions survive exec; give the command a clean slate
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        sigset_t mask;
        sigemptyset(&mask);
        sigprocmask(SIG_SETMASK, &mask, nullptr);

        execl("/bin/sh", "sh", "-c", cmd, static_cast<char*>(nullptr));

        int err = errno;
        ssize_t ignored = write(err_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    close(out_pipe[1]);
    close(err_pipe[1]);

    // Also set from this side so the group exists before we ever signal it
    setpgid(pid, pid);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        result.error = std::string("exec /bin/sh failed: ") + std::strerror(child_errno);
        int status = 0;
        waitpid(pid, &status, 0);
        close(out_pipe[0]);
        return result;
    }

    int flags = fcntl(out_pipe[0], F_GETFL, 0);
    if (flags >= 0) {
        fcntl(out_pipe[0], F_SETFL, flags | O_NONBLOCK);
    }

    result.process = std::make_unique<ManagedProcess>(Token{}, pid, out_pipe[0]);
    return result;
}

std::chrono::milliseconds ManagedProcess::uptime() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_);
}

bool ManagedProcess::has_exited() {
    if (exited_ || terminated_) return true;

    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
        // ECHILD: reaped behind our back, nothing left to wait for
        if (errno == ECHILD) exited_ = true;
        return exited_;
    }

    if (info.si_pid != pid_) return false;

    exited_ = true;
    if (info.si_code == CLD_EXITED) {
        exit_code_ = info.si_status;
    } else {
        exit_signal_ = info.si_status;
    }
    return true;
}

std::string ManagedProcess::describe_exit() const {
    if (!exited_) return "running";
    if (exit_signal_ != 0) return "signal " + std::to_string(exit_signal_);
    return "exit code " + std::to_string(exit_code_);
}

TerminationResult ManagedProcess::terminate(const ProcessTerminator& terminator) {
    if (terminated_) return termination_;

    termination_ = terminator.terminate(pid_);
    terminated_ = true;
    return termination_;
}
