#include "ProcessRunner.hpp"
#include "WorkerPool.hpp"
#include "Logger.hpp"
#include "TextUtils.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Every pipe end is close-on-exec, so children forked by other threads never inherit
// a write end and hold a reader's EOF hostage. dup2 onto stdio clears the flag.
bool makePipe(int fds[2]) {
#ifdef __linux__
    return pipe2(fds, O_CLOEXEC) == 0;
#else
    if (pipe(fds) != 0) {
        return false;
    }
    if (fcntl(fds[0], F_SETFD, FD_CLOEXEC) != 0 || fcntl(fds[1], F_SETFD, FD_CLOEXEC) != 0) {
        int saved = errno;
        close(fds[0]);
        close(fds[1]);
        fds[0] = fds[1] = -1;
        errno = saved;
        return false;
    }
    return true;
#endif
}

// argv must be built before fork(): the child may only make async-signal-safe calls.
std::vector<char*> buildArgv(const std::string& path, const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(path.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

// Reads the errno the child reports when execv fails; 0 when exec succeeded.
int readExecError(int fd) {
    int childErrno = 0;
    ssize_t n;
    do {
        n = read(fd, &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(childErrno)) ? childErrno : 0;
}

int waitForChild(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Drains both pipes until EOF on each without letting either fill up.
void drainPipes(int outFd, int errFd, std::string& output, std::string& error) {
    struct pollfd fds[2];
    fds[0].fd = outFd;
    fds[0].events = POLLIN;
    fds[1].fd = errFd;
    fds[1].events = POLLIN;
    std::string* sinks[2] = {&output, &error};
    int openCount = 2;
    char buffer[4096];

    while (openCount > 0) {
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --openCount;
            }
        }
    }
}

} // namespace

ProcessResult ProcessResult::completed(int exitCode, const std::string& output, const std::string& error) {
    ProcessResult result;
    result.exitCode = exitCode;
    result.success = exitCode == 0;
    result.output = output;
    result.error = error;
    result.failure = result.success ? ProcessFailure::NONE : ProcessFailure::EXIT_FAILED;
    return result;
}

ProcessResult ProcessResult::launchFailed(const std::string& error) {
    ProcessResult result;
    result.success = false;
    result.exitCode = -1;
    result.error = error;
    result.failure = ProcessFailure::LAUNCH_FAILED;
    return result;
}

ProcessResult ProcessRunner::run(const std::string& path, const std::vector<std::string>& args) {
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};

    if (!makePipe(outPipe) || !makePipe(errPipe) || !makePipe(execPipe)) {
        std::string reason = std::strerror(errno);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        closeFd(execPipe[0]); closeFd(execPipe[1]);
        LOG_ERROR("Failed to create pipes for " + path + ": " + reason);
        return ProcessResult::launchFailed(reason);
    }

    std::vector<char*> argv = buildArgv(path, args);

    pid_t pid = fork();
    if (pid < 0) {
        std::string reason = std::strerror(errno);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        closeFd(execPipe[0]); closeFd(execPipe[1]);
        LOG_ERROR("fork failed for " + path + ": " + reason);
        return ProcessResult::launchFailed(reason);
    }

    if (pid == 0) {
        int devNull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        close(outPipe[0]); close(outPipe[1]);
        close(errPipe[0]); close(errPipe[1]);
        close(execPipe[0]);

        execv(path.c_str(), argv.data());

        int execErrno = errno;
        ssize_t ignored = write(execPipe[1], &execErrno, sizeof(execErrno));
        (void)ignored;
        _exit(127);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    int execErrno = readExecError(execPipe[0]);
    closeFd(execPipe[0]);

    if (execErrno != 0) {
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        waitForChild(pid);
        std::string reason = std::strerror(execErrno);
        LOG_DEBUG("Failed to launch " + path + ": " + reason);
        return ProcessResult::launchFailed(reason);
    }

    std::string output;
    std::string error;
    drainPipes(outPipe[0], errPipe[0], output, error);
    closeFd(outPipe[0]);
    closeFd(errPipe[0]);

    int exitCode = waitForChild(pid);
    LOG_DEBUG(describe(path, args) + " exited with " + std::to_string(exitCode));
    return ProcessResult::completed(exitCode, output, error);
}

bool ProcessRunner::spawnDetached(const std::string& path, const std::vector<std::string>& args) {
    int execPipe[2] = {-1, -1};
    if (!makePipe(execPipe)) {
        LOG_ERROR("Failed to create pipe for " + path + ": " + std::string(std::strerror(errno)));
        return false;
    }

    std::vector<char*> argv = buildArgv(path, args);

    pid_t pid = fork();
    if (pid < 0) {
        LOG_ERROR("fork failed for " + path + ": " + std::string(std::strerror(errno)));
        closeFd(execPipe[0]);
        closeFd(execPipe[1]);
        return false;
    }

    if (pid == 0) {
        // Intermediate child: new session, then hand the process over to init
        setsid();
        signal(SIGHUP, SIG_IGN);
        pid_t grandchild = fork();
        if (grandchild != 0) {
            _exit(grandchild < 0 ? 1 : 0);
        }

        int devNull = open("/dev/null", O_RDWR);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            dup2(devNull, STDOUT_FILENO);
            dup2(devNull, STDERR_FILENO);
            if (devNull > STDERR_FILENO) close(devNull);
        }
        close(execPipe[0]);

        execv(path.c_str(), argv.data());

        int execErrno = errno;
        ssize_t ignored = write(execPipe[1], &execErrno, sizeof(execErrno));
        (void)ignored;
        _exit(127);
    }

    closeFd(execPipe[1]);
    int intermediateStatus = waitForChild(pid);
    int execErrno = readExecError(execPipe[0]);
    closeFd(execPipe[0]);

    if (intermediateStatus != 0) {
        LOG_ERROR("Failed to detach " + path);
        return false;
    }
    if (execErrno != 0) {
        LOG_ERROR("Failed to launch " + path + ": " + std::string(std::strerror(execErrno)));
        return false;
    }

    LOG_INFO("Spawned detached process: " + describe(path, args));
    return true;
}

void ProcessRunner::runAsync(WorkerPool& pool, const std::string& path,
                             const std::vector<std::string>& args, ProcessCompletion completion) {
    bool queued = pool.submit([this, path, args, completion]() {
        ProcessResult result = run(path, args);
        if (completion) {
            completion(result);
        }
    });
    if (!queued && completion) {
        completion(ProcessResult::launchFailed("worker pool stopped"));
    }
}

std::string ProcessRunner::describe(const std::string& path, const std::vector<std::string>& args) {
    std::vector<std::string> parts;
    parts.reserve(args.size() + 1);
    parts.push_back(path);
    parts.insert(parts.end(), args.begin(), args.end());
    return TextUtils::join(parts, " ");
}
