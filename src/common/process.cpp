#include "gateway_setup/common/process.hpp"
#include "gateway_setup/common/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gateway_setup {
namespace common {

static void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static bool writeAll(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

ProcessResult runProcess(const std::vector<std::string>& argv,
                         const std::string& stdin_data,
                         bool capture_output) {
    ProcessResult result;
    if (argv.empty()) {
        return result;
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};

    if (pipe(in_pipe) != 0 || pipe(out_pipe) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0) {
        Logger::instance().error("[Process] pipe failed | cmd={} | error={}", argv[0], strerror(errno));
        closeFd(in_pipe[0]); closeFd(in_pipe[1]);
        closeFd(out_pipe[0]); closeFd(out_pipe[1]);
        closeFd(err_pipe[0]); closeFd(err_pipe[1]);
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();

    if (pid < 0) {
        Logger::instance().error("[Process] fork failed | cmd={} | error={}", argv[0], strerror(errno));
        closeFd(in_pipe[0]); closeFd(in_pipe[1]);
        closeFd(out_pipe[0]); closeFd(out_pipe[1]);
        closeFd(err_pipe[0]); closeFd(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        dup2(in_pipe[0], STDIN_FILENO);
        int devnull = open("/dev/null", O_WRONLY);
        if (capture_output) {
            dup2(out_pipe[1], STDOUT_FILENO);
        } else if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
        }
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        close(in_pipe[0]); close(in_pipe[1]);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]);

        execvp(args[0], args.data());

        int exec_errno = errno;
        ssize_t ignored = write(err_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    closeFd(in_pipe[0]);
    closeFd(out_pipe[1]);
    closeFd(err_pipe[1]);

    if (!stdin_data.empty() && !writeAll(in_pipe[1], stdin_data)) {
        Logger::instance().debug("[Process] stdin write failed | cmd={} | error={}", argv[0], strerror(errno));
    }
    closeFd(in_pipe[1]);

    char buffer[4096];
    ssize_t n;
    while ((n = read(out_pipe[0], buffer, sizeof(buffer))) != 0) {
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        result.output.append(buffer, static_cast<size_t>(n));
    }
    closeFd(out_pipe[0]);

    int exec_errno = 0;
    ssize_t err_read;
    do {
        err_read = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (err_read < 0 && errno == EINTR);
    closeFd(err_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            Logger::instance().error("[Process] waitpid failed | cmd={} | error={}", argv[0], strerror(errno));
            return result;
        }
    }

    if (err_read == static_cast<ssize_t>(sizeof(exec_errno))) {
        Logger::instance().debug("[Process] exec failed | cmd={} | error={}", argv[0], strerror(exec_errno));
        return result;
    }

    result.launched = true;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    Logger::instance().debug("[Process] Finished | cmd={} | exit={}", argv[0], result.exit_code);
    return result;
}

}}
