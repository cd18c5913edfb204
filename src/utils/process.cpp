#include "certresolver/utils/process.hpp"
#include "certresolver/utils/logger.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace certresolver {
namespace utils {

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// 写入全部数据；对端提前关闭时返回 false
bool writeAll(int fd, const std::string& data) {
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

} // namespace

Result<ProcessResult> RunProcess(const std::vector<std::string>& args,
                                 const std::string& input,
                                 const std::string& workingDir) {
    if (args.empty()) {
        return Error("No command specified");
    }

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (pipe(inPipe) != 0 || pipe(outPipe) != 0 || pipe(errPipe) != 0) {
        std::string reason = std::strerror(errno);
        for (int* p : {inPipe, outPipe, errPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
        return Error("Failed to create pipes: " + reason);
    }

    // execvp 需要以 nullptr 结尾的 char* 数组
    std::vector<char*> argv;
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        std::string reason = std::strerror(errno);
        for (int* p : {inPipe, outPipe, errPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
        return Error("Failed to fork: " + reason);
    }

    if (pid == 0) {
        // 子进程
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        close(inPipe[0]);
        close(inPipe[1]);
        close(outPipe[0]);
        close(outPipe[1]);
        close(errPipe[0]);
        close(errPipe[1]);
        if (!workingDir.empty() && chdir(workingDir.c_str()) != 0) {
            _exit(126);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    // 子进程不读 stdin 时避免 SIGPIPE 终止本进程
    struct sigaction ignore = {};
    struct sigaction previous = {};
    ignore.sa_handler = SIG_IGN;
    sigaction(SIGPIPE, &ignore, &previous);
    if (!input.empty() && !writeAll(inPipe[1], input)) {
        GetLogger().Debug("Child process closed stdin early", LogContext().With("command", args[0]));
    }
    sigaction(SIGPIPE, &previous, nullptr);
    closeFd(inPipe[1]);

    ProcessResult result;
    std::array<char, 4096> buffer;
    struct pollfd fds[2];
    fds[0] = {outPipe[0], POLLIN, 0};
    fds[1] = {errPipe[0], POLLIN, 0};
    int openCount = 2;

    while (openCount > 0) {
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                (i == 0 ? result.output : result.errorOutput).append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --openCount;
            }
        }
    }
    // fds 持有读端的所有权
    for (auto& fd : fds) {
        if (fd.fd >= 0) close(fd.fd);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Error("Failed to wait for " + args[0] + ": " + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        result.exitCode = -1;
    }

    if (result.exitCode == 127) {
        return Error("Failed to execute " + args[0]);
    }

    return result;
}

} // namespace utils
} // namespace certresolver
