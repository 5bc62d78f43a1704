#include "net/ProcUtil.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace procutil {

ProcResult run_capture_stdout(const std::vector<std::string>& argv) {
    ProcResult res;
    if (argv.empty()) return res;

    int fds[2];
    if (pipe(fds) != 0) return res;

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close(fds[0]);
        close(fds[1]);
        return res;
    }

    if (pid == 0) {
        // child: stdout -> pipe, stderr -> /dev/null
        dup2(fds[1], STDOUT_FILENO);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        close(fds[0]);
        close(fds[1]);
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    close(fds[1]);

    res.output.reserve(8192);
    char buf[4096];
    while (true) {
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        res.output.append(buf, buf + n);
    }
    close(fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return res;
    }

    if (WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
    return res;
}

}  // namespace procutil
