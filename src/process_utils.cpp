#include "process_utils.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace procutil {

static std::atomic<pid_t> g_child{-1};
static std::atomic<int> g_pending_signal{0};

static void write_stderr(const char* a, const char* b) {
    // Only async-signal-safe calls between fork and exec.
    ssize_t rc = write(STDERR_FILENO, a, std::strlen(a));
    rc = write(STDERR_FILENO, b, std::strlen(b));
    rc = write(STDERR_FILENO, "\n", 1);
    (void)rc;
}

int run_process(const std::vector<std::string>& argv, const std::filesystem::path& cwd) {
    if (argv.empty())
        return -1;
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv)
        args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);
    std::string dir = cwd.string();

    pid_t pid = fork();
    if (pid < 0)
        return -1;
    if (pid == 0) {
        if (!dir.empty() && chdir(dir.c_str()) != 0) {
            write_stderr("deployloop: cannot enter ", dir.c_str());
            _exit(EXIT_EXEC_FAILED);
        }
        execvp(args[0], args.data());
        write_stderr("deployloop: cannot execute ", args[0]);
        _exit(EXIT_EXEC_FAILED);
    }

    g_child.store(pid);
    int pending = g_pending_signal.load();
    if (pending != 0)
        kill(pid, pending);

    int status = 0;
    pid_t rc;
    do {
        rc = waitpid(pid, &status, 0);
    } while (rc < 0 && errno == EINTR);
    g_child.store(-1);
    if (rc < 0)
        return -1;
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

void forward_signal_to_child(int sig, bool child_has_it) {
    g_pending_signal.store(sig);
    pid_t pid = g_child.load();
    if (pid > 0 && !child_has_it)
        kill(pid, sig);
}

void clear_forwarded_signal() { g_pending_signal.store(0); }

std::string format_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty())
            out += ' ';
        if (a.find_first_of(" \t\"'") != std::string::npos)
            out += '"' + a + '"';
        else
            out += a;
    }
    return out;
}

} // namespace procutil
