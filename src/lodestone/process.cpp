#include "lodestone/process.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <queue>
#include <set>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

std::vector<pid_t> collect_process_tree(pid_t root_pid) {
    std::vector<pid_t> result;
    if (root_pid <= 0) {
        return result;
    }
    std::queue<pid_t> queue;
    std::set<pid_t> visited;
    queue.push(root_pid);
    visited.insert(root_pid);

    while (!queue.empty()) {
        pid_t current = queue.front();
        queue.pop();
        result.push_back(current);

        std::string children_path = "/proc/" + std::to_string(current) + "/task/" +
                                    std::to_string(current) + "/children";
        std::ifstream ifs(children_path);
        if (!ifs) {
            continue;
        }
        pid_t child = 0;
        while (ifs >> child) {
            if (child > 0 && visited.insert(child).second) {
                queue.push(child);
            }
        }
    }
    return result;
}

bool spawn_process(const std::vector<std::string>& args,
                   const std::string& cwd,
                   const std::string& log_path,
                   pid_t& out_pid,
                   std::string& error_message) {
    if (args.empty()) {
        error_message = "No command configured";
        return false;
    }
    int exec_pipe[2];
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        error_message = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }

    pid_t pid = fork();
    if (pid == -1) {
        error_message = std::string("fork failed: ") + std::strerror(errno);
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        return false;
    }

    if (pid == 0) {
        close(exec_pipe[0]);
        setsid();
        int child_errno = 0;
        if (chdir(cwd.c_str()) != 0) {
            child_errno = errno;
        } else {
            int log_fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
            int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
            if (log_fd >= 0) {
                dup2(log_fd, STDOUT_FILENO);
                dup2(log_fd, STDERR_FILENO);
            }
            if (null_fd >= 0) {
                dup2(null_fd, STDIN_FILENO);
            }
            std::vector<char*> argv;
            argv.reserve(args.size() + 1);
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);
            execvp(argv[0], argv.data());
            child_errno = errno;
        }
        ssize_t ignored = write(exec_pipe[1], &child_errno, sizeof(child_errno));
        (void)ignored;
        _exit(127);
    }

    close(exec_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    close(exec_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        error_message = "Failed to execute '" + args[0] + "': " + std::strerror(child_errno);
        return false;
    }
    out_pid = pid;
    return true;
}

bool process_alive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    int status = 0;
    pid_t reaped = waitpid(pid, &status, WNOHANG);
    if (reaped == pid) {
        return false;
    }
    if (reaped == 0) {
        return true;
    }
    return kill(pid, 0) == 0 || errno == EPERM;
}

bool terminate_process(pid_t pid, int timeout_sec, std::string& error_message) {
    if (!process_alive(pid)) {
        return true;
    }
    std::vector<pid_t> tree = collect_process_tree(pid);
    for (auto it = tree.rbegin(); it != tree.rend(); ++it) {
        if (kill(*it, SIGTERM) != 0 && errno != ESRCH) {
            error_message = "Failed to signal process " + std::to_string(*it) + ": " + std::strerror(errno);
            return false;
        }
    }
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_sec);
    while (std::chrono::steady_clock::now() < deadline) {
        if (!process_alive(pid)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    for (pid_t member : collect_process_tree(pid)) {
        kill(member, SIGKILL);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    if (process_alive(pid)) {
        error_message = "Process " + std::to_string(pid) + " did not exit after SIGKILL";
        return false;
    }
    return true;
}

bool process_start_time(pid_t pid, uint64_t& start_time) {
    if (pid <= 0) {
        return false;
    }
    std::ifstream ifs("/proc/" + std::to_string(pid) + "/stat");
    std::string stat;
    if (!ifs || !std::getline(ifs, stat)) {
        return false;
    }
    // The command name may contain spaces, so fields are counted after its closing paren.
    auto comm_end = stat.rfind(')');
    if (comm_end == std::string::npos) {
        return false;
    }
    std::istringstream fields(stat.substr(comm_end + 1));
    std::string field;
    for (int index = 3; index < 22; ++index) {
        if (!(fields >> field)) {
            return false;
        }
    }
    return static_cast<bool>(fields >> start_time);
}
