#include "execution/process_runner.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace CIP {
namespace Execution {

namespace {

constexpr int POLL_INTERVAL_MS = 50;
constexpr size_t READ_BUFFER_SIZE = 4096;

// EN: How long to keep draining pipes held open by orphaned grandchildren once the shell has exited
// FR: Durée de vidage des pipes gardés ouverts par des petits-enfants orphelins après la sortie du shell
constexpr std::chrono::milliseconds ORPHAN_DRAIN{200};

void closeFd(int& fd) {
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}

// EN: Null-terminated argv/envp views over owned strings, built before fork()
// FR: Vues argv/envp terminées par null sur des chaînes possédées, construites avant fork()
std::vector<char*> toArgv(std::vector<std::string>& strings) {
    std::vector<char*> argv;
    argv.reserve(strings.size() + 1);
    for (auto& s : strings) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);
    return argv;
}

void writeAll(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t n = write(fd, data, size);
        if (n <= 0) {
            if (n == -1 && errno == EINTR) continue;
            return;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
}

} // namespace

ProcessRunner::ProcessRunner(std::chrono::milliseconds grace_period)
    : grace_period_(grace_period) {}

std::string ProcessRunner::resolveExecutable(const std::string& program,
                                             const std::vector<std::string>& environment) {
    if (program.find('/') != std::string::npos) {
        return program;
    }

    std::string path_value;
    for (const auto& entry : environment) {
        if (entry.rfind("PATH=", 0) == 0) {
            path_value = entry.substr(5);
        }
    }
    if (path_value.empty()) {
        path_value = "/usr/local/bin:/usr/bin:/bin";
    }

    size_t start = 0;
    while (start <= path_value.size()) {
        size_t end = path_value.find(':', start);
        if (end == std::string::npos) end = path_value.size();
        std::string dir = path_value.substr(start, end - start);
        if (dir.empty()) dir = ".";

        std::string candidate = dir + "/" + program;
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return "";
}

ProcessResult ProcessRunner::run(const ProcessRequest& request, const CancellationToken* token) const {
    ProcessResult result;
    auto started = std::chrono::steady_clock::now();

    if (token && token->isCancelled()) {
        result.cancelled = true;
        result.exit_code = 128 + SIGTERM;
        return result;
    }

    std::string shell_path = resolveExecutable(request.shell, request.environment);
    if (shell_path.empty()) {
        // EN: Same status a shell reports for "command not found"
        // FR: Même statut qu'un shell pour "command not found"
        result.exit_code = 127;
        result.stderr_data = "cipipe: shell not found: " + request.shell + "\n";
        return result;
    }

    std::vector<std::string> arg_strings = {request.shell, "-e", "-c", request.command};
    std::vector<std::string> env_strings = request.environment;
    std::vector<char*> argv = toArgv(arg_strings);
    std::vector<char*> envp = toArgv(env_strings);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(out_pipe) == -1) {
        throw std::runtime_error("pipe() failed: " + std::string(std::strerror(errno)));
    }
    if (pipe(err_pipe) == -1) {
        int saved = errno;
        closeFd(out_pipe[0]);
        closeFd(out_pipe[1]);
        throw std::runtime_error("pipe() failed: " + std::string(std::strerror(saved)));
    }
    for (int fd : {out_pipe[0], err_pipe[0]}) {
        int flags = fcntl(fd, F_GETFD, 0);
        if (flags != -1) fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }

    pid_t pid = fork();
    if (pid == -1) {
        int saved = errno;
        closeFd(out_pipe[0]);
        closeFd(out_pipe[1]);
        closeFd(err_pipe[0]);
        closeFd(err_pipe[1]);
        throw std::runtime_error("fork() failed: " + std::string(std::strerror(saved)));
    }

    if (pid == 0) {
        // EN: Child: only async-signal-safe calls until execve
        // FR: Enfant : uniquement des appels async-signal-safe jusqu'à execve
        setpgid(0, 0);

        struct sigaction dfl;
        std::memset(&dfl, 0, sizeof(dfl));
        dfl.sa_handler = SIG_DFL;
        sigaction(SIGINT, &dfl, nullptr);
        sigaction(SIGTERM, &dfl, nullptr);
        sigaction(SIGPIPE, &dfl, nullptr);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull != -1) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);

        if (!request.working_directory.empty() && chdir(request.working_directory.c_str()) != 0) {
            static const char msg[] = "cipipe: cannot enter working directory\n";
            writeAll(STDERR_FILENO, msg, sizeof(msg) - 1);
            _exit(126);
        }

        execve(shell_path.c_str(), argv.data(), envp.data());
        static const char msg[] = "cipipe: failed to execute shell\n";
        writeAll(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(127);
    }

    // EN: Parent also sets the group to close the race with the child's setpgid
    // FR: Le parent fixe aussi le groupe pour fermer la course avec le setpgid de l'enfant
    setpgid(pid, pid);
    closeFd(out_pipe[1]);
    closeFd(err_pipe[1]);

    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];

    bool reaped = false;
    int status = 0;
    bool term_sent = false;
    bool kill_sent = false;
    std::chrono::steady_clock::time_point kill_deadline;
    std::chrono::steady_clock::time_point drain_deadline;
    char buffer[READ_BUFFER_SIZE];

    auto readInto = [&](int& fd, OutputStream stream, std::string& sink) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            std::string chunk(buffer, static_cast<size_t>(n));
            sink += chunk;
            if (output_callback_) {
                output_callback_(stream, chunk);
            }
        } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
            closeFd(fd);
        }
    };

    while (!reaped || out_fd != -1 || err_fd != -1) {
        if (out_fd != -1 || err_fd != -1) {
            struct pollfd fds[2];
            nfds_t count = 0;
            if (out_fd != -1) fds[count++] = {out_fd, POLLIN, 0};
            if (err_fd != -1) fds[count++] = {err_fd, POLLIN, 0};

            int ready = poll(fds, count, POLL_INTERVAL_MS);
            if (ready == -1 && errno != EINTR) {
                LOG_ERROR("process", "poll() failed: " + std::string(std::strerror(errno)));
                closeFd(out_fd);
                closeFd(err_fd);
            } else if (ready > 0) {
                for (nfds_t i = 0; i < count; ++i) {
                    if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                        if (fds[i].fd == out_fd) {
                            readInto(out_fd, OutputStream::STDOUT, result.stdout_data);
                        } else if (fds[i].fd == err_fd) {
                            readInto(err_fd, OutputStream::STDERR, result.stderr_data);
                        }
                    }
                }
            }
        } else {
            usleep(POLL_INTERVAL_MS * 1000);
        }

        if (!reaped) {
            pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                reaped = true;
                drain_deadline = std::chrono::steady_clock::now() + ORPHAN_DRAIN;
            } else if (waited == -1 && errno != EINTR) {
                LOG_ERROR("process", "waitpid() failed: " + std::string(std::strerror(errno)));
                reaped = true;
                status = 0;
                drain_deadline = std::chrono::steady_clock::now() + ORPHAN_DRAIN;
            }
        }

        auto now = std::chrono::steady_clock::now();

        if (token && token->isCancelled() && !term_sent) {
            result.cancelled = true;
            term_sent = true;
            kill_deadline = now + grace_period_;
            LOG_DEBUG("process", "Sending SIGTERM to process group " + std::to_string(pid));
            kill(-pid, SIGTERM);
        }

        if (term_sent && !kill_sent && now >= kill_deadline) {
            kill_sent = true;
            LOG_WARN("process", "Grace period expired, sending SIGKILL to process group " + std::to_string(pid));
            kill(-pid, SIGKILL);
        }

        if (reaped && (out_fd != -1 || err_fd != -1) && now >= drain_deadline) {
            // EN: Background processes still hold the pipes; the step is over, so take the group down
            // FR: Des processus en arrière-plan tiennent encore les pipes ; l'étape est finie, on abat le groupe
            kill(-pid, SIGKILL);
            closeFd(out_fd);
            closeFd(err_fd);
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
    if (result.cancelled && result.exit_code == 0) {
        result.exit_code = 128 + SIGTERM;
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return result;
}

} // namespace Execution
} // namespace CIP
