/**
 * @file command_runner.cpp
 * @brief Запуск внешних утилит через fork/execvp
 */

#include "command_runner.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string_view>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hostdiag::core {

namespace {

/// Дескрипторы pipe, закрываемые автоматически
class Pipe {
public:
    Pipe() {
        if (::pipe2(fds_.data(), O_CLOEXEC) != 0) {
            throw CommandError(std::string("pipe() failed: ") + std::strerror(errno));
        }
    }

    ~Pipe() {
        closeRead();
        closeWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int readEnd() const noexcept { return fds_[0]; }
    int writeEnd() const noexcept { return fds_[1]; }

    void closeRead() noexcept {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void closeWrite() noexcept {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    std::array<int, 2> fds_{-1, -1};
};

/// Прочитать доступные данные; false при EOF/ошибке
bool drain(int fd, std::string& sink) {
    std::array<char, 4096> buffer{};
    ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n > 0) {
        sink.append(buffer.data(), static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

/// Шаг опроса: как часто проверяется завершение дочернего процесса
constexpr std::chrono::milliseconds kPollSlice{50};

/// SIGKILL всей группе команды; после reap лидера pid группы ещё занят её участниками
void killGroup(pid_t pid) noexcept {
    ::kill(-pid, SIGKILL);
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

[[noreturn]] void execChild(const CommandSpec& spec, int out_fd, int err_fd, int status_fd) {
    // Своя группа процессов: по таймауту убиваются и порождённые утилитой процессы
    ::setpgid(0, 0);

    if (::dup2(out_fd, STDOUT_FILENO) < 0 || ::dup2(err_fd, STDERR_FILENO) < 0) {
        _exit(kExitNotFound);
    }

    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::close(devnull);
    }

    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    ::execvp(argv[0], argv.data());

    // Сообщить родителю, что запуск не удался (pipe закрывается при успешном exec)
    int code = errno;
    ssize_t written = ::write(status_fd, &code, sizeof(code));
    (void)written;
    _exit(kExitNotFound);
}

} // namespace

CommandResult SystemCommandRunner::run(const CommandSpec& spec) {
    CommandResult result;
    if (spec.argv.empty()) {
        result.err = "empty command";
        return result;
    }

    Pipe out_pipe;
    Pipe err_pipe;
    Pipe status_pipe;

    pid_t pid = ::fork();
    if (pid < 0) {
        throw CommandError(std::string("fork() failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        execChild(spec, out_pipe.writeEnd(), err_pipe.writeEnd(), status_pipe.writeEnd());
    }
    // Дублируем setpgid в родителе, чтобы группа существовала до первого kill
    ::setpgid(pid, pid);

    out_pipe.closeWrite();
    err_pipe.closeWrite();
    status_pipe.closeWrite();

    int exec_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(status_pipe.readEnd(), &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    result.launched = (got == 0);

    auto deadline = std::chrono::steady_clock::now() + spec.timeout;
    std::array<pollfd, 2> fds{{
        {out_pipe.readEnd(), POLLIN, 0},
        {err_pipe.readEnd(), POLLIN, 0}
    }};
    bool out_open = true;
    bool err_open = true;
    bool exited = false;
    int status = 0;

    // Ждём и EOF на обоих pipe, и завершения процесса; оба ожидания под одним сроком
    while (true) {
        if (!exited) {
            pid_t waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                exited = true;
            } else if (waited < 0 && errno != EINTR) {
                killGroup(pid);
                throw CommandError(std::string("waitpid() failed: ") + std::strerror(errno));
            }
        }
        if (exited && !out_open && !err_open) {
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = !exited;
            break;
        }

        fds[0].fd = out_open ? out_pipe.readEnd() : -1;
        fds[1].fd = err_open ? err_pipe.readEnd() : -1;
        auto slice = std::min(remaining, kPollSlice);
        int ready = ::poll(fds.data(), fds.size(), static_cast<int>(slice.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            killGroup(pid);
            break;
        }
        if (ready == 0) {
            // Процесс завершился, а pipe держат его фоновые потомки: вывод уже прочитан
            if (exited) {
                break;
            }
            continue;
        }

        if (out_open && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            out_open = drain(out_pipe.readEnd(), result.out);
        }
        if (err_open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
            err_open = drain(err_pipe.readEnd(), result.err);
        }
    }

    // Оставшиеся процессы группы (зависший процесс или фоновые потомки) не переживают команду
    killGroup(pid);

    if (!exited) {
        pid_t waited = 0;
        do {
            waited = ::waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);

        if (waited < 0) {
            throw CommandError(std::string("waitpid() failed: ") + std::strerror(errno));
        }
    }

    if (!result.launched) {
        result.exit_code = kExitNotFound;
        if (result.err.empty()) {
            result.err = spec.argv.front() + ": " + std::strerror(exec_errno);
        }
        return result;
    }

    result.exit_code = decodeStatus(status);
    if (result.timed_out && result.err.empty()) {
        result.err = spec.argv.front() + ": timed out after "
            + std::to_string(spec.timeout.count()) + " ms";
    }
    return result;
}

bool SystemCommandRunner::isAvailable(const std::string& tool) const {
    if (tool.empty()) {
        return false;
    }
    if (tool.find('/') != std::string::npos) {
        return ::access(tool.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    std::string_view path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin:/usr/sbin:/sbin";

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        std::string_view dir = path.substr(start, end - start);
        std::filesystem::path candidate = dir.empty() ? std::filesystem::path(".") : std::filesystem::path(dir);
        candidate /= tool;

        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

} // namespace hostdiag::core
