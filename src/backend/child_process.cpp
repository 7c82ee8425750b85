// ---------------------------------------------------------------------------
// child_process.cpp
//
// spawn() 흐름:
//   1. argv / envp 를 fork 이전에 모두 구성한다 (fork 이후 자식에서는
//      async-signal-safe 호출만 사용: dup2, signal, execvpe, write, _exit).
//   2. pipe2(O_CLOEXEC) 로 stdin / stdout / 상태 파이프 생성.
//      dup2 로 0/1 에 복제된 fd 는 CLOEXEC 가 해제되어 exec 후에도 남는다.
//   3. 자식: SIGPIPE 를 기본 동작으로 되돌린 뒤 (부모는 무시 상태) exec.
//      실패하면 errno 를 상태 파이프에 쓰고 _exit(127).
//   4. 부모: 상태 파이프 read → 0 바이트면 exec 성공 (CLOEXEC 로 닫힘).
// ---------------------------------------------------------------------------

#include "backend/child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

extern char** environ;

namespace {

// 파이프 한 쌍. 소멸 시 남은 fd 를 닫는다.
struct Pipe {
    int fds[2]{-1, -1};

    Pipe() = default;
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&)            = delete;
    Pipe& operator=(const Pipe&) = delete;

    [[nodiscard]] bool open() { return ::pipe2(fds, O_CLOEXEC) == 0; }

    [[nodiscard]] int read_end() const noexcept { return fds[0]; }
    [[nodiscard]] int write_end() const noexcept { return fds[1]; }

    int release_read() noexcept { const int fd = fds[0]; fds[0] = -1; return fd; }
    int release_write() noexcept { const int fd = fds[1]; fds[1] = -1; return fd; }

    void close_read() noexcept {
        if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; }
    }
    void close_write() noexcept {
        if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; }
    }
};

[[nodiscard]] int decode_status(int status) noexcept {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// 부모 환경 + 덮어쓰기. 덮어쓰는 키는 부모 항목을 제거한 뒤 뒤에 추가한다.
[[nodiscard]] std::vector<std::string> build_environment(const LaunchSpec& spec) {
    std::vector<std::string> env;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        const std::string entry{*e};
        const auto eq = entry.find('=');
        const std::string key = entry.substr(0, eq);
        if (spec.env && spec.env->contains(key)) {
            continue;
        }
        env.push_back(entry);
    }
    if (spec.env) {
        for (const auto& [key, value] : *spec.env) {
            env.push_back(key + "=" + value);
        }
    }
    return env;
}

[[nodiscard]] std::vector<char*> to_pointer_array(std::vector<std::string>& strings) {
    std::vector<char*> ptrs;
    ptrs.reserve(strings.size() + 1);
    for (auto& s : strings) {
        ptrs.push_back(s.data());
    }
    ptrs.push_back(nullptr);
    return ptrs;
}

}  // namespace

std::expected<std::unique_ptr<ChildProcess>, std::string>
ChildProcess::spawn(const LaunchSpec& spec) {
    // 1. argv / envp
    std::vector<std::string> argv_storage;
    argv_storage.reserve(spec.args.size() + 1);
    argv_storage.push_back(spec.command);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv = to_pointer_array(argv_storage);

    std::vector<std::string> env_storage = build_environment(spec);
    std::vector<char*> envp = to_pointer_array(env_storage);

    // 2. 파이프
    Pipe stdin_pipe;
    Pipe stdout_pipe;
    Pipe status_pipe;
    if (!stdin_pipe.open() || !stdout_pipe.open() || !status_pipe.open()) {
        return std::unexpected(fmt::format(
            "failed to create pipes for '{}': {}", spec.command, std::strerror(errno)));
    }

    // 3. fork
    const pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(fmt::format(
            "failed to fork for '{}': {}", spec.command, std::strerror(errno)));
    }

    if (pid == 0) {
        // 자식 프로세스
        if (::dup2(stdin_pipe.read_end(), STDIN_FILENO) < 0 ||
            ::dup2(stdout_pipe.write_end(), STDOUT_FILENO) < 0) {
            const int err = errno;
            (void)!::write(status_pipe.write_end(), &err, sizeof(err));
            ::_exit(127);
        }
        ::signal(SIGPIPE, SIG_DFL);
        ::execvpe(argv[0], argv.data(), envp.data());

        const int err = errno;
        (void)!::write(status_pipe.write_end(), &err, sizeof(err));
        ::_exit(127);
    }

    // 4. 부모: 자식 쪽 끝 닫기 + exec 결과 확인
    stdin_pipe.close_read();
    stdout_pipe.close_write();
    status_pipe.close_write();

    int     child_errno = 0;
    ssize_t n           = 0;
    do {
        n = ::read(status_pipe.read_end(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return std::unexpected(fmt::format(
            "failed to launch '{}': {}", spec.command, std::strerror(child_errno)));
    }

    spdlog::info("[backend] launched '{}' (pid {})", spec.command, pid);
    return std::make_unique<ChildProcess>(
        SpawnedTag{}, pid, stdin_pipe.release_write(), stdout_pipe.release_read());
}

ChildProcess::ChildProcess(SpawnedTag, pid_t pid, int stdin_fd, int stdout_fd) noexcept
    : pid_{pid}
    , stdin_fd_{stdin_fd}
    , stdout_fd_{stdout_fd}
{}

ChildProcess::~ChildProcess() {
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
    }
    if (stdout_fd_ >= 0) {
        ::close(stdout_fd_);
    }
    if (!reaped()) {
        terminate();
    }
}

int ChildProcess::take_stdin_fd() noexcept {
    const int fd = stdin_fd_;
    stdin_fd_    = -1;
    return fd;
}

int ChildProcess::take_stdout_fd() noexcept {
    const int fd = stdout_fd_;
    stdout_fd_   = -1;
    return fd;
}

std::optional<int> ChildProcess::try_wait() {
    if (exit_status_) {
        return exit_status_;
    }
    int status = 0;
    pid_t result = 0;
    do {
        result = ::waitpid(pid_, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        exit_status_ = decode_status(status);
        spdlog::info("[backend] pid {} exited with status {}", pid_, *exit_status_);
        return exit_status_;
    }
    if (result < 0) {
        // ECHILD: 이미 다른 경로로 회수됨. 더 기다릴 대상이 없다.
        spdlog::warn("[backend] waitpid({}) failed: {}", pid_, std::strerror(errno));
        exit_status_ = -1;
        return exit_status_;
    }
    return std::nullopt;
}

bool ChildProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    constexpr auto kPollInterval = std::chrono::milliseconds{10};
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!try_wait()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    return true;
}

int ChildProcess::terminate(const ShutdownTimeouts& timeouts) {
    if (wait_for_exit(timeouts.exit_wait)) {
        return *exit_status_;
    }

    spdlog::info("[backend] pid {} still running, sending SIGTERM", pid_);
    ::kill(pid_, SIGTERM);
    if (wait_for_exit(timeouts.term_wait)) {
        return *exit_status_;
    }

    spdlog::warn("[backend] pid {} ignored SIGTERM, sending SIGKILL", pid_);
    ::kill(pid_, SIGKILL);
    int status = 0;
    pid_t result = 0;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);
    exit_status_ = (result == pid_) ? decode_status(status) : -1;
    return *exit_status_;
}
