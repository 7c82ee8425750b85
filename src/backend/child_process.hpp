#pragma once

// ---------------------------------------------------------------------------
// child_process.hpp
//
// 백엔드 MCP 서버 자식 프로세스 (fork/execvp + stdin/stdout 파이프).
//
// [설계 원칙]
// - spawn() 실패는 std::unexpected(error_message) 로 반환한다.
//   exec 실패(명령 없음, 권한 없음)도 close-on-exec 상태 파이프로 감지하여
//   spawn() 단계에서 실패로 보고한다 (BackendUnavailable).
// - stderr 는 상속한다. 백엔드 진단 메시지는 운영자의 stderr 로 간다.
// - 환경 = 부모 환경 + LaunchSpec::env 덮어쓰기.
// - 소멸자는 아직 살아 있는 자식을 종료하고 회수(reap)한다. 좀비를 남기지
//   않는 것이 모든 종료 경로(정상 종료, 핸드셰이크 실패, 백엔드 크래시)에서
//   보장된다.
//
// [파이프 소유권]
// take_stdin_fd() / take_stdout_fd() 는 디스크립터 소유권을 호출자에게
// 넘긴다 (이후 ChildProcess 는 해당 fd 를 닫지 않는다). StdioBackend 가
// stream_descriptor 로 감싸 JsonChannel 에 넘긴다.
// ---------------------------------------------------------------------------

#include <sys/types.h>

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>

#include "policy/rule.hpp"  // LaunchSpec

// ---------------------------------------------------------------------------
// ShutdownTimeouts
//   exit_wait : stdin EOF 이후 자발적 종료를 기다리는 시간
//   term_wait : SIGTERM 이후 SIGKILL 까지의 유예 시간
// ---------------------------------------------------------------------------
struct ShutdownTimeouts {
    std::chrono::milliseconds exit_wait{500};
    std::chrono::milliseconds term_wait{2000};
};

class ChildProcess {
    // spawn() 만 생성할 수 있도록 하는 생성자 태그
    struct SpawnedTag {
        explicit SpawnedTag() = default;
    };

public:
    [[nodiscard]] static std::expected<std::unique_ptr<ChildProcess>, std::string>
    spawn(const LaunchSpec& spec);

    ChildProcess(SpawnedTag, pid_t pid, int stdin_fd, int stdout_fd) noexcept;
    ~ChildProcess();

    ChildProcess(const ChildProcess&)            = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&)                 = delete;
    ChildProcess& operator=(ChildProcess&&)      = delete;

    // 자식 stdin 으로 쓰는 쪽 (소유권 이전, 두 번째 호출은 -1)
    [[nodiscard]] int take_stdin_fd() noexcept;
    // 자식 stdout 을 읽는 쪽 (소유권 이전, 두 번째 호출은 -1)
    [[nodiscard]] int take_stdout_fd() noexcept;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    // try_wait
    //   종료했으면 종료 상태 (정상: exit code, 시그널: 128 + signo),
    //   아직 실행 중이면 nullopt. 회수는 한 번만 일어난다.
    [[nodiscard]] std::optional<int> try_wait();

    // terminate
    //   exit_wait 동안 자발적 종료 대기 → SIGTERM → term_wait 대기 →
    //   SIGKILL 후 블로킹 회수. 종료 상태를 반환한다.
    //   호출 전에 stdin 파이프를 닫아 두어야 자발적 종료가 가능하다.
    int terminate(const ShutdownTimeouts& timeouts = {});

    [[nodiscard]] bool reaped() const noexcept { return exit_status_.has_value(); }

private:
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);

    pid_t              pid_;
    int                stdin_fd_;
    int                stdout_fd_;
    std::optional<int> exit_status_{};
};
