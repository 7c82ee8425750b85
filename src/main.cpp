#include "common/types.hpp"
#include "policy/effect.hpp"
#include "policy/policy_loader.hpp"
#include "proxy/proxy_server.hpp"

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <string>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

// ---------------------------------------------------------------------------
// 진단 로거: stdout 은 MCP 프로토콜 채널이므로 stderr 로만 출력한다.
// ---------------------------------------------------------------------------
void init_logging(const std::string& level) {
    auto logger = spdlog::stderr_color_mt("mcp-fw");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    const auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("unknown log level '{}', using info", level);
        return;
    }
    spdlog::set_level(parsed);
}

// ---------------------------------------------------------------------------
// --check: 정책 검증 리포트 (백엔드 기동 없음)
// ---------------------------------------------------------------------------
int check_policy(const std::string& config_path, const std::string& server_name) {
    auto policy = PolicyLoader::load(config_path, server_name);
    if (!policy) {
        fmt::print(stderr, "policy check failed [{}]: {}\n",
                   policy_error_code_to_string(policy.error().code), policy.error().message);
        return kExitConfigError;
    }

    fmt::print(stderr, "server:            {}\n", policy->name);
    fmt::print(stderr, "command:           {} {}\n", policy->launch.command,
               fmt::join(policy->launch.args, " "));
    fmt::print(stderr, "allow:             {}\n", format_effects(policy->allow));
    fmt::print(stderr, "deny:              {}\n", format_effects(policy->deny));
    fmt::print(stderr, "effective allowed: {}\n",
               format_effects(compute_effective_allowed(*policy)));
    for (const auto& label : valid_effects()) {
        fmt::print(stderr, "  {:<5} {}\n", label,
                   is_effect_enabled(*policy, label) ? "enabled" : "disabled");
    }
    for (const auto& [tool, labels] : policy->tool_overrides) {
        fmt::print(stderr, "override:          {} -> [{}]\n", tool, fmt::join(labels, ", "));
    }
    return kExitOk;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── CLI 파싱 (CLI11, 환경변수 fallback) ─────────────────────────────
    CLI::App app{"mcp-fw: effect-based firewall for MCP servers", "mcp-fw"};
    app.set_version_flag("--version", std::string(kProxyVersion), "Display version information");

    ProxyConfig config;
    bool        verbose = false;
    bool        check   = false;

    app.add_option("-c,--config", config.policy_path, "Path to the policy file (YAML)")
        ->required()
        ->envname("MCP_FW_CONFIG");
    app.add_option("-s,--server", config.server_name, "Server entry to activate (servers.<name>)")
        ->required()
        ->envname("MCP_FW_SERVER");
    app.add_option("--audit-log", config.audit_log_path, "Write audit events to this file as well")
        ->envname("MCP_FW_AUDIT_LOG");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.add_flag("--check", check, "Validate the policy and print the effective allowed set");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int rc = app.exit(e);
        return rc == 0 ? kExitOk : kExitUsage;
    }

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    config.log_level = verbose ? "debug" : env_str("MCP_FW_LOG_LEVEL", "info");
    init_logging(config.log_level);

    if (check) {
        return check_policy(config.policy_path, config.server_name);
    }

    spdlog::info("Starting {} {}", kProxyName, kProxyVersion);
    spdlog::info("Policy: {} (server '{}')", config.policy_path, config.server_name);
    if (!config.audit_log_path.empty()) {
        spdlog::info("Audit log: {}", config.audit_log_path);
    }

    // ── ProxyServer 생성 및 실행 ────────────────────────────────────────
    boost::asio::io_context ioc;
    ProxyServer server{config};
    server.run(ioc);
    ioc.run();

    // ── 종료 처리 ───────────────────────────────────────────────────────
    spdlog::info("{} stopped (exit code {})", kProxyName, server.exit_code());

    return server.exit_code();
}
