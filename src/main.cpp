#include "config/options_loader.hpp"
#include "equivalency/equivalency_defaults.hpp"
#include "logger/structured_logger.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
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

// 알 수 없는 값은 경고 후 info.
LogLevel resolve_log_level(const std::string& level) {
    if (const auto parsed = parse_log_level(level)) {
        return *parsed;
    }
    spdlog::warn("unknown log level '{}', using info", level);
    return LogLevel::kInfo;
}

PolicyLog make_policy_log(const EquivalencyPolicy& policy, const std::string& source) {
    PolicyLog entry{};
    entry.source                   = source;
    entry.is_recursive             = policy.is_recursive();
    entry.allow_infinite_recursion = policy.allow_infinite_recursion();
    entry.ignore_cyclic_references =
        policy.cyclic_reference_handling() == CyclicReferenceHandling::kIgnore;
    entry.enums_by_name =
        policy.enum_equivalency_handling() == EnumEquivalencyHandling::kByName;
    entry.use_runtime_typing = policy.use_runtime_typing();
    entry.include_properties = policy.include_properties();
    entry.selection_rules    = policy.selection_rules().size();
    entry.matching_rules     = policy.matching_rules().size();
    entry.ordering_rules     = policy.ordering_rules().size();
    entry.user_steps         = policy.user_equivalency_steps().size();
    entry.description        = policy.describe();
    entry.timestamp          = std::chrono::system_clock::now();
    return entry;
}

} // namespace

// ---------------------------------------------------------------------------
// main
//   기본값 YAML 을 로드하여 게시하고, 유효 정책 요약을 출력한다.
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {

    const std::string policy_path = env_str("POLICY_PATH", "config/equivalency.yaml");

    // LOG_LEVEL 은 설정 로드 전에 적용한다 (로더의 진단 로그 포함).
    const std::string env_level = env_str("LOG_LEVEL", "");
    if (!env_level.empty()) {
        set_global_log_level(resolve_log_level(env_level));
    }

    // ── 설정 로드 ───────────────────────────────────────────────────────
    const auto config = OptionsLoader::load(policy_path);
    if (!config) {
        std::cerr << config.error() << '\n';
        return EXIT_FAILURE;
    }

    const LogLevel    log_level =
        resolve_log_level(env_level.empty() ? config->global.log_level : env_level);
    const std::string log_path = env_str("LOG_PATH", config->global.log_path);
    set_global_log_level(log_level);

    // ── 기본 정책 게시 ──────────────────────────────────────────────────
    EquivalencyDefaults defaults{OptionsLoader::apply(*config).snapshot()};
    const auto policy = defaults.current();

    std::cout << policy->describe();

    // ── 구조화 로그 ─────────────────────────────────────────────────────
    try {
        StructuredLogger logger{log_level, log_path};
        logger.log_policy(make_policy_log(*policy, policy_path));
    } catch (const std::exception& e) {
        spdlog::error("structured logger unavailable: {}", e.what());
    }

    return EXIT_SUCCESS;
}
