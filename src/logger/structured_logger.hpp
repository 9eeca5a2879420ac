#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

// ---------------------------------------------------------------------------
// 로그 레벨 헬퍼
//   parse_log_level       : "debug"|"info"|"warn"|"error" → LogLevel.
//                           알 수 없는 값은 std::nullopt.
//   set_global_log_level  : spdlog 기본 로거(컴포넌트 진단 로그)의 레벨 설정.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view level);

void set_global_log_level(LogLevel level);

// ---------------------------------------------------------------------------
// StructuredLogger
//   PolicyLog / StepLog / ErrorLog 를 JSON 한 줄로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   초기화 실패 시 std::runtime_error.
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // 정책 스냅샷 요약 (event: "policy_snapshot", info)
    void log_policy(const PolicyLog& entry);

    // 스텝 처리 결과 (event: "equivalency_step", debug)
    void log_step(const StepLog& entry);

    // 비교기 실패 (event: "comparison_error", warn)
    void log_error(const ErrorLog& entry);

    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

private:
    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= static_cast<int>(min_level_);
    }

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
