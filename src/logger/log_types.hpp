#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - EquivalencyPolicy, StepOutcome 을 직접 include 하지 않는다.
// - outcome_raw (uint8_t): 호출자가 static_cast<uint8_t>(StepOutcome) 로 변환
// - code_raw    (uint8_t): 호출자가 static_cast<uint8_t>(ComparisonErrorCode) 로 변환
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// PolicyLog
//   동결된 정책 스냅샷 하나의 요약.
//   description: EquivalencyPolicy::describe() 출력 (여러 줄)
// ---------------------------------------------------------------------------
struct PolicyLog {
    std::string                           source{};  // 예: 설정 파일 경로
    bool                                  is_recursive{false};
    bool                                  allow_infinite_recursion{false};
    bool                                  ignore_cyclic_references{false};
    bool                                  enums_by_name{false};
    bool                                  use_runtime_typing{false};
    bool                                  include_properties{false};
    std::size_t                           selection_rules{0};
    std::size_t                           matching_rules{0};
    std::size_t                           ordering_rules{0};
    std::size_t                           user_steps{0};
    std::string                           description{};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// StepLog
//   비교 스텝이 멤버 하나를 처리한 결과.
//   outcome_raw: StepOutcome 값을 uint8_t 로 저장
// ---------------------------------------------------------------------------
struct StepLog {
    std::string                           member_path{};
    std::string                           step{};
    std::uint8_t                          outcome_raw{0};
    std::string                           reason{};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// ErrorLog
//   비교기 실행 시점의 구분된 실패 (순환 참조, 재귀 한도, 멤버 누락).
//   code_raw: ComparisonErrorCode 값을 uint8_t 로 저장
// ---------------------------------------------------------------------------
struct ErrorLog {
    std::uint8_t                          code_raw{0};
    std::string                           path{};
    std::string                           message{};
    std::chrono::system_clock::time_point timestamp{};
};
