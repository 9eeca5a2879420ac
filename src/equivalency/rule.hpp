#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 등가성 비교 정책을 구성하는 규칙/스텝의 능력(capability) 인터페이스.
// 구체 규칙은 각각 독립 구현체이며 깊은 상속 계층을 만들지 않는다.
//
// [규칙 종류별 평가 방식: 비교기는 반드시 준수]
// - MemberSelectionRule : 파이프라인. 앞 규칙의 출력이 다음 규칙의 입력.
// - MemberMatchingRule  : 목록 순서대로 시도, 처음으로 멤버를 찾은 규칙이 승.
// - OrderingRule        : 목록 순서대로 시도, 처음으로 kIrrelevant 가 아닌
//                         판정이 승. 없으면 순서 무관(not strict).
// - EquivalencyStep     : 목록 순서대로 시도, 처음으로 거절(decline)하지 않은
//                         스텝이 비교를 전담한다. 이후 스텝/기본 알고리즘은
//                         해당 멤버에 대해 실행되지 않는다.
//
// [순환 의존성]
// rule.hpp → common/types.hpp (단방향)
// ❌ rule.hpp → equivalency_policy.hpp 금지
// ---------------------------------------------------------------------------

#include <any>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// SelectionContext
//   선택 규칙에 전달되는 현재 노드 정보.
//   declared_members / runtime_members 는 외부 리플렉션 레이어가 채운다.
// ---------------------------------------------------------------------------
struct SelectionContext {
    std::string             path{"root"};          // 현재 노드 경로
    TypeRef                 declared_type{};
    TypeRef                 runtime_type{};
    std::vector<MemberInfo> declared_members{};    // 선언 타입 기준 후보 멤버
    std::vector<MemberInfo> runtime_members{};     // 런타임 타입 기준 후보 멤버
    bool                    use_runtime_typing{false};
};

// ---------------------------------------------------------------------------
// MatchOutcome
//   matched 가 있으면 일치 성공.
//   matched 없고 error 있으면 "일치 실패를 보고" (예: MustMatchByNameRule).
//   둘 다 없으면 "이 규칙은 찾지 못함, 조용히 통과".
// ---------------------------------------------------------------------------
struct MatchOutcome {
    std::optional<MemberInfo>      matched{};
    std::optional<ComparisonError> error{};
};

// ---------------------------------------------------------------------------
// ComparisonContext
//   비교 스텝에 전달되는 멤버 하나의 비교 상황.
//   member 가 std::nullopt 이면 루트 객체 비교이다.
// ---------------------------------------------------------------------------
struct ComparisonContext {
    std::optional<MemberInfo> member{};
    std::any                  subject{};
    std::any                  expectation{};
    std::size_t               depth{0};

    [[nodiscard]] bool is_root() const noexcept { return !member.has_value(); }
};

// ---------------------------------------------------------------------------
// StepOutcome / StepResult
// ---------------------------------------------------------------------------
enum class StepOutcome : std::uint8_t {
    kDeclined      = 0,  // 처리하지 않음 → 다음 스텝 / 기본 알고리즘
    kEquivalent    = 1,  // 처리 완료, 같음
    kNotEquivalent = 2,  // 처리 완료, 다름
};

struct StepResult {
    StepOutcome outcome{StepOutcome::kDeclined};
    std::string step{};    // 처리한 스텝의 describe() (거절 시 빈값)
    std::string reason{};  // kNotEquivalent 일 때 사유
};

// ---------------------------------------------------------------------------
// MemberSelectionRule
// ---------------------------------------------------------------------------
class MemberSelectionRule {
public:
    virtual ~MemberSelectionRule() = default;

    // 앞 규칙이 선택한 members 를 받아 걸러내거나 보강한 목록을 반환한다.
    [[nodiscard]] virtual std::vector<MemberInfo> select(
        std::vector<MemberInfo> members,
        const SelectionContext& context) const = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

// ---------------------------------------------------------------------------
// MemberMatchingRule
// ---------------------------------------------------------------------------
class MemberMatchingRule {
public:
    virtual ~MemberMatchingRule() = default;

    // expectation 멤버 하나에 대응하는 subject 멤버를 찾는다.
    [[nodiscard]] virtual MatchOutcome match(
        const MemberInfo&           expectation_member,
        std::span<const MemberInfo> subject_members) const = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

// ---------------------------------------------------------------------------
// OrderingRule
// ---------------------------------------------------------------------------
class OrderingRule {
public:
    virtual ~OrderingRule() = default;

    [[nodiscard]] virtual OrderStrictness evaluate(const MemberInfo& member) const = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

// ---------------------------------------------------------------------------
// EquivalencyStep
//   기본 재귀/동등성 비교를 멤버 하나에 대해 완전히 대체할 수 있는 오버라이드.
// ---------------------------------------------------------------------------
class EquivalencyStep {
public:
    virtual ~EquivalencyStep() = default;

    [[nodiscard]] virtual StepResult handle(const ComparisonContext& context) const = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

// ---------------------------------------------------------------------------
// AssertionRule
//   (술어, 동작) 쌍 형태의 사용자 오버라이드.
//   AssertionRuleStepAdapter 가 EquivalencyStep 으로 감싼다.
//   std::nullopt 반환 = 적용 대상 아님.
// ---------------------------------------------------------------------------
class AssertionRule {
public:
    virtual ~AssertionRule() = default;

    [[nodiscard]] virtual std::optional<StepResult> assert_equality(
        const ComparisonContext& context) const = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};
