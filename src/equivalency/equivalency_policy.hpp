#pragma once

// ---------------------------------------------------------------------------
// equivalency_policy.hpp
//
// 비교기(comparator)가 소비하는 불변 정책 스냅샷.
// EquivalencyOptions::snapshot() 으로 생성하고
// std::shared_ptr<const EquivalencyPolicy> 로 공유한다.
//
// [스레드 안전성]
// - 생성 후 절대 변경되지 않으므로 여러 비교 실행이 동시에 읽어도 안전.
// - 규칙 객체 자체도 const 로만 보유한다.
//
// [재귀 호출]
// 비교기는 실행 1회당 이 스냅샷을 한 번 얻고, 모든 재귀 레벨에서 같은
// 스냅샷을 다시 읽는다. 깊이/순환 추적은 비교기의 몫이며 규칙 내용은
// 실행 전체에서 고정이다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "rule.hpp"

// ---------------------------------------------------------------------------
// PolicyState
//   규칙 목록 4개 + 스칼라 스위치 6개.
//   복사하면 목록은 값으로 복제된다 (규칙 객체는 불변이므로 공유).
// ---------------------------------------------------------------------------
struct PolicyState {
    std::vector<std::shared_ptr<const MemberSelectionRule>> selection_rules{};
    std::vector<std::shared_ptr<const MemberMatchingRule>>  matching_rules{};
    std::vector<std::shared_ptr<const OrderingRule>>        ordering_rules{};
    std::vector<std::shared_ptr<const EquivalencyStep>>     user_equivalency_steps{};

    bool                    is_recursive{false};
    bool                    allow_infinite_recursion{false};
    CyclicReferenceHandling cyclic_reference_handling{CyclicReferenceHandling::kThrowException};
    EnumEquivalencyHandling enum_equivalency_handling{EnumEquivalencyHandling::kByValue};
    bool                    use_runtime_typing{false};
    bool                    include_properties{false};
};

class EquivalencyPolicy {
public:
    explicit EquivalencyPolicy(PolicyState state);

    // 순서가 보장된 읽기 전용 규칙 목록
    [[nodiscard]] std::span<const std::shared_ptr<const MemberSelectionRule>> selection_rules() const noexcept {
        return state_.selection_rules;
    }
    [[nodiscard]] std::span<const std::shared_ptr<const MemberMatchingRule>> matching_rules() const noexcept {
        return state_.matching_rules;
    }
    [[nodiscard]] std::span<const std::shared_ptr<const OrderingRule>> ordering_rules() const noexcept {
        return state_.ordering_rules;
    }
    [[nodiscard]] std::span<const std::shared_ptr<const EquivalencyStep>> user_equivalency_steps() const noexcept {
        return state_.user_equivalency_steps;
    }

    [[nodiscard]] bool is_recursive() const noexcept { return state_.is_recursive; }
    [[nodiscard]] bool allow_infinite_recursion() const noexcept { return state_.allow_infinite_recursion; }
    [[nodiscard]] CyclicReferenceHandling cyclic_reference_handling() const noexcept {
        return state_.cyclic_reference_handling;
    }
    [[nodiscard]] EnumEquivalencyHandling enum_equivalency_handling() const noexcept {
        return state_.enum_equivalency_handling;
    }
    [[nodiscard]] bool use_runtime_typing() const noexcept { return state_.use_runtime_typing; }
    [[nodiscard]] bool include_properties() const noexcept { return state_.include_properties; }

    [[nodiscard]] const PolicyState& state() const noexcept { return state_; }

    // select_members
    //   선택 규칙을 파이프라인으로 실행한다. 빈 목록에서 시작하며,
    //   context.use_runtime_typing 은 정책 스위치 값으로 덮어쓴다.
    [[nodiscard]] std::vector<MemberInfo> select_members(SelectionContext context) const;

    // match_member
    //   일치 규칙을 순서대로 시도, 첫 성공이 승.
    //   아무도 찾지 못했을 때:
    //     - 실패를 보고한 규칙이 있으면 그 첫 오류 (kMissingMember)
    //     - 없으면 std::nullopt ("일치 없음", 규칙 0개일 때 포함)
    [[nodiscard]] std::expected<std::optional<MemberInfo>, ComparisonError> match_member(
        const MemberInfo&           expectation_member,
        std::span<const MemberInfo> subject_members) const;

    // is_strict_ordering_for
    //   첫 번째 kIrrelevant 가 아닌 판정. 없으면 false (순서 무관).
    [[nodiscard]] bool is_strict_ordering_for(const MemberInfo& member) const;

    // run_user_steps
    //   거절하지 않은 첫 스텝의 결과. 모두 거절하면 kDeclined
    //   (비교기는 기본 재귀/동등성 알고리즘으로 진행).
    [[nodiscard]] StepResult run_user_steps(const ComparisonContext& context) const;

    // check_recursion_depth
    //   allow_infinite_recursion 이 아니면 depth > kMaxRecursionDepth 에서 kRecursionLimit.
    [[nodiscard]] std::expected<void, ComparisonError> check_recursion_depth(
        std::size_t depth, const std::string& path) const;

    // on_cyclic_reference
    //   현재 순회 경로에 이미 있는 노드를 다시 만났을 때 비교기가 호출한다.
    //   kThrowException → kCyclicReference 오류, kIgnore → 성공 (같음으로 간주).
    [[nodiscard]] std::expected<void, ComparisonError> on_cyclic_reference(
        const std::string& path) const;

    [[nodiscard]] bool enums_equivalent(const EnumValue& subject, const EnumValue& expectation) const;

    // describe
    //   진단용 여러 줄 요약. 순서: 타입 모드 → 선택 규칙 → 일치 규칙 → 스텝.
    //   순서 규칙과 스칼라 스위치(타입 모드 제외)는 나열하지 않는다.
    [[nodiscard]] std::string describe() const;

private:
    PolicyState state_;
};
