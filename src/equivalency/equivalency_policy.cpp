// ---------------------------------------------------------------------------
// equivalency_policy.cpp
//
// 불변 정책 스냅샷의 파이프라인 평가.
//
// [평가 순서: 절대 변경 금지]
// 규칙 목록의 순서 자체가 우선순위이다. 여기서 정렬/중복 제거를 하면
// 동일한 설정이 다른 의미의 비교가 된다.
// ---------------------------------------------------------------------------

#include "equivalency/equivalency_policy.hpp"

#include <format>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

EquivalencyPolicy::EquivalencyPolicy(PolicyState state)
    : state_(std::move(state))
{}

std::vector<MemberInfo> EquivalencyPolicy::select_members(SelectionContext context) const {
    context.use_runtime_typing = state_.use_runtime_typing;

    std::vector<MemberInfo> members;
    for (const auto& rule : state_.selection_rules) {
        members = rule->select(std::move(members), context);
    }
    return members;
}

std::expected<std::optional<MemberInfo>, ComparisonError> EquivalencyPolicy::match_member(
    const MemberInfo&           expectation_member,
    std::span<const MemberInfo> subject_members) const
{
    std::optional<ComparisonError> first_error;

    for (const auto& rule : state_.matching_rules) {
        auto outcome = rule->match(expectation_member, subject_members);
        if (outcome.matched) {
            return std::move(outcome.matched);
        }
        if (outcome.error && !first_error) {
            first_error = std::move(outcome.error);
        }
    }

    if (first_error) {
        spdlog::debug("equivalency_policy: no subject member for '{}': {}",
                      expectation_member.path, first_error->message);
        return std::unexpected(std::move(*first_error));
    }
    return std::optional<MemberInfo>{};
}

bool EquivalencyPolicy::is_strict_ordering_for(const MemberInfo& member) const {
    for (const auto& rule : state_.ordering_rules) {
        const auto strictness = rule->evaluate(member);
        if (strictness != OrderStrictness::kIrrelevant) {
            return strictness == OrderStrictness::kStrict;
        }
    }
    return false;
}

StepResult EquivalencyPolicy::run_user_steps(const ComparisonContext& context) const {
    for (const auto& step : state_.user_equivalency_steps) {
        auto result = step->handle(context);
        if (result.outcome == StepOutcome::kDeclined) {
            continue;
        }
        if (result.step.empty()) {
            result.step = step->describe();
        }
        return result;
    }
    return StepResult{};
}

std::expected<void, ComparisonError> EquivalencyPolicy::check_recursion_depth(
    std::size_t depth, const std::string& path) const
{
    if (state_.allow_infinite_recursion || depth <= kMaxRecursionDepth) {
        return {};
    }
    return std::unexpected(ComparisonError{
        ComparisonErrorCode::kRecursionLimit,
        std::format("The maximum recursion depth of {} was reached.", kMaxRecursionDepth),
        path
    });
}

std::expected<void, ComparisonError> EquivalencyPolicy::on_cyclic_reference(
    const std::string& path) const
{
    if (state_.cyclic_reference_handling == CyclicReferenceHandling::kIgnore) {
        return {};
    }
    return std::unexpected(ComparisonError{
        ComparisonErrorCode::kCyclicReference,
        std::format("Expected {} to be equivalent, but it contains a cyclic reference.", path),
        path
    });
}

bool EquivalencyPolicy::enums_equivalent(const EnumValue& subject, const EnumValue& expectation) const {
    if (state_.enum_equivalency_handling == EnumEquivalencyHandling::kByName) {
        return subject.name == expectation.name;
    }
    return subject.value == expectation.value;
}

std::string EquivalencyPolicy::describe() const {
    std::ostringstream out;

    out << "- Use " << (state_.use_runtime_typing ? "runtime" : "declared")
        << " types and members\n";

    for (const auto& rule : state_.selection_rules) {
        out << "- " << rule->describe() << '\n';
    }
    for (const auto& rule : state_.matching_rules) {
        out << "- " << rule->describe() << '\n';
    }
    for (const auto& step : state_.user_equivalency_steps) {
        out << "- " << step->describe() << '\n';
    }

    return out.str();
}
